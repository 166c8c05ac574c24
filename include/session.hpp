/*
 * PeerChat - one chat session per remote peer
 *
 * A session owns its stream and runs two threads over it: the inbound pump
 * reads frames, parses envelopes and hands them to the envelope handler; the
 * outbound pump drains a bounded queue of encoded frames into the stream.
 * Closing ends the queue and gives the outbound pump close_drain_millis to
 * write what is left. The stream is then closed whatever the pump is doing,
 * which ends both pumps.
 */

#pragma once

#include "config.hpp"
#include "envelope.hpp"
#include "transport.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace peerchat {

enum class SessionDirection {
    Inbound,
    Outbound
};

enum class HandshakeState {
    Opening,
    HandshakeSent,
    HelloReceived,
    Confirmed,
    Closed
};

const char* to_string(SessionDirection direction);

const char* to_string(HandshakeState state);

class ChatSession : public std::enable_shared_from_this<ChatSession> {
public:
    using EnvelopeHandler = std::function<void(const std::shared_ptr<ChatSession>&, const Envelope&)>;
    using CloseHandler = std::function<void(const std::shared_ptr<ChatSession>&)>;

    // Must be owned by a std::shared_ptr before start().
    ChatSession(std::unique_ptr<ByteStream> stream,
                PeerId peer,
                SessionDirection direction,
                const ProtocolConfig& config);
    ~ChatSession();

    ChatSession(const ChatSession&) = delete;
    ChatSession& operator=(const ChatSession&) = delete;

    // Handlers are installed before start() and never change afterwards.
    void set_envelope_handler(EnvelopeHandler handler);
    void set_close_handler(CloseHandler handler);

    // Starts both pumps.
    void start();

    // Queues a Hello from `self_peer` advertising our capabilities.
    void send_handshake(const PeerId& self_peer);

    // Queues an envelope without waiting for the network. Throws
    // SessionInactive once closed, SendQueueFull at capacity and
    // std::invalid_argument when it would not fit in one frame. Once the
    // peer's Hello has arrived, its smaller maxFrame also applies.
    void send(const Envelope& envelope);

    // Idempotent. Only the first call runs the close handler, after any
    // announce() in progress has returned.
    void close();

    // Runs `on_live` unless the session is already closed and returns whether
    // it ran. `on_live` must not close this session.
    bool announce(const std::function<void()>& on_live);
    bool announced() const;

    // Blocks until a close() that has begun has finished, close handler included.
    void wait_closed();

    // Waits for both pumps to finish. Skips the calling thread's own pump.
    void join();

    bool is_active() const { return !closed_; }
    const PeerId& peer() const { return peer_; }
    SessionDirection direction() const { return direction_; }
    HandshakeState handshake_state() const;
    Capabilities peer_capabilities() const;
    uint64_t last_activity_millis() const { return last_activity_; }
    std::size_t queued() const;

    // Sequence number for the next outbound chat message, starting at 0.
    uint64_t next_seq() { return next_seq_++; }

private:
    void shut_down(bool drain);
    void read_loop();
    void write_loop();
    std::size_t frame_limit(const Envelope& envelope) const;
    void handle_envelope(const Envelope& envelope);
    void touch() { last_activity_ = monotonic_millis(); }

    std::unique_ptr<ByteStream> stream_;
    const PeerId peer_;
    const SessionDirection direction_;
    const ProtocolConfig config_;

    EnvelopeHandler envelope_handler_;
    CloseHandler close_handler_;

    std::atomic<bool> started_{false};
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> next_seq_{0};
    std::atomic<uint64_t> last_activity_{0};

    mutable std::mutex state_mutex_;
    bool hello_sent_ = false;
    bool hello_received_ = false;
    Capabilities peer_capabilities_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::vector<uint8_t>> queue_;
    bool queue_closed_ = false;
    bool writer_done_ = false;

    mutable std::mutex lifecycle_mutex_;
    std::condition_variable lifecycle_cv_;
    bool announced_ = false;
    bool close_done_ = false;

    std::mutex thread_mutex_;
    std::thread reader_thread_;
    std::thread writer_thread_;
};

} // namespace peerchat
