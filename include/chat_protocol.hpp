/*
 * PeerChat - chat protocol coordinator
 *
 * Owns the peer -> session registry and is the only entry point the rest of
 * the application uses. At most one session is registered per peer: a
 * second stream for a peer that already has one is closed on arrival, and an
 * outbound dial that loses a race to an inbound stream gives way to it.
 */

#pragma once

#include "config.hpp"
#include "envelope.hpp"
#include "events.hpp"
#include "history_store.hpp"
#include "session.hpp"
#include "transport.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace peerchat {

struct SendFailure {
    PeerId peer;
    std::string reason;
};

struct BroadcastResult {
    std::vector<ChatMessage> sent;
    std::vector<SendFailure> failures;
};

class ChatProtocol {
public:
    ChatProtocol(Transport& transport, MessageStore& store, EventSink& events, ProtocolConfig config);
    ~ChatProtocol();

    ChatProtocol(const ChatProtocol&) = delete;
    ChatProtocol& operator=(const ChatProtocol&) = delete;

    // Registers the inbound stream handler with the transport.
    void start();

    void handle_incoming_stream(std::unique_ptr<ByteStream> stream, const PeerId& remote_peer);

    // Returns the live session for `remote_peer`, dialing one if needed.
    // Throws DialFailed; the peer stays unregistered so callers may retry.
    std::shared_ptr<ChatSession> open_session(const PeerId& remote_peer);

    // Sends `body` in the direct room shared with `remote_peer`, records it
    // in the store and returns the envelope that went out.
    ChatMessage send_message(const PeerId& remote_peer, const std::string& body);

    // One message per active session, all in `room_id`. Per-peer failures
    // are collected, never thrown.
    BroadcastResult broadcast(const std::string& body, const std::string& room_id);

    void send_typing(const PeerId& remote_peer, bool typing);

    void send_nickname(const PeerId& remote_peer, const std::string& nickname);

    // Best effort, to every active session.
    std::vector<SendFailure> broadcast_nickname(const std::string& nickname);

    void close_session(const PeerId& remote_peer);

    void close_all();

    std::shared_ptr<ChatSession> find_session(const PeerId& remote_peer) const;

    std::vector<PeerId> active_peers() const;

    std::size_t session_count() const;

    const ProtocolConfig& config() const { return config_; }

private:
    using EnvelopeHandler = std::function<void(const Envelope&, const PeerId&)>;

    void register_envelope_handlers();

    struct Registration {
        std::shared_ptr<ChatSession> session;
        bool inserted = false;
        // A closing session for the same peer that `session` displaced.
        std::shared_ptr<ChatSession> replaced;
    };

    // Creates the session object, wires its callbacks and inserts it unless
    // the peer already has a live one. Otherwise closes `stream` and returns
    // the live session with `inserted` false.
    Registration register_session(std::unique_ptr<ByteStream> stream,
                                  const PeerId& remote_peer,
                                  SessionDirection direction);

    // Reports the session as connected once `replaced` has finished closing,
    // then starts its pumps.
    void activate_session(const Registration& registration);

    ChatMessage send_chat(const std::shared_ptr<ChatSession>& session,
                          const std::string& body,
                          const std::string& room_id);

    void dispatch_envelope(const std::shared_ptr<ChatSession>& session, const Envelope& envelope);

    void on_session_closed(const std::shared_ptr<ChatSession>& session);

    std::vector<std::shared_ptr<ChatSession>> snapshot_active() const;

    std::string generate_event_id() const;

    Transport& transport_;
    MessageStore& store_;
    EventSink& events_;
    const ProtocolConfig config_;

    std::map<std::string, EnvelopeHandler> envelope_handlers_;
    std::atomic<bool> started_{false};

    mutable std::mutex sessions_mutex_;
    std::map<PeerId, std::shared_ptr<ChatSession>> sessions_;
    // Every session ever started, so shutdown can wait for its pumps.
    std::vector<std::weak_ptr<ChatSession>> started_sessions_;
};

} // namespace peerchat
