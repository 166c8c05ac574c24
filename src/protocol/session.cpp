/*
 * PeerChat - chat session implementation
 */

#include "session.hpp"

#include "errors.hpp"
#include "framing.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace peerchat {

const char* to_string(SessionDirection direction) {
    switch (direction) {
        case SessionDirection::Inbound:
            return "inbound";
        case SessionDirection::Outbound:
            return "outbound";
    }
    return "unknown";
}

const char* to_string(HandshakeState state) {
    switch (state) {
        case HandshakeState::Opening:
            return "opening";
        case HandshakeState::HandshakeSent:
            return "handshake-sent";
        case HandshakeState::HelloReceived:
            return "hello-received";
        case HandshakeState::Confirmed:
            return "confirmed";
        case HandshakeState::Closed:
            return "closed";
    }
    return "unknown";
}

ChatSession::ChatSession(std::unique_ptr<ByteStream> stream,
                         PeerId peer,
                         SessionDirection direction,
                         const ProtocolConfig& config)
    : stream_(std::move(stream)),
      peer_(std::move(peer)),
      direction_(direction),
      config_(config),
      last_activity_(monotonic_millis()) {
    if (!stream_) {
        throw std::invalid_argument("ChatSession: null stream");
    }
}

ChatSession::~ChatSession() {
    if (!started_) {
        closed_ = true;
        stream_->close();
    }
    // The last reference may be dropped by one of our own pumps.
    for (std::thread* worker : {&reader_thread_, &writer_thread_}) {
        if (!worker->joinable()) {
            continue;
        }
        if (worker->get_id() == std::this_thread::get_id()) {
            worker->detach();
        } else {
            worker->join();
        }
    }
}

void ChatSession::set_envelope_handler(EnvelopeHandler handler) {
    envelope_handler_ = std::move(handler);
}

void ChatSession::set_close_handler(CloseHandler handler) {
    close_handler_ = std::move(handler);
}

void ChatSession::start() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (started_.exchange(true)) {
        return;
    }
    auto self = shared_from_this();
    reader_thread_ = std::thread([self] { self->read_loop(); });
    writer_thread_ = std::thread([self] { self->write_loop(); });
    log_debug("Session with " + peer_ + " started (" + to_string(direction_) + ")");
}

void ChatSession::send_handshake(const PeerId& self_peer) {
    Hello hello;
    hello.sender = self_peer;
    hello.protocol_version = config_.protocol_version;
    hello.capabilities.version = config_.capability_version;
    hello.capabilities.max_frame_bytes = config_.max_frame_bytes;
    send(hello);

    std::lock_guard<std::mutex> lock(state_mutex_);
    hello_sent_ = true;
}

void ChatSession::send(const Envelope& envelope) {
    if (closed_) {
        throw SessionInactive(peer_);
    }
    auto payload = serialize_envelope(envelope);
    const std::size_t limit = frame_limit(envelope);
    if (payload.size() > limit) {
        throw std::invalid_argument("envelope of " + std::to_string(payload.size()) +
                                    " bytes exceeds the frame limit of " + std::to_string(limit));
    }
    auto frame = encode_frame(payload);

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_closed_) {
            throw SessionInactive(peer_);
        }
        if (queue_.size() >= config_.send_queue_capacity) {
            throw SendQueueFull(peer_);
        }
        queue_.push_back(std::move(frame));
    }
    queue_cv_.notify_one();
}

void ChatSession::close() {
    shut_down(true);
}

void ChatSession::shut_down(bool drain) {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_closed_ = true;
    }
    queue_cv_.notify_all();

    if (drain && started_) {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        bool drained = queue_cv_.wait_for(lock, std::chrono::milliseconds(config_.close_drain_millis),
                                          [this] { return writer_done_; });
        if (!drained) {
            log_warn("Outbound pump for " + peer_ + " did not drain in time, dropping " +
                     std::to_string(queue_.size()) + " queued frame(s)");
        }
    }
    // Unblocks a reader in read() and a writer stuck in write().
    stream_->close();

    log_info("Session with " + peer_ + " closed");

    {
        // Waits out an announce() in progress.
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    }
    auto self = weak_from_this().lock();
    if (close_handler_ && self) {
        close_handler_(self);
    }

    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        close_done_ = true;
    }
    lifecycle_cv_.notify_all();
}

bool ChatSession::announce(const std::function<void()>& on_live) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (closed_) {
        return false;
    }
    announced_ = true;
    on_live();
    return true;
}

bool ChatSession::announced() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return announced_;
}

void ChatSession::wait_closed() {
    std::unique_lock<std::mutex> lock(lifecycle_mutex_);
    lifecycle_cv_.wait(lock, [this] { return close_done_; });
}

void ChatSession::join() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    for (std::thread* worker : {&reader_thread_, &writer_thread_}) {
        if (worker->joinable() && worker->get_id() != std::this_thread::get_id()) {
            worker->join();
        }
    }
}

HandshakeState ChatSession::handshake_state() const {
    if (closed_) {
        return HandshakeState::Closed;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (hello_sent_ && hello_received_) {
        return HandshakeState::Confirmed;
    }
    if (hello_sent_) {
        return HandshakeState::HandshakeSent;
    }
    if (hello_received_) {
        return HandshakeState::HelloReceived;
    }
    return HandshakeState::Opening;
}

Capabilities ChatSession::peer_capabilities() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return peer_capabilities_;
}

std::size_t ChatSession::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

std::size_t ChatSession::frame_limit(const Envelope& envelope) const {
    // Our Hello must get through whatever the peer advertised.
    if (std::holds_alternative<Hello>(envelope)) {
        return config_.max_frame_bytes;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (hello_received_ && peer_capabilities_.max_frame_bytes > 0) {
        return std::min(config_.max_frame_bytes, static_cast<std::size_t>(peer_capabilities_.max_frame_bytes));
    }
    return config_.max_frame_bytes;
}

void ChatSession::read_loop() {
    FrameReader reader(*stream_, config_.max_frame_bytes);
    try {
        while (auto payload = reader.next()) {
            if (closed_) {
                break;
            }
            touch();
            Envelope envelope;
            try {
                envelope = parse_envelope(payload.value());
            } catch (const ParseError& ex) {
                log_warn("Dropping malformed envelope from " + peer_ + ": " + ex.what());
                continue;
            }
            handle_envelope(envelope);
        }
        log_debug("Stream from " + peer_ + " ended");
    } catch (const DecodeError& ex) {
        log_warn("Framing error from " + peer_ + ", closing session: " + ex.what());
    }
    close();
}

void ChatSession::handle_envelope(const Envelope& envelope) {
    if (closed_) {
        return;
    }
    if (const auto* hello = std::get_if<Hello>(&envelope)) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (hello_received_) {
                log_debug("Ignoring repeated hello from " + peer_);
                return;
            }
            hello_received_ = true;
            peer_capabilities_ = hello->capabilities;
        }
        // The dialing side sends first; answer so both hellos cross.
        if (direction_ == SessionDirection::Inbound) {
            try {
                send_handshake(config_.self_peer);
            } catch (const std::exception& ex) {
                log_warn("Could not answer hello from " + peer_ + ": " + ex.what());
            }
        }
    }

    if (!envelope_handler_) {
        return;
    }
    try {
        envelope_handler_(shared_from_this(), envelope);
    } catch (const std::exception& ex) {
        log_error("Handler for " + envelope_type(envelope) + " from " + peer_ + " failed: " + ex.what());
    }
}

void ChatSession::write_loop() {
    bool failed = false;
    while (true) {
        std::vector<uint8_t> frame;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || queue_closed_; });
            if (queue_.empty()) {
                break;
            }
            frame = std::move(queue_.front());
            queue_.pop_front();
        }
        if (!stream_->write(frame)) {
            if (!closed_) {
                log_warn("Write to " + peer_ + " failed, closing session");
            }
            failed = true;
            break;
        }
        touch();
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        writer_done_ = true;
    }
    queue_cv_.notify_all();

    if (failed) {
        shut_down(false);
    }
}

} // namespace peerchat
