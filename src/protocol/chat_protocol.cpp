/*
 * PeerChat - chat protocol coordinator implementation
 */

#include "chat_protocol.hpp"

#include "errors.hpp"
#include "room_id.hpp"
#include "utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace peerchat {

ChatProtocol::ChatProtocol(Transport& transport, MessageStore& store, EventSink& events, ProtocolConfig config)
    : transport_(transport), store_(store), events_(events), config_(std::move(config)) {
    if (config_.self_peer.empty()) {
        throw std::invalid_argument("ChatProtocol: self peer id is required");
    }
    register_envelope_handlers();
}

ChatProtocol::~ChatProtocol() {
    if (started_) {
        transport_.unregister_protocol_handler(config_.protocol_id);
    }
    close_all();

    std::vector<std::shared_ptr<ChatSession>> to_join;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& weak : started_sessions_) {
            if (auto session = weak.lock()) {
                to_join.push_back(session);
            }
        }
        started_sessions_.clear();
    }
    for (auto& session : to_join) {
        session->join();
    }
}

void ChatProtocol::start() {
    if (started_.exchange(true)) {
        return;
    }
    log_info("Registering chat protocol handler for " + config_.protocol_id);
    transport_.register_protocol_handler(
        config_.protocol_id,
        [this](std::unique_ptr<ByteStream> stream, const PeerId& remote_peer) {
            handle_incoming_stream(std::move(stream), remote_peer);
        });
}

void ChatProtocol::register_envelope_handlers() {
    envelope_handlers_[kHelloType] = [this](const Envelope& envelope, const PeerId& peer) {
        const auto& hello = std::get<Hello>(envelope);
        log_info("Handshake from " + peer + " (" + hello.protocol_version + ", maxFrame=" +
                 std::to_string(hello.capabilities.max_frame_bytes) + ")");
        events_.on_handshake_received(peer, hello.capabilities);
    };

    envelope_handlers_[kChatMessageType] = [this](const Envelope& envelope, const PeerId& peer) {
        const auto& message = std::get<ChatMessage>(envelope);
        log_debug("Chat message " + message.event_id + " from " + peer + " in room " + message.room_id);
        store_.append_message(message.room_id, message);
        events_.on_message_received(message);
    };

    envelope_handlers_[kTypingType] = [this](const Envelope& envelope, const PeerId& peer) {
        events_.on_typing_changed(peer, std::get<Typing>(envelope).is_typing);
    };

    envelope_handlers_[kNicknameType] = [this](const Envelope& envelope, const PeerId& peer) {
        const auto& update = std::get<NicknameUpdate>(envelope);
        log_info("Peer " + peer + " is now known as " + update.nickname);
        events_.on_nickname_changed(peer, update.nickname);
    };
}

void ChatProtocol::handle_incoming_stream(std::unique_ptr<ByteStream> stream, const PeerId& remote_peer) {
    if (!stream) {
        return;
    }
    auto registration = register_session(std::move(stream), remote_peer, SessionDirection::Inbound);
    if (!registration.inserted) {
        log_warn("Duplicate session attempt from " + remote_peer + ", closed the new stream");
        return;
    }
    log_info("Incoming chat stream from " + remote_peer);
    activate_session(registration);
}

std::shared_ptr<ChatSession> ChatProtocol::open_session(const PeerId& remote_peer) {
    if (remote_peer == config_.self_peer) {
        throw std::invalid_argument("cannot open a chat session with ourselves");
    }
    if (auto existing = find_session(remote_peer)) {
        log_debug("Reusing existing session with " + remote_peer);
        return existing;
    }

    log_info("Opening chat stream to " + remote_peer + " on " + config_.protocol_id);
    std::unique_ptr<ByteStream> stream;
    try {
        stream = transport_.dial(remote_peer, config_.protocol_id);
    } catch (const std::exception& ex) {
        log_warn("Failed to open stream to " + remote_peer + ": " + ex.what());
        throw DialFailed(remote_peer, ex.what());
    }
    if (!stream) {
        throw DialFailed(remote_peer, "transport returned no stream");
    }

    auto registration = register_session(std::move(stream), remote_peer, SessionDirection::Outbound);
    if (!registration.inserted) {
        log_info("Session with " + remote_peer + " appeared while dialing, dropped the new stream");
        return registration.session;
    }
    activate_session(registration);
    return registration.session;
}

ChatProtocol::Registration ChatProtocol::register_session(std::unique_ptr<ByteStream> stream,
                                                         const PeerId& remote_peer,
                                                         SessionDirection direction) {
    Registration registration;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(remote_peer);
        if (it != sessions_.end() && it->second->is_active()) {
            registration.session = it->second;
        } else {
            if (it != sessions_.end()) {
                registration.replaced = it->second;
            }
            auto session = std::make_shared<ChatSession>(std::move(stream), remote_peer, direction, config_);
            session->set_envelope_handler(
                [this](const std::shared_ptr<ChatSession>& s, const Envelope& envelope) {
                    dispatch_envelope(s, envelope);
                });
            session->set_close_handler([this](const std::shared_ptr<ChatSession>& s) { on_session_closed(s); });

            // Queued before anyone else can reach the session, so the hello
            // is the first frame on the wire.
            try {
                session->send_handshake(config_.self_peer);
            } catch (const ProtocolError& ex) {
                log_warn("Could not queue hello for " + remote_peer + ": " + ex.what());
            }

            sessions_[remote_peer] = session;
            started_sessions_.erase(std::remove_if(started_sessions_.begin(),
                                                   started_sessions_.end(),
                                                   [](const std::weak_ptr<ChatSession>& w) { return w.expired(); }),
                                    started_sessions_.end());
            started_sessions_.push_back(session);
            registration.session = session;
            registration.inserted = true;
            return registration;
        }
    }

    stream->close();
    return registration;
}

void ChatProtocol::activate_session(const Registration& registration) {
    const auto& session = registration.session;
    // The displaced session reports its disconnect before we report ours.
    if (registration.replaced) {
        registration.replaced->wait_closed();
    }
    if (!session->announce([&] { events_.on_connected(session->peer()); })) {
        log_debug("Session with " + session->peer() + " closed before it was reported");
        return;
    }
    session->start();
}

ChatMessage ChatProtocol::send_message(const PeerId& remote_peer, const std::string& body) {
    auto session = open_session(remote_peer);
    return send_chat(session, body, derive_room_id(config_.self_peer, remote_peer));
}

ChatMessage ChatProtocol::send_chat(const std::shared_ptr<ChatSession>& session,
                                    const std::string& body,
                                    const std::string& room_id) {
    ChatMessage message;
    message.sender = config_.self_peer;
    message.room_id = room_id;
    message.sent_at_millis = wall_clock_millis();
    message.seq = session->next_seq();
    message.event_id = generate_event_id();
    message.body = body;

    session->send(message);

    store_.append_message(room_id, message);
    events_.on_message_sent(message);
    return message;
}

BroadcastResult ChatProtocol::broadcast(const std::string& body, const std::string& room_id) {
    const std::string& target_room = room_id.empty() ? config_.public_room_id : room_id;
    BroadcastResult result;
    for (const auto& session : snapshot_active()) {
        try {
            result.sent.push_back(send_chat(session, body, target_room));
        } catch (const std::exception& ex) {
            log_warn("Broadcast to " + session->peer() + " failed: " + ex.what());
            result.failures.push_back({session->peer(), ex.what()});
        }
    }
    log_debug("Broadcast to room " + target_room + ": " + std::to_string(result.sent.size()) + " sent, " +
              std::to_string(result.failures.size()) + " failed");
    return result;
}

void ChatProtocol::send_typing(const PeerId& remote_peer, bool typing) {
    auto session = open_session(remote_peer);
    session->send(Typing{config_.self_peer, typing});
}

void ChatProtocol::send_nickname(const PeerId& remote_peer, const std::string& nickname) {
    auto session = open_session(remote_peer);
    session->send(NicknameUpdate{config_.self_peer, nickname});
}

std::vector<SendFailure> ChatProtocol::broadcast_nickname(const std::string& nickname) {
    std::vector<SendFailure> failures;
    NicknameUpdate update{config_.self_peer, nickname};
    for (const auto& session : snapshot_active()) {
        try {
            session->send(update);
        } catch (const std::exception& ex) {
            log_warn("Nickname update to " + session->peer() + " failed: " + ex.what());
            failures.push_back({session->peer(), ex.what()});
        }
    }
    return failures;
}

void ChatProtocol::close_session(const PeerId& remote_peer) {
    std::shared_ptr<ChatSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(remote_peer);
        if (it == sessions_.end()) {
            return;
        }
        session = it->second;
    }
    session->close();
}

void ChatProtocol::close_all() {
    std::vector<std::shared_ptr<ChatSession>> to_close;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [peer, session] : sessions_) {
            to_close.push_back(session);
        }
    }
    for (auto& session : to_close) {
        session->close();
    }
}

std::shared_ptr<ChatSession> ChatProtocol::find_session(const PeerId& remote_peer) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(remote_peer);
    if (it == sessions_.end() || !it->second->is_active()) {
        return nullptr;
    }
    return it->second;
}

std::vector<PeerId> ChatProtocol::active_peers() const {
    std::vector<PeerId> peers;
    for (const auto& session : snapshot_active()) {
        peers.push_back(session->peer());
    }
    return peers;
}

std::size_t ChatProtocol::session_count() const {
    return snapshot_active().size();
}

void ChatProtocol::dispatch_envelope(const std::shared_ptr<ChatSession>& session, const Envelope& envelope) {
    const PeerId& peer = session->peer();
    const PeerId& claimed = envelope_sender(envelope);
    if (!claimed.empty() && claimed != peer) {
        log_warn("Envelope from " + peer + " claims sender " + claimed);
    }

    const std::string type = envelope_type(envelope);
    auto it = envelope_handlers_.find(type);
    if (it == envelope_handlers_.end()) {
        log_warn("Unknown message type " + type + " from " + peer);
        events_.on_unknown_envelope(peer, type);
        return;
    }
    it->second(envelope, peer);
}

void ChatProtocol::on_session_closed(const std::shared_ptr<ChatSession>& session) {
    const PeerId& peer = session->peer();
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(peer);
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
        }
    }
    log_info("Session closed with " + peer);
    if (session->announced()) {
        events_.on_disconnected(peer);
    }
}

std::vector<std::shared_ptr<ChatSession>> ChatProtocol::snapshot_active() const {
    std::vector<std::shared_ptr<ChatSession>> active;
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& [peer, session] : sessions_) {
        if (session->is_active()) {
            active.push_back(session);
        }
    }
    return active;
}

std::string ChatProtocol::generate_event_id() const {
    return std::to_string(wall_clock_millis()) + "_" + hex_encode(random_bytes(4));
}

} // namespace peerchat
