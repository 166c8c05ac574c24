/*
 * PeerChat - lifecycle events published by the chat protocol
 */

#pragma once

#include "envelope.hpp"
#include "transport.hpp"

#include <string>

namespace peerchat {

// Observer for everything the chat layer reports upward. Calls arrive from
// session pump threads and from API callers, concurrently and for several
// peers at once; implementations do their own locking. For one peer,
// on_connected always precedes the matching on_disconnected, and
// on_connected must not close that peer's session.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_connected(const PeerId& peer) {}
    virtual void on_disconnected(const PeerId& peer) {}
    virtual void on_message_received(const ChatMessage& message) {}
    virtual void on_message_sent(const ChatMessage& message) {}
    virtual void on_handshake_received(const PeerId& peer, const Capabilities& capabilities) {}
    virtual void on_nickname_changed(const PeerId& peer, const std::string& nickname) {}
    virtual void on_typing_changed(const PeerId& peer, bool typing) {}
    virtual void on_unknown_envelope(const PeerId& peer, const std::string& type) {}
};

} // namespace peerchat
