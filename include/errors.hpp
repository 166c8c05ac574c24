/*
 * PeerChat - protocol error types
 */

#pragma once

#include <stdexcept>
#include <string>

namespace peerchat {

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The transport could not establish a stream to the peer.
class DialFailed : public ProtocolError {
public:
    DialFailed(std::string peer, const std::string& reason)
        : ProtocolError("dial to " + peer + " failed: " + reason), peer_(std::move(peer)) {}

    const std::string& peer() const { return peer_; }

private:
    std::string peer_;
};

// Framing corruption. Everything after it on the same stream is unusable.
class DecodeError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// A well-framed payload that is not a valid envelope.
class ParseError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

class SessionInactive : public ProtocolError {
public:
    explicit SessionInactive(std::string peer)
        : ProtocolError("session with " + peer + " is not active"), peer_(std::move(peer)) {}

    const std::string& peer() const { return peer_; }

private:
    std::string peer_;
};

class SendQueueFull : public ProtocolError {
public:
    explicit SendQueueFull(std::string peer)
        : ProtocolError("send queue for " + peer + " is full"), peer_(std::move(peer)) {}

    const std::string& peer() const { return peer_; }

private:
    std::string peer_;
};

} // namespace peerchat
