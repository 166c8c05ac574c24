/*
 * PeerChat - transport collaborator contracts
 *
 * The chat layer never opens sockets itself. A Transport hands it ordered,
 * duplex, peer-identified byte streams, either because a remote peer opened
 * one on our protocol id or because we dialed out.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerchat {

using PeerId = std::string;

class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Blocks until some bytes arrive. Returns nullopt once the stream has
    // ended or failed; never returns an empty chunk.
    virtual std::optional<std::vector<uint8_t>> read() = 0;

    // Writes the whole buffer. Returns false when the stream is unusable.
    virtual bool write(const std::vector<uint8_t>& data) = 0;

    // Safe to call from any thread, more than once. A read blocked in
    // another thread returns nullopt.
    virtual void close() = 0;
};

using IncomingStreamHandler = std::function<void(std::unique_ptr<ByteStream> stream, const PeerId& remote_peer)>;

class Transport {
public:
    virtual ~Transport() = default;

    virtual void register_protocol_handler(const std::string& protocol_id, IncomingStreamHandler handler) = 0;

    // After this returns the handler is not running and is never called again.
    virtual void unregister_protocol_handler(const std::string& protocol_id) = 0;

    // Opens a new stream to `peer` on `protocol_id`. Throws std::runtime_error
    // (or a subclass) when no stream can be established.
    virtual std::unique_ptr<ByteStream> dial(const PeerId& peer, const std::string& protocol_id) = 0;
};

} // namespace peerchat
