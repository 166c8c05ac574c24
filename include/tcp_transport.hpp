/*
 * PeerChat - TCP development transport
 *
 * Stands in for a real peer-to-peer stack: peers are reached through a
 * static address book and identify themselves with a one-frame preamble
 * right after the TCP connect.
 *
 *   dialer   -> {"peer": <dialer id>, "protocol": <protocol id>}
 *   listener -> {"peer": <listener id>, "accepted": true|false}
 *
 * Identities are self-asserted; there is no authentication.
 */

#pragma once

#include "transport.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace peerchat {

class SocketStream : public ByteStream {
public:
    explicit SocketStream(int socket_fd);
    ~SocketStream() override;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    std::optional<std::vector<uint8_t>> read() override;
    bool write(const std::vector<uint8_t>& data) override;
    void close() override;

private:
    int socket_fd_;
    std::atomic<bool> closed_{false};
    std::mutex write_mutex_;
};

class TcpTransport : public Transport {
public:
    TcpTransport(PeerId self_peer, std::string bind_address, uint16_t port);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // Binds, listens and starts accepting. Throws std::runtime_error.
    void start();
    void stop();

    // The bound port; differs from the constructor's when that was 0.
    uint16_t port() const { return port_; }

    void add_peer_address(const PeerId& peer, const std::string& host, uint16_t port);

    std::vector<PeerId> known_peers() const;

    void register_protocol_handler(const std::string& protocol_id, IncomingStreamHandler handler) override;
    void unregister_protocol_handler(const std::string& protocol_id) override;
    std::unique_ptr<ByteStream> dial(const PeerId& peer, const std::string& protocol_id) override;

private:
    struct Address {
        std::string host;
        uint16_t port = 0;
    };

    // One accepted socket while its preamble is exchanged and its stream
    // handed to a protocol handler.
    struct Connection {
        int socket_fd = -1;
        // Guarded by connections_mutex_; the fd is ours to shut down only
        // while this is set.
        bool in_preamble = true;
        std::atomic<bool> finished{false};
        std::thread worker;
    };

    void accept_loop();
    void handle_connection(std::shared_ptr<Connection> connection);
    // Answers the preamble. On acceptance `handler` holds a copy of the
    // registered handler, counted in handlers_running_.
    bool negotiate(int client_fd, PeerId& remote, IncomingStreamHandler& handler);
    void handler_finished();
    void reap_connections(bool all);

    PeerId self_peer_;
    std::string bind_address_;
    uint16_t port_;
    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    mutable std::mutex address_mutex_;
    std::map<PeerId, Address> addresses_;

    std::mutex connections_mutex_;
    std::vector<std::shared_ptr<Connection>> connections_;

    // Handlers run without the lock; unregistering waits until none is running.
    std::mutex handlers_mutex_;
    std::condition_variable handlers_cv_;
    std::map<std::string, IncomingStreamHandler> handlers_;
    int handlers_running_ = 0;
};

} // namespace peerchat
