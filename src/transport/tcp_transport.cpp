/*
 * PeerChat - TCP development transport implementation
 */

#include "tcp_transport.hpp"

#include "framing.hpp"
#include "utils.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace peerchat {

using json = nlohmann::json;

namespace {
constexpr std::size_t kReadChunkSize = 4096;
constexpr std::size_t kMaxPreambleBytes = 4096;
constexpr int kPreambleTimeoutSeconds = 5;

bool send_all(int fd, const uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t written = ::send(fd, data + total, len - total, MSG_NOSIGNAL);
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(written);
    }
    return true;
}

bool recv_all(int fd, uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t read_bytes = ::recv(fd, data + total, len - total, MSG_WAITALL);
        if (read_bytes < 0 && errno == EINTR) {
            continue;
        }
        if (read_bytes <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(read_bytes);
    }
    return true;
}

void set_receive_timeout(int fd, int seconds) {
    timeval tv{};
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        log_warn("setsockopt(SO_RCVTIMEO) failed: " + std::string(std::strerror(errno)));
    }
}

bool send_preamble(int fd, const json& message) {
    std::string text = message.dump();
    auto frame = encode_frame(std::vector<uint8_t>(text.begin(), text.end()));
    return send_all(fd, frame.data(), frame.size());
}

// Reads exactly one frame so that no byte of the chat stream that follows
// is consumed here.
std::optional<json> receive_preamble(int fd) {
    uint8_t header[kFrameHeaderSize];
    if (!recv_all(fd, header, sizeof(header))) {
        return std::nullopt;
    }
    uint32_t len = 0;
    std::memcpy(&len, header, sizeof(uint32_t));
    len = ntohl(len);
    if (len == 0 || len > kMaxPreambleBytes) {
        return std::nullopt;
    }
    std::vector<uint8_t> payload(len);
    if (!recv_all(fd, payload.data(), len)) {
        return std::nullopt;
    }
    try {
        auto message = json::parse(payload.begin(), payload.end());
        if (!message.is_object()) {
            return std::nullopt;
        }
        return message;
    } catch (const json::parse_error&) {
        return std::nullopt;
    }
}

std::string string_field(const json& message, const char* key) {
    auto it = message.find(key);
    if (it == message.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}
} // namespace

SocketStream::SocketStream(int socket_fd) : socket_fd_(socket_fd) {}

SocketStream::~SocketStream() {
    close();
    ::close(socket_fd_);
}

std::optional<std::vector<uint8_t>> SocketStream::read() {
    std::vector<uint8_t> buffer(kReadChunkSize);
    while (true) {
        ssize_t read_bytes = ::recv(socket_fd_, buffer.data(), buffer.size(), 0);
        if (read_bytes < 0 && errno == EINTR) {
            continue;
        }
        if (read_bytes <= 0) {
            return std::nullopt;
        }
        buffer.resize(static_cast<std::size_t>(read_bytes));
        return buffer;
    }
}

bool SocketStream::write(const std::vector<uint8_t>& data) {
    if (closed_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    return send_all(socket_fd_, data.data(), data.size());
}

void SocketStream::close() {
    if (closed_.exchange(true)) {
        return;
    }
    // shutdown() wakes a reader blocked in recv(); the descriptor itself is
    // released in the destructor so it cannot be reused under that reader.
    ::shutdown(socket_fd_, SHUT_RDWR);
}

TcpTransport::TcpTransport(PeerId self_peer, std::string bind_address, uint16_t port)
    : self_peer_(std::move(self_peer)), bind_address_(std::move(bind_address)), port_(port) {}

TcpTransport::~TcpTransport() {
    stop();
}

void TcpTransport::start() {
    if (running_) {
        return;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error("Failed to create socket: " + std::string(std::strerror(errno)));
    }

    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (bind_address_.empty() || bind_address_ == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) <= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Invalid bind address: " + bind_address_);
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Failed to bind: " + std::string(std::strerror(errno)));
    }

    if (::listen(listen_fd_, 16) < 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Failed to listen: " + std::string(std::strerror(errno)));
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    log_info("TCP transport for " + self_peer_ + " listening on port " + std::to_string(port_));
    running_ = true;
    accept_thread_ = std::thread(&TcpTransport::accept_loop, this);
}

void TcpTransport::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    reap_connections(true);
}

void TcpTransport::add_peer_address(const PeerId& peer, const std::string& host, uint16_t port) {
    std::lock_guard<std::mutex> lock(address_mutex_);
    addresses_[peer] = Address{host, port};
}

std::vector<PeerId> TcpTransport::known_peers() const {
    std::lock_guard<std::mutex> lock(address_mutex_);
    std::vector<PeerId> peers;
    for (const auto& [peer, address] : addresses_) {
        peers.push_back(peer);
    }
    return peers;
}

void TcpTransport::register_protocol_handler(const std::string& protocol_id, IncomingStreamHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[protocol_id] = std::move(handler);
}

void TcpTransport::unregister_protocol_handler(const std::string& protocol_id) {
    std::unique_lock<std::mutex> lock(handlers_mutex_);
    handlers_.erase(protocol_id);
    handlers_cv_.wait(lock, [this] { return handlers_running_ == 0; });
}

void TcpTransport::handler_finished() {
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        --handlers_running_;
    }
    handlers_cv_.notify_all();
}

std::unique_ptr<ByteStream> TcpTransport::dial(const PeerId& peer, const std::string& protocol_id) {
    Address address;
    {
        std::lock_guard<std::mutex> lock(address_mutex_);
        auto it = addresses_.find(peer);
        if (it == addresses_.end()) {
            throw std::runtime_error("no known address for peer " + peer);
        }
        address = it->second;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("socket() failed: " + std::string(std::strerror(errno)));
    }
    // Owns fd until the preamble succeeds.
    auto stream = std::make_unique<SocketStream>(fd);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(address.port);
    if (inet_pton(AF_INET, address.host.c_str(), &addr.sin_addr) <= 0) {
        hostent* he = gethostbyname(address.host.c_str());
        if (!he || he->h_addrtype != AF_INET) {
            throw std::runtime_error("Unable to resolve host " + address.host);
        }
        std::memcpy(&addr.sin_addr, he->h_addr, he->h_length);
    }

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error("connect() to " + address.host + ":" + std::to_string(address.port) +
                                 " failed: " + std::string(std::strerror(errno)));
    }

    if (!send_preamble(fd, json{{"peer", self_peer_}, {"protocol", protocol_id}})) {
        throw std::runtime_error("failed to send preamble to " + peer);
    }
    set_receive_timeout(fd, kPreambleTimeoutSeconds);
    auto answer = receive_preamble(fd);
    set_receive_timeout(fd, 0);
    if (!answer.has_value()) {
        throw std::runtime_error("no preamble answer from " + peer);
    }

    auto accepted_it = answer->find("accepted");
    if (accepted_it == answer->end() || !accepted_it->is_boolean() || !accepted_it->get<bool>()) {
        std::string reason = string_field(*answer, "reason");
        throw std::runtime_error("peer " + peer + " refused protocol " + protocol_id +
                                 (reason.empty() ? "" : ": " + reason));
    }
    std::string remote = string_field(*answer, "peer");
    if (remote != peer) {
        throw std::runtime_error("dialed " + peer + " but reached " + (remote.empty() ? "<unnamed>" : remote));
    }

    log_debug("Dialed " + peer + " at " + address.host + ":" + std::to_string(address.port));
    return stream;
}

void TcpTransport::accept_loop() {
    while (running_) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (!running_) {
                break;
            }
            log_warn("Accept failed: " + std::string(std::strerror(errno)));
            continue;
        }

        reap_connections(false);
        auto connection = std::make_shared<Connection>();
        connection->socket_fd = client_fd;
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connection->worker = std::thread(&TcpTransport::handle_connection, this, connection);
        connections_.push_back(connection);
    }
}

void TcpTransport::reap_connections(bool all) {
    std::vector<std::shared_ptr<Connection>> to_join;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto keep = connections_.begin();
        for (auto& connection : connections_) {
            if (all || connection->finished) {
                // Aborts a preamble still waiting on a silent client.
                if (connection->in_preamble) {
                    ::shutdown(connection->socket_fd, SHUT_RDWR);
                }
                to_join.push_back(connection);
            } else {
                *keep++ = connection;
            }
        }
        connections_.erase(keep, connections_.end());
    }
    for (auto& connection : to_join) {
        if (connection->worker.joinable()) {
            connection->worker.join();
        }
    }
}

void TcpTransport::handle_connection(std::shared_ptr<Connection> connection) {
    auto stream = std::make_unique<SocketStream>(connection->socket_fd);
    PeerId remote;
    IncomingStreamHandler handler;
    bool accepted = negotiate(connection->socket_fd, remote, handler);
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connection->in_preamble = false;
    }

    if (accepted) {
        try {
            handler(std::move(stream), remote);
        } catch (const std::exception& ex) {
            log_error("Stream handler for " + remote + " failed: " + ex.what());
        }
        handler_finished();
    }
    connection->finished = true;
}

bool TcpTransport::negotiate(int client_fd, PeerId& remote, IncomingStreamHandler& handler) {
    set_receive_timeout(client_fd, kPreambleTimeoutSeconds);
    auto hello = receive_preamble(client_fd);
    set_receive_timeout(client_fd, 0);
    if (!hello.has_value()) {
        log_warn("Dropping connection without a valid preamble");
        return false;
    }

    remote = string_field(*hello, "peer");
    std::string protocol_id = string_field(*hello, "protocol");

    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(protocol_id);
        if (!remote.empty() && it != handlers_.end() && running_) {
            handler = it->second;
            ++handlers_running_;
        }
    }
    if (!handler) {
        std::string reason = remote.empty() ? "missing peer id" : "unsupported protocol " + protocol_id;
        log_warn("Rejecting connection: " + reason);
        if (!send_preamble(client_fd, json{{"peer", self_peer_}, {"accepted", false}, {"reason", reason}})) {
            log_debug("Could not deliver rejection");
        }
        return false;
    }
    if (!send_preamble(client_fd, json{{"peer", self_peer_}, {"accepted", true}})) {
        log_warn("Connection from " + remote + " dropped during preamble");
        handler_finished();
        return false;
    }
    return true;
}

} // namespace peerchat
