/*
 * PeerChat - configuration loading
 *
 * {
 *   "node":     {"peer_id": "...", "listen_host": "0.0.0.0", "listen_port": 7777, "nickname": "..."},
 *   "protocol": {"id": "/chat/1.0.0", "max_frame_bytes": 131072, "send_queue_capacity": 256,
 *                "close_drain_ms": 2000, "public_room": "public"},
 *   "logging":  {"level": "info", "file": "logs/peerchat.log"},
 *   "history":  {"dir": "history", "limit": 1000},
 *   "peers":    [{"peer": "...", "host": "127.0.0.1", "port": 7778}]
 * }
 */

#include "config.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

namespace peerchat {

using json = nlohmann::json;

namespace {

const json* section(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("config: '") + key + "' must be an object");
    }
    return &*it;
}

void read_string(const json& obj, const char* scope, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("config: '") + scope + "." + key + "' must be a string");
    }
    out = it->get<std::string>();
}

uint64_t read_uint(const json& obj, const char* scope, const char* key, uint64_t current, uint64_t max_value) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return current;
    }
    bool valid = it->is_number_unsigned() || (it->is_number_integer() && it->get<int64_t>() >= 0);
    if (!valid || it->get<uint64_t>() > max_value) {
        throw std::invalid_argument(std::string("config: '") + scope + "." + key + "' out of range");
    }
    return it->get<uint64_t>();
}

} // namespace

NodeConfig node_config_from_json(const json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("config: document must be an object");
    }
    NodeConfig config;

    if (const json* node = section(doc, "node")) {
        read_string(*node, "node", "peer_id", config.protocol.self_peer);
        read_string(*node, "node", "listen_host", config.listen_host);
        config.listen_port = static_cast<uint16_t>(
            read_uint(*node, "node", "listen_port", config.listen_port, std::numeric_limits<uint16_t>::max()));
        read_string(*node, "node", "nickname", config.nickname);
    }

    if (const json* protocol = section(doc, "protocol")) {
        read_string(*protocol, "protocol", "id", config.protocol.protocol_id);
        config.protocol.max_frame_bytes = static_cast<std::size_t>(read_uint(
            *protocol, "protocol", "max_frame_bytes", config.protocol.max_frame_bytes,
            std::numeric_limits<uint32_t>::max()));
        config.protocol.send_queue_capacity = static_cast<std::size_t>(read_uint(
            *protocol, "protocol", "send_queue_capacity", config.protocol.send_queue_capacity,
            std::numeric_limits<uint32_t>::max()));
        config.protocol.close_drain_millis = read_uint(*protocol, "protocol", "close_drain_ms",
                                                       config.protocol.close_drain_millis,
                                                       std::numeric_limits<uint32_t>::max());
        read_string(*protocol, "protocol", "public_room", config.protocol.public_room_id);
        if (config.protocol.max_frame_bytes == 0 || config.protocol.send_queue_capacity == 0) {
            throw std::invalid_argument("config: protocol limits must be positive");
        }
    }

    if (const json* logging = section(doc, "logging")) {
        std::string level_text;
        read_string(*logging, "logging", "level", level_text);
        if (!level_text.empty()) {
            auto level = parse_log_level(level_text);
            if (!level.has_value()) {
                throw std::invalid_argument("config: unknown log level '" + level_text + "'");
            }
            config.log_level = level.value();
        }
        read_string(*logging, "logging", "file", config.log_file);
    }

    if (const json* history = section(doc, "history")) {
        read_string(*history, "history", "dir", config.history_dir);
        config.history_limit = static_cast<std::size_t>(
            read_uint(*history, "history", "limit", config.history_limit, std::numeric_limits<uint32_t>::max()));
        if (config.history_limit == 0) {
            throw std::invalid_argument("config: 'history.limit' must be positive");
        }
    }

    auto peers_it = doc.find("peers");
    if (peers_it != doc.end() && !peers_it->is_null()) {
        if (!peers_it->is_array()) {
            throw std::invalid_argument("config: 'peers' must be an array");
        }
        for (const auto& entry : *peers_it) {
            if (!entry.is_object()) {
                throw std::invalid_argument("config: 'peers' entries must be objects");
            }
            PeerAddress address;
            read_string(entry, "peers[]", "peer", address.peer);
            read_string(entry, "peers[]", "host", address.host);
            address.port = static_cast<uint16_t>(
                read_uint(entry, "peers[]", "port", 0, std::numeric_limits<uint16_t>::max()));
            if (address.peer.empty() || address.host.empty() || address.port == 0) {
                throw std::invalid_argument("config: 'peers' entries need peer, host and port");
            }
            config.peers.push_back(address);
        }
    }

    return config;
}

NodeConfig load_node_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("Invalid config file " + path + ": " + ex.what());
    }
    return node_config_from_json(doc);
}

std::pair<std::string, uint16_t> parse_host_port(const std::string& text) {
    auto pos = text.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= text.size()) {
        throw std::invalid_argument("expected host:port, got '" + text + "'");
    }
    std::string host = text.substr(0, pos);
    std::string port_text = text.substr(pos + 1);
    unsigned long port = 0;
    try {
        std::size_t used = 0;
        port = std::stoul(port_text, &used);
        if (used != port_text.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid port in '" + text + "'");
    }
    if (port == 0 || port > std::numeric_limits<uint16_t>::max()) {
        throw std::invalid_argument("port out of range in '" + text + "'");
    }
    return {host, static_cast<uint16_t>(port)};
}

} // namespace peerchat
