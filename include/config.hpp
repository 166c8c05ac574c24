/*
 * PeerChat - configuration
 */

#pragma once

#include "envelope.hpp"
#include "history_store.hpp"
#include "transport.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace peerchat {

constexpr const char* kChatProtocolId = "/chat/1.0.0";
constexpr const char* kPublicRoomId = "public";
constexpr std::size_t kDefaultSendQueueCapacity = 256;
constexpr uint64_t kDefaultCloseDrainMillis = 2000;

struct ProtocolConfig {
    PeerId self_peer;
    std::string protocol_id = kChatProtocolId;
    std::string protocol_version = kProtocolVersion;
    int capability_version = kCapabilityVersion;
    std::size_t max_frame_bytes = kDefaultMaxFrameBytes;
    std::size_t send_queue_capacity = kDefaultSendQueueCapacity;
    // How long close() lets the outbound pump flush before the stream is cut.
    uint64_t close_drain_millis = kDefaultCloseDrainMillis;
    std::string public_room_id = kPublicRoomId;
};

struct PeerAddress {
    PeerId peer;
    std::string host;
    uint16_t port = 0;
};

struct NodeConfig {
    ProtocolConfig protocol;
    std::string listen_host = "0.0.0.0";
    uint16_t listen_port = 7777;
    std::string nickname = "Anonymous";
    LogLevel log_level = LogLevel::Info;
    std::string log_file;
    std::string history_dir;
    std::size_t history_limit = kDefaultHistoryLimit;
    std::vector<PeerAddress> peers;
};

// Missing keys keep their defaults and unknown keys are ignored. A key with
// the wrong type or an out-of-range value throws std::invalid_argument.
NodeConfig node_config_from_json(const nlohmann::json& doc);

// Throws std::runtime_error when the file cannot be read or is not JSON.
NodeConfig load_node_config(const std::string& path);

// "host:port" -> (host, port). Throws std::invalid_argument.
std::pair<std::string, uint16_t> parse_host_port(const std::string& text);

} // namespace peerchat
