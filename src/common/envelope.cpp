/*
 * PeerChat - envelope serialization
 */

#include "envelope.hpp"

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <type_traits>

namespace peerchat {

using json = nlohmann::json;

namespace {

const json& require_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw ParseError(std::string("missing field '") + key + "'");
    }
    return *it;
}

std::string require_string(const json& obj, const char* key) {
    const json& value = require_field(obj, key);
    if (!value.is_string()) {
        throw ParseError(std::string("field '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

std::string optional_string(const json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw ParseError(std::string("field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

uint64_t optional_uint(const json& obj, const char* key, uint64_t fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it->is_number_integer() && it->get<int64_t>() >= 0) {
        return static_cast<uint64_t>(it->get<int64_t>());
    }
    throw ParseError(std::string("field '") + key + "' must be a non-negative integer");
}

json capabilities_to_json(const Capabilities& caps) {
    return json{{"v", caps.version}, {"maxFrame", caps.max_frame_bytes}};
}

Capabilities capabilities_from_json(const json& obj) {
    Capabilities caps;
    auto it = obj.find("capabilities");
    if (it == obj.end() || it->is_null()) {
        return caps;
    }
    if (!it->is_object()) {
        throw ParseError("field 'capabilities' must be an object");
    }
    caps.version = static_cast<int>(optional_uint(*it, "v", static_cast<uint64_t>(caps.version)));
    caps.max_frame_bytes = static_cast<std::size_t>(optional_uint(*it, "maxFrame", caps.max_frame_bytes));
    return caps;
}

json to_json(const Envelope& envelope) {
    return std::visit(
        [](const auto& env) -> json {
            using T = std::decay_t<decltype(env)>;
            if constexpr (std::is_same_v<T, Hello>) {
                return json{{"type", kHelloType},
                            {"sender", env.sender},
                            {"protocol_version", env.protocol_version},
                            {"capabilities", capabilities_to_json(env.capabilities)}};
            } else if constexpr (std::is_same_v<T, ChatMessage>) {
                return json{{"type", kChatMessageType},
                            {"sender", env.sender},
                            {"room_id", env.room_id},
                            {"origin_ts", env.sent_at_millis},
                            {"seq", env.seq},
                            {"event_id", env.event_id},
                            {"content", {{"msgtype", env.msgtype}, {"body", env.body}}}};
            } else if constexpr (std::is_same_v<T, Typing>) {
                return json{{"type", kTypingType}, {"sender", env.sender}, {"typing", env.is_typing}};
            } else if constexpr (std::is_same_v<T, NicknameUpdate>) {
                return json{{"type", kNicknameType}, {"sender", env.sender}, {"nickname", env.nickname}};
            } else {
                json obj{{"type", env.type}};
                if (!env.sender.empty()) {
                    obj["sender"] = env.sender;
                }
                return obj;
            }
        },
        envelope);
}

Envelope from_json(const json& obj, const std::string& raw) {
    if (!obj.is_object()) {
        throw ParseError("envelope must be a JSON object");
    }
    const std::string type = require_string(obj, "type");

    if (type == kHelloType) {
        Hello hello;
        hello.sender = require_string(obj, "sender");
        hello.protocol_version = optional_string(obj, "protocol_version", kProtocolVersion);
        hello.capabilities = capabilities_from_json(obj);
        return hello;
    }
    if (type == kChatMessageType) {
        ChatMessage message;
        message.sender = require_string(obj, "sender");
        message.room_id = require_string(obj, "room_id");
        message.sent_at_millis = optional_uint(obj, "origin_ts", 0);
        message.seq = optional_uint(obj, "seq", 0);
        message.event_id = optional_string(obj, "event_id", "");
        const json& content = require_field(obj, "content");
        if (!content.is_object()) {
            throw ParseError("field 'content' must be an object");
        }
        message.msgtype = optional_string(content, "msgtype", kTextMsgType);
        message.body = require_string(content, "body");
        return message;
    }
    if (type == kTypingType) {
        Typing typing;
        typing.sender = require_string(obj, "sender");
        const json& flag = require_field(obj, "typing");
        if (!flag.is_boolean()) {
            throw ParseError("field 'typing' must be a boolean");
        }
        typing.is_typing = flag.get<bool>();
        return typing;
    }
    if (type == kNicknameType) {
        NicknameUpdate update;
        update.sender = require_string(obj, "sender");
        update.nickname = require_string(obj, "nickname");
        return update;
    }

    UnknownEnvelope unknown;
    unknown.type = type;
    auto sender_it = obj.find("sender");
    if (sender_it != obj.end() && sender_it->is_string()) {
        unknown.sender = sender_it->get<std::string>();
    }
    unknown.raw = raw;
    return unknown;
}

} // namespace

std::string envelope_type(const Envelope& envelope) {
    return std::visit(
        [](const auto& env) -> std::string {
            using T = std::decay_t<decltype(env)>;
            if constexpr (std::is_same_v<T, Hello>) {
                return kHelloType;
            } else if constexpr (std::is_same_v<T, ChatMessage>) {
                return kChatMessageType;
            } else if constexpr (std::is_same_v<T, Typing>) {
                return kTypingType;
            } else if constexpr (std::is_same_v<T, NicknameUpdate>) {
                return kNicknameType;
            } else {
                return env.type;
            }
        },
        envelope);
}

const PeerId& envelope_sender(const Envelope& envelope) {
    return std::visit([](const auto& env) -> const PeerId& { return env.sender; }, envelope);
}

std::vector<uint8_t> serialize_envelope(const Envelope& envelope) {
    // Relayed unknown kinds go back out byte for byte.
    if (const auto* unknown = std::get_if<UnknownEnvelope>(&envelope); unknown && !unknown->raw.empty()) {
        return std::vector<uint8_t>(unknown->raw.begin(), unknown->raw.end());
    }
    std::string text = to_json(envelope).dump(-1, ' ', false, json::error_handler_t::replace);
    return std::vector<uint8_t>(text.begin(), text.end());
}

Envelope parse_envelope(const std::vector<uint8_t>& payload) {
    std::string text(payload.begin(), payload.end());
    json obj;
    try {
        obj = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw ParseError(std::string("invalid JSON: ") + ex.what());
    }
    return from_json(obj, text);
}

} // namespace peerchat
