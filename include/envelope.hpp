/*
 * PeerChat - envelope model
 *
 * Every frame on a chat stream carries one UTF-8 JSON object whose string
 * "type" field selects the envelope kind:
 *
 *   hello           {sender, protocol_version, capabilities: {v, maxFrame}}
 *   m.room.message  {sender, room_id, origin_ts, seq, event_id,
 *                    content: {msgtype, body}}
 *   m.typing        {sender, typing}
 *   m.nickname      {sender, nickname}
 *
 * Any other "type" decodes to UnknownEnvelope so that newer peers can add
 * kinds without breaking older ones. Unknown fields are ignored.
 */

#pragma once

#include "framing.hpp"
#include "transport.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace peerchat {

constexpr const char* kHelloType = "hello";
constexpr const char* kChatMessageType = "m.room.message";
constexpr const char* kTypingType = "m.typing";
constexpr const char* kNicknameType = "m.nickname";
constexpr const char* kTextMsgType = "m.text";
constexpr const char* kProtocolVersion = "length-prefixed-v1";
constexpr int kCapabilityVersion = 1;

struct Capabilities {
    int version = kCapabilityVersion;
    std::size_t max_frame_bytes = kDefaultMaxFrameBytes;

    bool operator==(const Capabilities& other) const {
        return version == other.version && max_frame_bytes == other.max_frame_bytes;
    }
};

struct Hello {
    PeerId sender;
    std::string protocol_version = kProtocolVersion;
    Capabilities capabilities;

    bool operator==(const Hello& other) const {
        return sender == other.sender && protocol_version == other.protocol_version &&
               capabilities == other.capabilities;
    }
};

struct ChatMessage {
    PeerId sender;
    std::string room_id;
    uint64_t sent_at_millis = 0;
    uint64_t seq = 0;
    std::string event_id;
    std::string msgtype = kTextMsgType;
    std::string body;

    bool operator==(const ChatMessage& other) const {
        return sender == other.sender && room_id == other.room_id && sent_at_millis == other.sent_at_millis &&
               seq == other.seq && event_id == other.event_id && msgtype == other.msgtype && body == other.body;
    }
};

struct Typing {
    PeerId sender;
    bool is_typing = false;

    bool operator==(const Typing& other) const {
        return sender == other.sender && is_typing == other.is_typing;
    }
};

struct NicknameUpdate {
    PeerId sender;
    std::string nickname;

    bool operator==(const NicknameUpdate& other) const {
        return sender == other.sender && nickname == other.nickname;
    }
};

// A kind this build does not understand. `raw` keeps the JSON text as received.
struct UnknownEnvelope {
    std::string type;
    PeerId sender;
    std::string raw;

    bool operator==(const UnknownEnvelope& other) const {
        return type == other.type && sender == other.sender && raw == other.raw;
    }
};

using Envelope = std::variant<Hello, ChatMessage, Typing, NicknameUpdate, UnknownEnvelope>;

// The wire "type" string of an envelope.
std::string envelope_type(const Envelope& envelope);

// Sender as claimed by the envelope body, empty when absent.
const PeerId& envelope_sender(const Envelope& envelope);

std::vector<uint8_t> serialize_envelope(const Envelope& envelope);

// Throws ParseError for invalid UTF-8/JSON, a non-object payload, a missing
// or non-string "type", or a known kind with missing or mistyped fields.
Envelope parse_envelope(const std::vector<uint8_t>& payload);

} // namespace peerchat
