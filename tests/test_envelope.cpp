#include "envelope.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>

using namespace peerchat;

namespace {
std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

nlohmann::json json_of(const Envelope& envelope) {
    auto payload = serialize_envelope(envelope);
    return nlohmann::json::parse(payload.begin(), payload.end());
}
} // namespace

TEST(EnvelopeTest, ChatMessageRoundTrips) {
    ChatMessage message;
    message.sender = "peer-a";
    message.room_id = "0123456789abcdef";
    message.sent_at_millis = 1700000000123ULL;
    message.seq = 7;
    message.event_id = "1700000000123_deadbeef";
    message.body = "hello \xc3\xa9t\xc3\xa9";

    Envelope parsed = parse_envelope(serialize_envelope(message));
    ASSERT_TRUE(std::holds_alternative<ChatMessage>(parsed));
    EXPECT_EQ(std::get<ChatMessage>(parsed), message);
}

TEST(EnvelopeTest, ChatMessageWireShape) {
    ChatMessage message;
    message.sender = "peer-a";
    message.room_id = "public";
    message.seq = 3;
    message.body = "hi";

    auto doc = json_of(message);
    EXPECT_EQ(doc["type"], "m.room.message");
    EXPECT_EQ(doc["room_id"], "public");
    EXPECT_EQ(doc["seq"], 3);
    EXPECT_EQ(doc["content"]["msgtype"], "m.text");
    EXPECT_EQ(doc["content"]["body"], "hi");
}

TEST(EnvelopeTest, HelloCarriesCapabilities) {
    Hello hello;
    hello.sender = "peer-b";
    hello.capabilities.max_frame_bytes = 4096;

    auto doc = json_of(hello);
    EXPECT_EQ(doc["type"], "hello");
    EXPECT_EQ(doc["protocol_version"], kProtocolVersion);
    EXPECT_EQ(doc["capabilities"]["v"], kCapabilityVersion);
    EXPECT_EQ(doc["capabilities"]["maxFrame"], 4096);

    EXPECT_EQ(std::get<Hello>(parse_envelope(serialize_envelope(hello))), hello);
}

TEST(EnvelopeTest, HelloWithoutCapabilitiesUsesDefaults) {
    auto parsed = parse_envelope(bytes_of(R"({"type":"hello","sender":"x"})"));
    const auto& hello = std::get<Hello>(parsed);
    EXPECT_EQ(hello.protocol_version, kProtocolVersion);
    EXPECT_EQ(hello.capabilities.max_frame_bytes, kDefaultMaxFrameBytes);
}

TEST(EnvelopeTest, TypingAndNicknameRoundTrip) {
    Typing typing{"peer-c", true};
    EXPECT_EQ(std::get<Typing>(parse_envelope(serialize_envelope(typing))), typing);

    NicknameUpdate update{"peer-c", "Carol"};
    EXPECT_EQ(std::get<NicknameUpdate>(parse_envelope(serialize_envelope(update))), update);
}

TEST(EnvelopeTest, ExtraFieldsAreIgnored) {
    auto parsed = parse_envelope(bytes_of(
        R"({"type":"m.typing","sender":"d","typing":false,"extra":{"nested":[1,2]},"ttl":30})"));
    EXPECT_EQ(std::get<Typing>(parsed), (Typing{"d", false}));
}

TEST(EnvelopeTest, UnknownTypeIsPreserved) {
    const std::string raw = R"({"type":"m.unknown.future","sender":"e","payload":{"z":1,"a":2}})";
    auto parsed = parse_envelope(bytes_of(raw));
    ASSERT_TRUE(std::holds_alternative<UnknownEnvelope>(parsed));
    const auto& unknown = std::get<UnknownEnvelope>(parsed);
    EXPECT_EQ(unknown.type, "m.unknown.future");
    EXPECT_EQ(unknown.sender, "e");
    EXPECT_EQ(envelope_type(parsed), "m.unknown.future");

    auto reserialized = serialize_envelope(parsed);
    EXPECT_EQ(std::string(reserialized.begin(), reserialized.end()), raw);
}

TEST(EnvelopeTest, MalformedPayloadsAreParseErrors) {
    EXPECT_THROW(parse_envelope(bytes_of("not json")), ParseError);
    EXPECT_THROW(parse_envelope(bytes_of("[1,2,3]")), ParseError);
    EXPECT_THROW(parse_envelope(bytes_of(R"({"sender":"x"})")), ParseError);
    EXPECT_THROW(parse_envelope(bytes_of(R"({"type":42})")), ParseError);
    EXPECT_THROW(parse_envelope(bytes_of(R"({"type":"m.room.message","sender":"x","room_id":"r"})")),
                 ParseError);
    EXPECT_THROW(parse_envelope(bytes_of(R"({"type":"m.typing","sender":"x","typing":"yes"})")), ParseError);
    EXPECT_THROW(parse_envelope(bytes_of(R"({"type":"m.nickname","nickname":"n"})")), ParseError);
}

TEST(EnvelopeTest, SenderAccessorCoversEveryKind) {
    EXPECT_EQ(envelope_sender(Envelope{Typing{"t", true}}), "t");
    EXPECT_EQ(envelope_sender(Envelope{NicknameUpdate{"n", "x"}}), "n");
    EXPECT_EQ(envelope_sender(Envelope{UnknownEnvelope{"x.y", "", ""}}), "");
}
