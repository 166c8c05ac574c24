#include "chat_protocol.hpp"
#include "errors.hpp"
#include "room_id.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace peerchat;
using peerchat::test::FakeTransport;
using peerchat::test::RecordingSink;
using peerchat::test::RemoteEnd;
using peerchat::test::wait_until;

namespace {
constexpr const char* kSelf = "peer-a";
}

class ChatProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        ProtocolConfig config;
        config.self_peer = kSelf;
        protocol = std::make_unique<ChatProtocol>(transport, store, sink, config);
        protocol->start();
    }

    void TearDown() override { protocol.reset(); }

    std::shared_ptr<RemoteEnd> inbound(const PeerId& peer) { return transport.deliver(peer, kChatProtocolId); }

    void restart_with(ProtocolConfig config) {
        protocol.reset();
        config.self_peer = kSelf;
        protocol = std::make_unique<ChatProtocol>(transport, store, sink, config);
        protocol->start();
    }

    FakeTransport transport;
    HistoryStore store;
    RecordingSink sink;
    std::unique_ptr<ChatProtocol> protocol;
};

TEST_F(ChatProtocolTest, StartRegistersHandlerAndShutdownRemovesIt) {
    EXPECT_TRUE(transport.has_handler(kChatProtocolId));
    protocol.reset();
    EXPECT_FALSE(transport.has_handler(kChatProtocolId));
}

TEST_F(ChatProtocolTest, OpenSessionDialsOnceAndSendsHello) {
    auto session = protocol->open_session("peer-b");
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(transport.dial_count("peer-b"), 1);
    EXPECT_EQ(transport.last_protocol(), kChatProtocolId);
    EXPECT_EQ(session->direction(), SessionDirection::Outbound);

    auto first = transport.remote("peer-b")->next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(std::holds_alternative<Hello>(*first));
    EXPECT_EQ(std::get<Hello>(*first).sender, kSelf);

    auto again = protocol->open_session("peer-b");
    EXPECT_EQ(again, session);
    EXPECT_EQ(transport.dial_count("peer-b"), 1);
    EXPECT_EQ(sink.count("connected:peer-b"), 1u);
}

TEST_F(ChatProtocolTest, DialFailureLeavesPeerUnregistered) {
    transport.fail_dials("peer-b", 1);
    try {
        protocol->open_session("peer-b");
        FAIL() << "expected DialFailed";
    } catch (const DialFailed& ex) {
        EXPECT_EQ(ex.peer(), "peer-b");
        EXPECT_NE(std::string(ex.what()).find("connection refused"), std::string::npos);
    }
    EXPECT_EQ(protocol->session_count(), 0u);
    EXPECT_EQ(protocol->find_session("peer-b"), nullptr);
    EXPECT_TRUE(sink.events().empty());

    EXPECT_NE(protocol->open_session("peer-b"), nullptr);
    EXPECT_EQ(transport.dial_count("peer-b"), 2);
}

TEST_F(ChatProtocolTest, SendMessagePropagatesDialFailure) {
    transport.fail_dials("peer-b", 1);
    EXPECT_THROW(protocol->send_message("peer-b", "hi"), DialFailed);
    EXPECT_TRUE(store.room_ids().empty());
    EXPECT_TRUE(sink.sent().empty());
}

TEST_F(ChatProtocolTest, OpeningSessionWithSelfIsRejected) {
    EXPECT_THROW(protocol->open_session(kSelf), std::invalid_argument);
    EXPECT_EQ(transport.dial_count(kSelf), 0);
}

TEST_F(ChatProtocolTest, DuplicateInboundStreamIsClosed) {
    auto first = inbound("peer-c");
    auto second = inbound("peer-c");

    EXPECT_EQ(protocol->session_count(), 1u);
    EXPECT_FALSE(second->next().has_value());

    auto hello = first->next();
    ASSERT_TRUE(hello.has_value());
    EXPECT_TRUE(std::holds_alternative<Hello>(*hello));

    ChatMessage message;
    message.sender = "peer-c";
    message.room_id = derive_room_id(kSelf, "peer-c");
    message.body = "still here";
    first->send(message);
    ASSERT_TRUE(wait_until([&] { return sink.received().size() == 1; }));
    EXPECT_EQ(sink.received()[0].body, "still here");

    EXPECT_EQ(sink.count("connected:peer-c"), 1u);
    EXPECT_EQ(sink.count("disconnected:peer-c"), 0u);
    EXPECT_EQ(protocol->find_session("peer-c")->direction(), SessionDirection::Inbound);
}

TEST_F(ChatProtocolTest, InboundStreamDuringDialWins) {
    std::shared_ptr<RemoteEnd> racing;
    transport.on_next_dial([&] { racing = inbound("peer-e"); });

    auto session = protocol->open_session("peer-e");
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->direction(), SessionDirection::Inbound);
    EXPECT_EQ(protocol->find_session("peer-e"), session);
    EXPECT_EQ(protocol->session_count(), 1u);

    EXPECT_FALSE(transport.remote("peer-e")->next().has_value());
    ASSERT_NE(racing, nullptr);
    auto hello = racing->next();
    ASSERT_TRUE(hello.has_value());
    EXPECT_TRUE(std::holds_alternative<Hello>(*hello));
    EXPECT_EQ(sink.count("connected:peer-e"), 1u);
}

TEST_F(ChatProtocolTest, RacingStreamsRegisterOneSession) {
    std::vector<std::shared_ptr<RemoteEnd>> remotes(8);
    std::vector<std::thread> racers;
    for (std::size_t i = 0; i < remotes.size(); ++i) {
        racers.emplace_back([&, i] { remotes[i] = inbound("peer-r"); });
    }
    racers.emplace_back([&] { protocol->open_session("peer-r"); });
    for (auto& racer : racers) {
        racer.join();
    }

    EXPECT_EQ(protocol->session_count(), 1u);
    EXPECT_EQ(protocol->active_peers(), std::vector<PeerId>{"peer-r"});
    EXPECT_EQ(sink.count("connected:peer-r"), 1u);
    EXPECT_EQ(sink.count("disconnected:peer-r"), 0u);
}

TEST_F(ChatProtocolTest, SendMessageUsesDirectRoomAndSequence) {
    auto first = protocol->send_message("peer-d", "hi");
    auto second = protocol->send_message("peer-d", "again");

    const std::string room = derive_room_id(kSelf, "peer-d");
    EXPECT_EQ(first.room_id, room);
    EXPECT_EQ(first.sender, kSelf);
    EXPECT_EQ(first.seq, 0u);
    EXPECT_EQ(second.seq, 1u);
    EXPECT_FALSE(first.event_id.empty());
    EXPECT_NE(first.event_id, second.event_id);
    EXPECT_GT(first.sent_at_millis, 0u);

    auto wire = transport.remote("peer-d")->next_chat();
    ASSERT_TRUE(wire.has_value());
    EXPECT_EQ(*wire, first);

    auto stored = store.history(room);
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[0].message, first);
    EXPECT_EQ(sink.sent().size(), 2u);
}

TEST_F(ChatProtocolTest, BroadcastReachesEveryActiveSession) {
    protocol->send_message("peer-d", "hi");
    protocol->open_session("peer-b");
    protocol->open_session("peer-c");

    auto result = protocol->broadcast("yo", kPublicRoomId);
    EXPECT_EQ(result.sent.size(), 3u);
    EXPECT_TRUE(result.failures.empty());

    for (const char* peer : {"peer-b", "peer-c"}) {
        auto message = transport.remote(peer)->next_chat();
        ASSERT_TRUE(message.has_value()) << peer;
        EXPECT_EQ(message->body, "yo");
        EXPECT_EQ(message->room_id, kPublicRoomId);
    }
    auto to_d = transport.remote("peer-d");
    EXPECT_EQ(to_d->next_chat()->body, "hi");
    EXPECT_EQ(to_d->next_chat()->body, "yo");

    EXPECT_EQ(store.history(kPublicRoomId).size(), 3u);
}

TEST_F(ChatProtocolTest, BroadcastReportsTheOnePeerThatCannotTakeIt) {
    ProtocolConfig config;
    config.send_queue_capacity = 2;
    config.close_drain_millis = 50;
    restart_with(config);

    transport.stall_dials("peer-d");
    protocol->open_session("peer-b");
    protocol->open_session("peer-c");
    protocol->open_session("peer-d");
    auto* stalled = transport.stalled("peer-d");
    ASSERT_NE(stalled, nullptr);
    // The hello is stuck in write(); two more frames fill the queue.
    ASSERT_TRUE(wait_until([&] { return stalled->writing(); }));
    protocol->send_typing("peer-d", true);
    protocol->send_typing("peer-d", false);

    auto result = protocol->broadcast("yo", kPublicRoomId);
    ASSERT_EQ(result.sent.size(), 2u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].peer, "peer-d");

    for (const char* peer : {"peer-b", "peer-c"}) {
        auto message = transport.remote(peer)->next_chat();
        ASSERT_TRUE(message.has_value()) << peer;
        EXPECT_EQ(message->body, "yo");
    }
    EXPECT_EQ(store.history(kPublicRoomId).size(), 2u);
    EXPECT_EQ(protocol->session_count(), 3u);
}

TEST_F(ChatProtocolTest, ShutdownDoesNotHangOnStalledPeer) {
    ProtocolConfig config;
    config.close_drain_millis = 50;
    restart_with(config);
    transport.stall_dials("peer-d");
    protocol->send_message("peer-d", "hello?");
    auto* stalled = transport.stalled("peer-d");
    ASSERT_NE(stalled, nullptr);
    ASSERT_TRUE(wait_until([&] { return stalled->writing(); }));

    protocol->close_session("peer-d");
    EXPECT_TRUE(stalled->closed());
    EXPECT_EQ(sink.count("disconnected:peer-d"), 1u);
    protocol.reset();
}

TEST_F(ChatProtocolTest, ConnectAndDisconnectEventsStayPaired) {
    std::atomic<bool> done{false};
    std::thread closer([&] {
        while (!done) {
            protocol->close_session("peer-x");
            std::this_thread::yield();
        }
    });
    for (int i = 0; i < 50; ++i) {
        // Dropping the far end ends the stream as well.
        inbound("peer-x");
    }
    done = true;
    closer.join();
    protocol->close_session("peer-x");

    ASSERT_TRUE(wait_until([&] {
        return sink.count("connected:peer-x") == sink.count("disconnected:peer-x") && protocol->session_count() == 0;
    }));
    int live = 0;
    for (const auto& event : sink.events()) {
        if (event == "connected:peer-x") {
            ++live;
        } else if (event == "disconnected:peer-x") {
            --live;
        }
        EXPECT_GE(live, 0);
        EXPECT_LE(live, 1);
    }
}

TEST_F(ChatProtocolTest, BroadcastDefaultsToPublicRoom) {
    protocol->open_session("peer-b");
    auto result = protocol->broadcast("everyone", "");
    ASSERT_EQ(result.sent.size(), 1u);
    EXPECT_EQ(result.sent[0].room_id, kPublicRoomId);
}

TEST_F(ChatProtocolTest, BroadcastWithoutSessionsSendsNothing) {
    auto result = protocol->broadcast("anyone?", kPublicRoomId);
    EXPECT_TRUE(result.sent.empty());
    EXPECT_TRUE(result.failures.empty());
    EXPECT_EQ(transport.dial_count("peer-b"), 0);
}

TEST_F(ChatProtocolTest, ReceivedMessageIsStoredAndEmitted) {
    auto remote = inbound("peer-g");
    ChatMessage message;
    message.sender = "peer-g";
    message.room_id = derive_room_id("peer-g", kSelf);
    message.seq = 4;
    message.event_id = "1_abcd";
    message.body = "hello a";
    remote->send(message);

    ASSERT_TRUE(wait_until([&] { return sink.received().size() == 1; }));
    EXPECT_EQ(sink.received()[0], message);
    auto stored = store.history(derive_room_id(kSelf, "peer-g"));
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].message.body, "hello a");
}

TEST_F(ChatProtocolTest, HandshakeIsReportedAndAnswered) {
    auto remote = inbound("peer-h");
    Hello hello;
    hello.sender = "peer-h";
    hello.capabilities.max_frame_bytes = 4096;
    remote->send(hello);

    ASSERT_TRUE(wait_until([&] { return sink.count("handshake:peer-h:4096") == 1; }));
    EXPECT_TRUE(std::holds_alternative<Hello>(*remote->next()));
    EXPECT_TRUE(std::holds_alternative<Hello>(*remote->next()));
    ASSERT_TRUE(wait_until(
        [&] { return protocol->find_session("peer-h")->handshake_state() == HandshakeState::Confirmed; }));
}

TEST_F(ChatProtocolTest, UnknownEnvelopeKeepsSessionOpen) {
    auto remote = inbound("peer-f");
    remote->send_raw(R"({"type":"m.unknown.future","sender":"peer-f","data":[1,2,3]})");
    ASSERT_TRUE(wait_until([&] { return sink.count("unknown:peer-f:m.unknown.future") == 1; }));

    remote->send(Typing{"peer-f", true});
    ASSERT_TRUE(wait_until([&] { return sink.count("typing:peer-f:on") == 1; }));
    EXPECT_NE(protocol->find_session("peer-f"), nullptr);
    EXPECT_EQ(sink.count("disconnected:peer-f"), 0u);
}

TEST_F(ChatProtocolTest, TypingAndNicknameFlowBothWays) {
    auto remote = inbound("peer-i");
    remote->send(NicknameUpdate{"peer-i", "Ivy"});
    remote->send(Typing{"peer-i", false});
    ASSERT_TRUE(wait_until([&] { return sink.count("typing:peer-i:off") == 1; }));
    EXPECT_EQ(sink.count("nickname:peer-i:Ivy"), 1u);

    protocol->send_typing("peer-i", true);
    protocol->send_nickname("peer-i", "Ann");
    EXPECT_TRUE(std::holds_alternative<Hello>(*remote->next()));
    EXPECT_EQ(std::get<Typing>(*remote->next()), (Typing{kSelf, true}));
    EXPECT_EQ(std::get<NicknameUpdate>(*remote->next()), (NicknameUpdate{kSelf, "Ann"}));
}

TEST_F(ChatProtocolTest, BroadcastNicknameReachesEveryone) {
    protocol->open_session("peer-b");
    protocol->open_session("peer-c");
    auto failures = protocol->broadcast_nickname("Ann");
    EXPECT_TRUE(failures.empty());
    for (const char* peer : {"peer-b", "peer-c"}) {
        auto remote = transport.remote(peer);
        EXPECT_TRUE(std::holds_alternative<Hello>(*remote->next()));
        EXPECT_EQ(std::get<NicknameUpdate>(*remote->next()).nickname, "Ann");
    }
}

TEST_F(ChatProtocolTest, MismatchedSenderIsStillDelivered) {
    auto remote = inbound("peer-j");
    remote->send(Typing{"somebody-else", true});
    ASSERT_TRUE(wait_until([&] { return sink.count("typing:peer-j:on") == 1; }));
}

TEST_F(ChatProtocolTest, ClosingTwiceEmitsOneDisconnect) {
    protocol->open_session("peer-b");
    protocol->close_session("peer-b");
    protocol->close_session("peer-b");

    ASSERT_TRUE(wait_until([&] { return sink.count("disconnected:peer-b") == 1; }));
    EXPECT_EQ(protocol->session_count(), 0u);
    EXPECT_FALSE(transport.remote("peer-b")->next_chat().has_value());

    protocol->open_session("peer-b");
    EXPECT_EQ(transport.dial_count("peer-b"), 2);
    EXPECT_EQ(sink.count("disconnected:peer-b"), 1u);
}

TEST_F(ChatProtocolTest, ConcurrentCloseEmitsOneDisconnect) {
    auto session = protocol->open_session("peer-b");
    std::vector<std::thread> closers;
    for (int i = 0; i < 4; ++i) {
        closers.emplace_back([&] { protocol->close_session("peer-b"); });
        closers.emplace_back([&] { session->close(); });
    }
    transport.remote("peer-b")->close();
    for (auto& closer : closers) {
        closer.join();
    }
    session->join();
    EXPECT_EQ(sink.count("disconnected:peer-b"), 1u);
    EXPECT_THROW(session->send(Typing{kSelf, true}), SessionInactive);
}

TEST_F(ChatProtocolTest, RemoteHangupRemovesSession) {
    auto remote = inbound("peer-k");
    remote->close();
    ASSERT_TRUE(wait_until([&] { return sink.count("disconnected:peer-k") == 1; }));
    EXPECT_EQ(protocol->find_session("peer-k"), nullptr);
    EXPECT_TRUE(protocol->active_peers().empty());
}

TEST_F(ChatProtocolTest, CloseAllDisconnectsEveryone) {
    protocol->open_session("peer-b");
    auto remote_c = inbound("peer-c");
    protocol->close_all();
    ASSERT_TRUE(wait_until([&] {
        return sink.count("disconnected:peer-b") == 1 && sink.count("disconnected:peer-c") == 1;
    }));
    EXPECT_EQ(protocol->session_count(), 0u);
}

TEST(ChatProtocolConfigTest, SelfPeerIsRequired) {
    FakeTransport transport;
    HistoryStore store;
    RecordingSink sink;
    EXPECT_THROW(std::make_unique<ChatProtocol>(transport, store, sink, ProtocolConfig{}), std::invalid_argument);
}
