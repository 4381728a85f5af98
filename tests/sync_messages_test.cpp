#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "net/sync_client.hpp"

using namespace Net;

TEST(SyncRole, NamesRoundTrip) {
    for (SyncRole r : { SyncRole::Off, SyncRole::Publisher, SyncRole::Subscriber, SyncRole::Peer }) {
        SyncRole parsed = SyncRole::Off;
        ASSERT_TRUE(parseSyncRole(toString(r), parsed));
        EXPECT_EQ(parsed, r);
    }
    SyncRole out = SyncRole::Peer;
    EXPECT_FALSE(parseSyncRole("leader", out));
    EXPECT_EQ(out, SyncRole::Peer);
}

TEST(SyncConfig, ReadsSection) {
    auto c = syncConfigFromJson(nlohmann::json{
        {"mode", "subscriber"}, {"host", "10.0.0.2"}, {"port", 9000},
        {"reconnect", {{"max_attempts", 3}}}
    });
    EXPECT_EQ(c.role, SyncRole::Subscriber);
    EXPECT_EQ(c.host, "10.0.0.2");
    EXPECT_EQ(c.port, 9000);
    EXPECT_EQ(c.reconnect.maxAttempts, 3);
    EXPECT_TRUE(c.reconnect.enabled);
    EXPECT_EQ(c.reconnect.baseDelayMs, 1000);
}

TEST(SyncConfig, UnknownModeMeansOff) {
    auto c = syncConfigFromJson(nlohmann::json{ {"mode", "broadcast"} });
    EXPECT_EQ(c.role, SyncRole::Off);
}

TEST(SyncWire, Url) {
    EXPECT_EQ(buildSyncUrl("127.0.0.1", 9877), "ws://127.0.0.1:9877/sync");
}

TEST(SyncWire, JoinMessage) {
    auto j = nlohmann::json::parse(buildJoinMessage(SyncRole::Peer, "slidefollow-abc"));
    EXPECT_EQ(j["type"], "sync_join");
    EXPECT_EQ(j["clientMode"], "peer");
    EXPECT_EQ(j["clientId"], "slidefollow-abc");
}

TEST(SyncWire, LiveSlideRoundTrip) {
    SyncMessage m;
    std::string err;
    ASSERT_TRUE(parseSyncMessage(buildLiveSlideMessage("v2", 1700000000000), m, &err)) << err;
    EXPECT_EQ(m.type, "sync_live_slide");
    EXPECT_EQ(m.slideId, "v2");
    EXPECT_EQ(m.timestamp, 1700000000000);
}

TEST(SyncWire, ParsesWelcomeAndError) {
    SyncMessage m;
    ASSERT_TRUE(parseSyncMessage(R"({"type":"sync_welcome"})", m));
    EXPECT_EQ(m.type, "sync_welcome");

    ASSERT_TRUE(parseSyncMessage(R"({"type":"sync_error","message":"full"})", m));
    EXPECT_EQ(m.message, "full");
}

TEST(SyncWire, RejectsMalformed) {
    SyncMessage m;
    std::string err;
    EXPECT_FALSE(parseSyncMessage("{", m, &err));
    EXPECT_FALSE(parseSyncMessage(R"({"slideId":"x"})", m, &err));
    EXPECT_FALSE(parseSyncMessage(R"({"type":"sync_live_slide"})", m, &err));
    EXPECT_NE(err.find("slideId"), std::string::npos);
}

TEST(SyncClient, RefusesToConnectWhenOff) {
    SyncConfig c;
    c.role = SyncRole::Off;
    SyncClient client(c);

    std::string err;
    EXPECT_FALSE(client.connect(&err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(client.isConnected());
    EXPECT_EQ(client.config().clientId.rfind("slidefollow-", 0), 0u);
}

TEST(SyncClient, PublishIgnoredWhileDisconnected) {
    SyncConfig c;
    c.role = SyncRole::Publisher;
    SyncClient client(c);
    EXPECT_FALSE(client.publishLiveSlide("v1"));
}
