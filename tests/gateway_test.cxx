#include <gtest/gtest.h>

#include "gateway/connection_registry.hpp"
#include "gateway/frame_codec.hpp"
#include "gateway/gateway.hpp"
#include "test_helpers.hpp"

using namespace testing_support;
using gateway::ConnectionState;

namespace {

class GatewayTest : public ::testing::Test {
protected:
    GatewayTest()
    {
        config_.heartbeatIntervalSeconds = 1;
        config_.maxMissedHeartbeats = 2;
        config_.authTimeoutMs = 100;
        verifier_.allow("tok-t1-alice", {"t1", "alice", "operator"});
        verifier_.allow("tok-t1-bob", {"t1", "bob", "viewer"});
        verifier_.allow("tok-t2-carol", {"t2", "carol", "viewer"});
        verifier_.allow("tok-bad-tenant", {"bad tenant", "mallory", "viewer"});
        gateway_ = std::make_unique<gateway::Gateway>(config_, registry_, verifier_, transport_, monitor_);
        gateway_->start();
    }

    ~GatewayTest() override
    {
        gateway_->stop();
    }

    // 接入并完成握手，等到连接激活
    void connect(gateway::ConnectionId id, const std::string& token, const std::string& extra = "")
    {
        gateway_->onAccept(id);
        gateway_->onData(id, handshakeFor(token) + extra);
        // 状态先于 connected 帧变为 Active，两者都要等到
        ASSERT_TRUE(waitUntil([&] {
            return gateway_->stateOf(id) == ConnectionState::Active &&
                   !transport_.framesOfType(id, "connected").empty();
        })) << "connection " << id << " never became active";
    }

    void send(gateway::ConnectionId id, const std::string& frame)
    {
        gateway_->onData(id, frame);
    }

    std::string lastErrorCode(gateway::ConnectionId id)
    {
        auto errors = transport_.framesOfType(id, "error");
        return errors.empty() ? std::string() : errors.back()["data"]["code"].get<std::string>();
    }

    core::GatewayConfig config_;
    gateway::ConnectionRegistry registry_;
    FakeVerifier verifier_;
    FakeTransport transport_;
    monitoring::HealthMonitor monitor_{"", std::chrono::seconds(1)};
    std::unique_ptr<gateway::Gateway> gateway_;
};

} // namespace

TEST_F(GatewayTest, SuccessfulHandshakeActivatesConnection)
{
    connect(1, "tok-t1-alice");

    auto connected = transport_.framesOfType(1, "connected");
    ASSERT_EQ(connected.size(), 1u);
    EXPECT_EQ(connected[0]["data"]["tenant_id"], "t1");

    auto claims = gateway_->claimsOf(1);
    ASSERT_TRUE(claims.has_value());
    EXPECT_EQ(claims->userId, "alice");
    EXPECT_EQ(claims->role, "operator");
    EXPECT_EQ(registry_.tenantConnections("t1"), (gateway::ConnectionSet{1}));
    EXPECT_EQ(gateway_->activeConnections(), 1u);
}

TEST_F(GatewayTest, HandshakeMayArriveInPieces)
{
    auto head = handshakeFor("tok-t1-alice");
    gateway_->onAccept(1);
    gateway_->onData(1, head.substr(0, 10));
    EXPECT_EQ(gateway_->stateOf(1), ConnectionState::Handshaking);
    gateway_->onData(1, head.substr(10));
    EXPECT_TRUE(waitUntil([&] { return gateway_->stateOf(1) == ConnectionState::Active; }));
}

TEST_F(GatewayTest, UnknownTokenIsRejected)
{
    gateway_->onAccept(1);
    gateway_->onData(1, handshakeFor("tok-nope"));

    ASSERT_TRUE(waitUntil([&] { return !gateway_->stateOf(1).has_value(); }));
    EXPECT_EQ(lastErrorCode(1), "AUTH_FAILED");
    EXPECT_EQ(transport_.disconnectCount(1), 1u);
    EXPECT_TRUE(transport_.framesOfType(1, "connected").empty());
    EXPECT_EQ(registry_.connectionCount(), 0u);
}

TEST_F(GatewayTest, MissingCredentialFailsWithoutCallingVerifier)
{
    gateway_->onAccept(1);
    gateway_->onData(1, "GET /stream HTTP/1.1\r\nHost: gw\r\n\r\n");

    EXPECT_FALSE(gateway_->stateOf(1).has_value());
    EXPECT_EQ(lastErrorCode(1), "AUTH_FAILED");
    EXPECT_EQ(verifier_.calls(), 0);
}

TEST_F(GatewayTest, StalledVerifierTimesOut)
{
    gateway_->onAccept(1);
    gateway_->onData(1, handshakeFor("slow-token"));

    ASSERT_TRUE(waitUntil([&] { return !gateway_->stateOf(1).has_value(); }));
    auto errors = transport_.framesOfType(1, "error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["data"]["code"], "AUTH_FAILED");
    EXPECT_EQ(errors[0]["data"]["message"], "authentication timed out");
    EXPECT_FALSE(monitor_.stateOf("auth")->healthy);
}

TEST_F(GatewayTest, StalledVerificationDoesNotDelayOtherConnections)
{
    verifier_.allow("tok-t1-dave", {"t1", "dave", "viewer"}, std::chrono::milliseconds(30));

    gateway_->onAccept(1);
    gateway_->onData(1, handshakeFor("slow-token"));
    gateway_->onAccept(2);
    gateway_->onData(2, handshakeFor("tok-t1-dave"));

    // 第二个连接在自己的截止时间内拿到结果，不用排在卡住的请求后面
    ASSERT_TRUE(waitUntil([&] {
        return gateway_->stateOf(2) == ConnectionState::Active &&
               !transport_.framesOfType(2, "connected").empty();
    }));
    EXPECT_TRUE(transport_.framesOfType(2, "error").empty());
    EXPECT_EQ(registry_.tenantConnections("t1"), (gateway::ConnectionSet{2}));

    ASSERT_TRUE(waitUntil([&] { return !gateway_->stateOf(1).has_value(); }));
    auto errors = transport_.framesOfType(1, "error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["data"]["code"], "AUTH_FAILED");
    EXPECT_EQ(errors[0]["data"]["message"], "authentication timed out");
    EXPECT_EQ(gateway_->stateOf(2), ConnectionState::Active);
    EXPECT_EQ(verifier_.calls(), 2);
}

TEST_F(GatewayTest, InvalidTenantFromVerifierIsRejected)
{
    gateway_->onAccept(1);
    gateway_->onData(1, handshakeFor("tok-bad-tenant"));

    ASSERT_TRUE(waitUntil([&] { return !gateway_->stateOf(1).has_value(); }));
    EXPECT_EQ(lastErrorCode(1), "AUTH_FAILED");
    EXPECT_EQ(registry_.connectionCount(), 0u);
}

TEST_F(GatewayTest, FramesSentWithHandshakeAreProcessedAfterActivation)
{
    connect(1, "tok-t1-alice", gateway::subscribeWellFrame("w1") + gateway::pingFrame());
    ASSERT_TRUE(waitUntil([&] { return transport_.frames(1).size() == 3u; }));

    auto frames = transport_.frames(1);
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0]["type"], "connected");
    EXPECT_EQ(frames[1]["type"], "subscribed");
    EXPECT_EQ(frames[1]["data"]["well_id"], "w1");
    EXPECT_EQ(frames[2]["type"], "pong");
    EXPECT_EQ(registry_.wellSubscribers("t1", "w1"), (gateway::ConnectionSet{1}));
}

TEST_F(GatewayTest, SubscribeAndUnsubscribeAreAcknowledged)
{
    connect(1, "tok-t1-alice");
    send(1, gateway::subscribeWellFrame("w7"));
    EXPECT_EQ(registry_.wellsOf(1), (std::set<std::string>{"w7"}));

    send(1, gateway::unsubscribeWellFrame("w7"));
    EXPECT_TRUE(registry_.wellsOf(1).empty());

    EXPECT_EQ(transport_.framesOfType(1, "subscribed").size(), 1u);
    EXPECT_EQ(transport_.framesOfType(1, "unsubscribed").size(), 1u);
}

TEST_F(GatewayTest, BadFramesGetErrorsButKeepConnectionOpen)
{
    connect(1, "tok-t1-alice");

    send(1, "this is not json\n");
    EXPECT_EQ(lastErrorCode(1), "INVALID_FRAME");

    send(1, "{\"type\":\"subscribe-well\",\"data\":{}}\n");
    EXPECT_EQ(lastErrorCode(1), "INVALID_FRAME");

    send(1, "{\"type\":\"teleport\"}\n");
    EXPECT_EQ(lastErrorCode(1), "UNKNOWN_TYPE");

    EXPECT_EQ(gateway_->stateOf(1), ConnectionState::Active);
    EXPECT_EQ(transport_.disconnectCount(1), 0u);
}

TEST_F(GatewayTest, OversizedFrameClosesConnection)
{
    connect(1, "tok-t1-alice");
    send(1, std::string(gateway::kMaxFrameBytes + 10, 'x'));

    EXPECT_FALSE(gateway_->stateOf(1).has_value());
    EXPECT_EQ(lastErrorCode(1), "INVALID_FRAME");
}

TEST_F(GatewayTest, CloseFrameEndsConnection)
{
    connect(1, "tok-t1-alice");
    send(1, gateway::closeFrame());

    EXPECT_FALSE(gateway_->stateOf(1).has_value());
    EXPECT_EQ(transport_.disconnectCount(1), 1u);
    EXPECT_TRUE(transport_.framesOfType(1, "error").empty());
    EXPECT_EQ(registry_.connectionCount(), 0u);
}

TEST_F(GatewayTest, SilentConnectionTimesOut)
{
    connect(1, "tok-t1-alice");
    connect(2, "tok-t1-bob");

    // 1 秒心跳 x 2 次 = 2 秒
    auto later = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    EXPECT_EQ(gateway_->sweepHeartbeats(later), 2u);

    EXPECT_EQ(lastErrorCode(1), "HEARTBEAT_TIMEOUT");
    EXPECT_EQ(lastErrorCode(2), "HEARTBEAT_TIMEOUT");
    EXPECT_EQ(registry_.connectionCount(), 0u);
    EXPECT_EQ(gateway_->stats().heartbeatTimeouts, 2u);
}

TEST_F(GatewayTest, RecentTrafficCountsAsHeartbeat)
{
    connect(1, "tok-t1-alice");
    send(1, gateway::pingFrame());

    EXPECT_EQ(gateway_->sweepHeartbeats(std::chrono::steady_clock::now() + std::chrono::seconds(1)), 0u);
    EXPECT_EQ(gateway_->stateOf(1), ConnectionState::Active);
}

TEST_F(GatewayTest, IncompleteHandshakeTimesOutAsAuthFailure)
{
    gateway_->onAccept(1);
    gateway_->onData(1, "GET /stream HTTP/1.1\r\n");

    EXPECT_EQ(gateway_->sweepHeartbeats(std::chrono::steady_clock::now() + std::chrono::seconds(10)), 1u);
    EXPECT_EQ(lastErrorCode(1), "AUTH_FAILED");
}

TEST_F(GatewayTest, TransportCloseIsIdempotent)
{
    connect(1, "tok-t1-alice");
    send(1, gateway::subscribeWellFrame("w1"));

    gateway_->onTransportClosed(1, "peer reset");
    gateway_->onTransportClosed(1, "peer reset");

    EXPECT_FALSE(gateway_->stateOf(1).has_value());
    EXPECT_EQ(registry_.connectionCount(), 0u);
    EXPECT_EQ(registry_.wellSubscriptionCount(), 0u);
    // 对端先断开的不再回调 disconnect
    EXPECT_EQ(transport_.disconnectCount(1), 0u);
}

TEST_F(GatewayTest, DeliveryToleratesBrokenConnection)
{
    connect(1, "tok-t1-alice");
    connect(2, "tok-t1-bob");
    connect(3, "tok-t1-bob");
    transport_.failWritesTo(2);

    auto stats = gateway_->deliver({1, 2, 3}, reading("t1", "w1"));
    EXPECT_EQ(stats.recipients, 3u);
    EXPECT_EQ(stats.delivered, 2u);
    EXPECT_EQ(stats.failed, 1u);

    EXPECT_EQ(transport_.framesOfType(1, "reading").size(), 1u);
    EXPECT_EQ(transport_.framesOfType(3, "reading").size(), 1u);
    EXPECT_FALSE(gateway_->stateOf(2).has_value());
    EXPECT_EQ(registry_.tenantConnections("t1"), (gateway::ConnectionSet{1, 3}));
}

TEST_F(GatewayTest, DeliverySkipsConnectionsNotYetActive)
{
    connect(1, "tok-t1-alice");
    gateway_->onAccept(2);

    auto stats = gateway_->deliver({1, 2, 99}, reading("t1", "w1"));
    EXPECT_EQ(stats.delivered, 1u);
    EXPECT_EQ(stats.skipped, 2u);
    EXPECT_TRUE(transport_.framesOfType(2, "reading").empty());
}

TEST_F(GatewayTest, ReadingFramePayloadMatchesReading)
{
    connect(1, "tok-t1-alice");
    gateway_->deliver({1}, reading("t1", "w4", "temperature", 88.25));

    auto frames = transport_.framesOfType(1, "reading");
    ASSERT_EQ(frames.size(), 1u);
    const auto& data = frames[0]["data"];
    EXPECT_EQ(data["tenant_id"], "t1");
    EXPECT_EQ(data["well_id"], "w4");
    EXPECT_EQ(data["tag_name"], "temperature");
    EXPECT_DOUBLE_EQ(data["value"].get<double>(), 88.25);
    EXPECT_EQ(data["timestamp"], "2024-12-31T23:59:30.000Z");
}

TEST_F(GatewayTest, StopClosesEveryConnection)
{
    connect(1, "tok-t1-alice");
    connect(2, "tok-t2-carol");

    gateway_->stop();
    EXPECT_EQ(gateway_->connectionCount(), 0u);
    EXPECT_EQ(registry_.connectionCount(), 0u);
    EXPECT_EQ(transport_.disconnectCount(1), 1u);
    EXPECT_FALSE(monitor_.stateOf("gateway")->healthy);
}
