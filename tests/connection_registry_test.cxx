#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "gateway/connection_registry.hpp"

using gateway::ConnectionRegistry;
using gateway::ConnectionSet;

TEST(ConnectionRegistryTest, TracksTenantMembership)
{
    ConnectionRegistry registry;
    EXPECT_TRUE(registry.addConnection("t1", 1));
    EXPECT_TRUE(registry.addConnection("t1", 2));
    EXPECT_TRUE(registry.addConnection("t2", 3));

    EXPECT_EQ(registry.tenantConnections("t1"), (ConnectionSet{1, 2}));
    EXPECT_EQ(registry.tenantConnections("t2"), (ConnectionSet{3}));
    EXPECT_TRUE(registry.tenantConnections("t9").empty());
    EXPECT_EQ(*registry.tenantOf(3), "t2");
    EXPECT_EQ(registry.connectionCount(), 3u);
    EXPECT_EQ(registry.tenantCount(), 2u);
}

TEST(ConnectionRegistryTest, DuplicateIdIsRejected)
{
    ConnectionRegistry registry;
    ASSERT_TRUE(registry.addConnection("t1", 7));
    EXPECT_FALSE(registry.addConnection("t2", 7));
    EXPECT_EQ(*registry.tenantOf(7), "t1");
    EXPECT_TRUE(registry.tenantConnections("t2").empty());
}

TEST(ConnectionRegistryTest, WellSubscriptionsNarrowRecipients)
{
    ConnectionRegistry registry;
    registry.addConnection("t1", 1);
    registry.addConnection("t1", 2);
    registry.addConnection("t1", 3);
    ASSERT_TRUE(registry.subscribeWell(1, "w1"));
    ASSERT_TRUE(registry.subscribeWell(2, "w1"));

    EXPECT_EQ(registry.recipientsFor("t1", "w1"), (ConnectionSet{1, 2}));
    // 没有专门订阅者的井发给整个租户
    EXPECT_EQ(registry.recipientsFor("t1", "w2"), (ConnectionSet{1, 2, 3}));
    EXPECT_TRUE(registry.recipientsFor("t2", "w1").empty());
}

TEST(ConnectionRegistryTest, WellIdsAreScopedToTenant)
{
    ConnectionRegistry registry;
    registry.addConnection("t1", 1);
    registry.addConnection("t2", 2);
    registry.subscribeWell(1, "w1");

    EXPECT_EQ(registry.wellSubscribers("t1", "w1"), (ConnectionSet{1}));
    EXPECT_TRUE(registry.wellSubscribers("t2", "w1").empty());
    EXPECT_EQ(registry.recipientsFor("t2", "w1"), (ConnectionSet{2}));
}

TEST(ConnectionRegistryTest, SubscribeRequiresRegisteredConnection)
{
    ConnectionRegistry registry;
    EXPECT_FALSE(registry.subscribeWell(42, "w1"));
    EXPECT_FALSE(registry.unsubscribeWell(42, "w1"));
    EXPECT_EQ(registry.wellSubscriptionCount(), 0u);
}

TEST(ConnectionRegistryTest, RepeatedSubscribeIsHarmless)
{
    ConnectionRegistry registry;
    registry.addConnection("t1", 1);
    EXPECT_TRUE(registry.subscribeWell(1, "w1"));
    EXPECT_TRUE(registry.subscribeWell(1, "w1"));
    EXPECT_EQ(registry.wellsOf(1), (std::set<std::string>{"w1"}));
    EXPECT_EQ(registry.wellSubscriptionCount(), 1u);
}

TEST(ConnectionRegistryTest, UnsubscribeFallsBackToTenantRouting)
{
    ConnectionRegistry registry;
    registry.addConnection("t1", 1);
    registry.addConnection("t1", 2);
    registry.subscribeWell(1, "w1");
    ASSERT_EQ(registry.recipientsFor("t1", "w1"), (ConnectionSet{1}));

    EXPECT_TRUE(registry.unsubscribeWell(1, "w1"));
    EXPECT_EQ(registry.recipientsFor("t1", "w1"), (ConnectionSet{1, 2}));
    EXPECT_EQ(registry.wellSubscriptionCount(), 0u);
}

TEST(ConnectionRegistryTest, RemoveCleansEveryIndexAndIsIdempotent)
{
    ConnectionRegistry registry;
    registry.addConnection("t1", 1);
    registry.subscribeWell(1, "w1");
    registry.subscribeWell(1, "w2");

    EXPECT_TRUE(registry.removeConnection(1));
    EXPECT_FALSE(registry.removeConnection(1));

    EXPECT_FALSE(registry.tenantOf(1).has_value());
    EXPECT_TRUE(registry.wellsOf(1).empty());
    EXPECT_TRUE(registry.wellSubscribers("t1", "w1").empty());
    EXPECT_EQ(registry.connectionCount(), 0u);
    EXPECT_EQ(registry.tenantCount(), 0u);
    EXPECT_EQ(registry.wellSubscriptionCount(), 0u);
}

TEST(ConnectionRegistryTest, ConcurrentChurnLeavesConsistentState)
{
    ConnectionRegistry registry;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 200;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t)
    {
        workers.emplace_back([&registry, t] {
            for (int i = 0; i < kPerThread; ++i)
            {
                gateway::ConnectionId id = static_cast<gateway::ConnectionId>(t * kPerThread + i + 1);
                registry.addConnection("t" + std::to_string(t % 2), id);
                registry.subscribeWell(id, "w" + std::to_string(i % 5));
                registry.recipientsFor("t0", "w1");
                if (i % 2 == 0) {
                    registry.removeConnection(id);
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(registry.connectionCount(), static_cast<std::size_t>(kThreads * kPerThread / 2));
    std::size_t total = registry.tenantConnections("t0").size() + registry.tenantConnections("t1").size();
    EXPECT_EQ(total, registry.connectionCount());
}
