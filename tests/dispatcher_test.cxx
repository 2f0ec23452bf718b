#include <gtest/gtest.h>

#include "gateway/dispatcher.hpp"
#include "test_helpers.hpp"

using namespace testing_support;
using gateway::ConnectionSet;

TEST(DispatcherTest, HandsRecipientsToDeliveryHandler)
{
    gateway::ConnectionRegistry registry;
    registry.addConnection("t1", 1);
    registry.addConnection("t1", 2);
    registry.subscribeWell(2, "w2");

    gateway::Dispatcher dispatcher(registry);
    std::vector<ConnectionSet> calls;
    dispatcher.setDeliveryHandler([&](const ConnectionSet& targets, const domain::Reading&) {
        calls.push_back(targets);
    });

    EXPECT_EQ(dispatcher.dispatch(reading("t1", "w1")), 2u);
    EXPECT_EQ(dispatcher.dispatch(reading("t1", "w2")), 1u);

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], (ConnectionSet{1, 2}));
    EXPECT_EQ(calls[1], (ConnectionSet{2}));
    EXPECT_EQ(dispatcher.dispatched(), 2u);
}

TEST(DispatcherTest, UnroutedReadingSkipsHandler)
{
    gateway::ConnectionRegistry registry;
    registry.addConnection("t1", 1);

    gateway::Dispatcher dispatcher(registry);
    int calls = 0;
    dispatcher.setDeliveryHandler([&](const ConnectionSet&, const domain::Reading&) { ++calls; });

    EXPECT_EQ(dispatcher.dispatch(reading("t2", "w1")), 0u);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(dispatcher.unrouted(), 1u);
    EXPECT_EQ(dispatcher.dispatched(), 0u);
}

TEST(DispatcherTest, RecipientsNeverCrossTenants)
{
    gateway::ConnectionRegistry registry;
    registry.addConnection("t1", 1);
    registry.addConnection("t2", 2);
    registry.subscribeWell(2, "w1");

    gateway::Dispatcher dispatcher(registry);
    EXPECT_EQ(dispatcher.recipientsFor(reading("t1", "w1")), (ConnectionSet{1}));
    EXPECT_EQ(dispatcher.recipientsFor(reading("t2", "w1")), (ConnectionSet{2}));
}
