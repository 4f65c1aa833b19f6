#include "umelink/connector/broadcast_channel.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

using namespace umelink;

TEST(BroadcastChannelTest, EverySubscriberGetsEachItem)
{
    BroadcastChannel<std::string> channel;
    auto first  = channel.subscribe();
    auto second = channel.subscribe();

    EXPECT_EQ(channel.publish("hello"), 2U);

    EXPECT_EQ(first->try_receive(), std::optional<std::string>("hello"));
    EXPECT_EQ(second->try_receive(), std::optional<std::string>("hello"));
    EXPECT_FALSE(first->try_receive().has_value());
}

TEST(BroadcastChannelTest, NoReplayForLateSubscribers)
{
    BroadcastChannel<std::string> channel;
    EXPECT_EQ(channel.publish("early"), 0U);

    auto late = channel.subscribe();
    EXPECT_FALSE(late->try_receive().has_value());

    channel.publish("later");
    EXPECT_EQ(late->try_receive(), std::optional<std::string>("later"));
}

TEST(BroadcastChannelTest, FullBufferDropsOldest)
{
    BroadcastChannel<int> channel;
    auto subscriber = channel.subscribe(2);

    channel.publish(1);
    channel.publish(2);
    channel.publish(3);

    EXPECT_EQ(subscriber->size(), 2U);
    EXPECT_EQ(subscriber->dropped(), 1U);
    EXPECT_EQ(subscriber->try_receive(), std::optional<int>(2));
    EXPECT_EQ(subscriber->try_receive(), std::optional<int>(3));
}

TEST(BroadcastChannelTest, DroppedOrClosedSubscribersAreForgotten)
{
    BroadcastChannel<int> channel;
    auto kept   = channel.subscribe();
    auto closed = channel.subscribe();
    {
        auto dropped = channel.subscribe();
    }
    closed->close();

    EXPECT_EQ(channel.subscriber_count(), 1U);
    EXPECT_EQ(channel.publish(7), 1U);
}

TEST(BroadcastChannelTest, ReceiveForWaitsForPublisher)
{
    BroadcastChannel<int> channel;
    auto subscriber = channel.subscribe();

    std::thread publisher(
        [&channel]()
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            channel.publish(42);
        });

    auto item = subscriber->receive_for(std::chrono::seconds(5));
    publisher.join();
    EXPECT_EQ(item, std::optional<int>(42));
}

TEST(BroadcastChannelTest, ReceiveForTimesOut)
{
    BroadcastChannel<int> channel;
    auto subscriber = channel.subscribe();
    EXPECT_FALSE(subscriber->receive_for(std::chrono::milliseconds(5)).has_value());
}
