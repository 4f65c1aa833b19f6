#include "umelink/connector/connection_state.hpp"
#include "umelink/connector/observable_state.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace umelink;

TEST(ObservableStateTest, NewObserverGetsCurrentValue)
{
    ObservableState<ConnectionState> state(ConnectionState::discovering);

    std::vector<ConnectionState> seen;
    state.subscribe([&seen](const ConnectionState& value) { seen.push_back(value); });

    ASSERT_EQ(seen.size(), 1U);
    EXPECT_EQ(seen.front(), ConnectionState::discovering);
}

TEST(ObservableStateTest, NotifiesChangesOnly)
{
    ObservableState<int> state(1);

    std::vector<int> seen;
    state.subscribe([&seen](const int& value) { seen.push_back(value); });

    state.set(1);
    state.set(2);
    state.set(2);
    state.set(3);

    EXPECT_EQ(seen, (std::vector<int> {1, 2, 3}));
    EXPECT_EQ(state.get(), 3);
}

TEST(ObservableStateTest, UnsubscribedObserverIsNotCalled)
{
    ObservableState<int> state(0);

    int calls      = 0;
    const auto id  = state.subscribe([&calls](const int&) { ++calls; });
    state.unsubscribe(id);
    state.set(5);

    EXPECT_EQ(calls, 1);
}

TEST(ObservableStateTest, WaitForSeesValueSetFromAnotherThread)
{
    ObservableState<ConnectionState> state(ConnectionState::idle);

    std::thread setter(
        [&state]()
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            state.set(ConnectionState::connected);
        });

    EXPECT_TRUE(state.wait_for(ConnectionState::connected, std::chrono::seconds(5)));
    setter.join();
}

TEST(ObservableStateTest, WaitForTimesOut)
{
    ObservableState<int> state(0);
    EXPECT_FALSE(state.wait_for(1, std::chrono::milliseconds(10)));
}

TEST(ObservableStateTest, SubscribeRacingSetEndsOnRetainedValue)
{
    for (int round = 0; round < 2000; ++round)
    {
        ObservableState<int> state(0);
        std::mutex seen_mutex;
        int last_seen = -1;

        std::thread setter(
            [&state]()
            {
                state.set(1);
                state.set(2);
            });
        state.subscribe(
            [&seen_mutex, &last_seen](const int& value)
            {
                std::lock_guard<std::mutex> lock(seen_mutex);
                last_seen = value;
            });
        setter.join();

        std::lock_guard<std::mutex> lock(seen_mutex);
        ASSERT_EQ(last_seen, state.get()) << "round " << round;
    }
}

TEST(ConnectionStateTest, Names)
{
    EXPECT_STREQ(to_string(ConnectionState::idle), "Idle");
    EXPECT_STREQ(to_string(ConnectionState::service_found), "ServiceFound");
    EXPECT_STREQ(to_string(ConnectionState::reconnecting), "Reconnecting");
    EXPECT_STREQ(to_string(ConnectionState::disconnected), "Disconnected");
}
