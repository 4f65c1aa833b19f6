#include "umelink/flags/flags.hpp"
#include "umelink/net/discovery/discovery_states.hpp"

#include <gtest/gtest.h>

using namespace umelink;

TEST(FlagsTest, SetClearAndQuery)
{
    Flags<UdpDiscoveryState> flags;
    EXPECT_EQ(flags.get_raw(), 0U);

    flags.set_flag(UdpDiscoveryState::running);
    flags.set_flag(UdpDiscoveryState::receiving_async);
    EXPECT_TRUE(flags.get_flag(UdpDiscoveryState::running));
    EXPECT_TRUE(flags.get_flag(UdpDiscoveryState::receiving_async));
    EXPECT_FALSE(flags.get_flag(UdpDiscoveryState::sending_async));

    flags.clear_flag(UdpDiscoveryState::running);
    EXPECT_FALSE(flags.get_flag(UdpDiscoveryState::running));
    EXPECT_TRUE(flags.any_of({UdpDiscoveryState::running, UdpDiscoveryState::receiving_async}));
    EXPECT_FALSE(flags.any_of({UdpDiscoveryState::running, UdpDiscoveryState::timer_running}));

    flags.clear_all();
    EXPECT_EQ(flags.get_raw(), 0U);
}

TEST(FlagsTest, DescribeListsSetFlagsInOrder)
{
    Flags<UdpDiscoveryState> flags;
    const auto known = {UdpDiscoveryState::running, UdpDiscoveryState::sending_async, UdpDiscoveryState::timer_running};
    EXPECT_EQ(describe(flags, known), "[]");

    flags.set_flag(UdpDiscoveryState::timer_running);
    flags.set_flag(UdpDiscoveryState::running);
    EXPECT_EQ(describe(flags, known), "[" + std::string(to_string(UdpDiscoveryState::running)) + ", " +
                                          std::string(to_string(UdpDiscoveryState::timer_running)) + "]");
}
