#pragma once

#include <cstdint>

namespace umelink
{

/// What a UdpDiscoveryClient has in flight.
enum class UdpDiscoveryState : std::uint8_t
{
    running,
    timer_running,
    sending_async,
    receiving_async,
};

inline const char* to_string(UdpDiscoveryState state) noexcept
{
    switch (state)
    {
    case UdpDiscoveryState::running:
        return "running";
    case UdpDiscoveryState::timer_running:
        return "timer_running";
    case UdpDiscoveryState::sending_async:
        return "sending_async";
    case UdpDiscoveryState::receiving_async:
        return "receiving_async";
    }
    return "unknown";
}

/// Lifecycle of a UdpDiscoveryResponder. `closed` is set between stop() and the next start.
enum class DiscoveryResponderState : std::uint8_t
{
    listening,
    closed,
    receiving,
    replying,
};

inline const char* to_string(DiscoveryResponderState state) noexcept
{
    switch (state)
    {
    case DiscoveryResponderState::listening:
        return "listening";
    case DiscoveryResponderState::closed:
        return "closed";
    case DiscoveryResponderState::receiving:
        return "receiving";
    case DiscoveryResponderState::replying:
        return "replying";
    }
    return "unknown";
}

} // namespace umelink
