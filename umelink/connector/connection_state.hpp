#pragma once

#include <cstdint>
#include <ostream>

namespace umelink
{
enum class ConnectionState : std::uint8_t
{
    idle,
    discovering,
    service_found,
    resolved,
    connecting,
    connected,
    reconnecting,
    disconnected
};

inline const char* to_string(ConnectionState state) noexcept
{
    switch (state)
    {
    case ConnectionState::idle:
        return "Idle";
    case ConnectionState::discovering:
        return "Discovering";
    case ConnectionState::service_found:
        return "ServiceFound";
    case ConnectionState::resolved:
        return "Resolved";
    case ConnectionState::connecting:
        return "Connecting";
    case ConnectionState::connected:
        return "Connected";
    case ConnectionState::reconnecting:
        return "Reconnecting";
    case ConnectionState::disconnected:
        return "Disconnected";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& stream, ConnectionState state)
{
    return stream << to_string(state);
}

} // namespace umelink
