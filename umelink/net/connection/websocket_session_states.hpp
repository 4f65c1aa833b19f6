#pragma once

#include <cstdint>

namespace umelink
{
enum class WebSocketSessionState : std::uint8_t
{
    resolving,
    connecting,
    handshaking,
    open,
    writing,
    closing,
    terminated,
    stop_signaled
};

inline const char* to_string(WebSocketSessionState state) noexcept
{
    switch (state)
    {
    case WebSocketSessionState::resolving:
        return "resolving";
    case WebSocketSessionState::connecting:
        return "connecting";
    case WebSocketSessionState::handshaking:
        return "handshaking";
    case WebSocketSessionState::open:
        return "open";
    case WebSocketSessionState::writing:
        return "writing";
    case WebSocketSessionState::closing:
        return "closing";
    case WebSocketSessionState::terminated:
        return "terminated";
    case WebSocketSessionState::stop_signaled:
        return "stop_signaled";
    }
    return "unknown";
}

} // namespace umelink
