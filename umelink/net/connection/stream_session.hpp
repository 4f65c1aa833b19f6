#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace umelink
{

using SessionId = std::uint64_t;

/// Close codes understood by both ends.
namespace close_code
{
constexpr std::uint16_t normal     = 1000;
constexpr std::uint16_t going_away = 1001;
} // namespace close_code

/**
 * Events of one stream session.
 *
 * Before open exactly one of on_opened or on_failed is reported. After on_opened any number of
 * on_message follow, then exactly one of on_closed or on_failed. Nothing is reported after the owner
 * called close().
 */
struct SessionHandlers
{
    std::function<void(SessionId id)> on_opened;
    std::function<void(SessionId id, const std::string& text)> on_message;
    std::function<void(SessionId id, std::uint16_t code, const std::string& reason)> on_closed;
    std::function<void(SessionId id, const std::string& reason)> on_failed;
};

/**
 * One persistent bidirectional text-message connection.
 */
class StreamSession
{
public:
    virtual ~StreamSession() = default;

    virtual SessionId id() const = 0;

    /// Connect to host:port. Completion is reported through the handlers.
    virtual void async_open(const std::string& host, std::uint16_t port) = 0;

    /**
     * Queue one text message.
     * @return true if the transport accepted the message for sending, which doesn't mean it was delivered
     */
    virtual bool send(const std::string& text) = 0;

    /// Start a graceful shutdown. Suppresses all later events of this session.
    virtual void close(std::uint16_t code, const std::string& reason) = 0;
};

/**
 * Creates sessions for the connector. Each call gets a fresh id and its own handlers.
 */
class SessionFactory
{
public:
    virtual ~SessionFactory() = default;

    virtual std::shared_ptr<StreamSession> create(SessionId id, SessionHandlers handlers) = 0;
};

} // namespace umelink
