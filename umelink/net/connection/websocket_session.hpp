#pragma once

#include "umelink/flags/flags.hpp"
#include "umelink/net/connection/stream_session.hpp"
#include "umelink/net/connection/websocket_session_states.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace umelink
{

struct WebSocketOptions
{
    static constexpr std::size_t default_max_queued_bytes = 16 * 1024 * 1024;

    std::string path = "/ws_bidirectional";
    std::chrono::milliseconds open_timeout {10000};
    std::size_t max_queued_bytes = default_max_queued_bytes;
};

/**
 * Client side of a WebSocket text stream.
 *
 * All stream operations run on a strand of the io_context. send() and close() may be called from
 * any thread. Must be owned by a std::shared_ptr.
 */
class WebSocketSession : public StreamSession, public std::enable_shared_from_this<WebSocketSession>
{
public:
    WebSocketSession(boost::asio::io_context& io_context, SessionId id, SessionHandlers handlers, WebSocketOptions options);

    WebSocketSession(const WebSocketSession&)            = delete;
    WebSocketSession& operator=(const WebSocketSession&) = delete;
    WebSocketSession(WebSocketSession&&)                 = delete;
    WebSocketSession& operator=(WebSocketSession&&)      = delete;

    SessionId id() const override { return _id; }

    void async_open(const std::string& host, std::uint16_t port) override;
    bool send(const std::string& text) override;
    void close(std::uint16_t code, const std::string& reason) override;

    std::size_t queued_bytes() const;

    std::string to_string() const;

private:
    using WebSocketStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    void handle_resolve(const boost::system::error_code& error_code, const boost::asio::ip::tcp::resolver::results_type& results);
    void handle_connect(const boost::system::error_code& error_code);
    void handle_handshake(const boost::system::error_code& error_code);
    void async_read();
    void handle_read(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void write_next();
    void handle_write(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void shut_down(std::uint16_t code, const std::string& reason);

    /// Report the single terminal event, unless the owner already closed the session. Caller holds _mutex.
    void report_failure(const std::string& reason);
    void report_closed(std::uint16_t code, const std::string& reason);

    mutable std::mutex _mutex;

    const SessionId _id;
    boost::asio::strand<boost::asio::io_context::executor_type> _strand;
    boost::asio::ip::tcp::resolver _resolver;
    WebSocketStream _ws;
    boost::beast::flat_buffer _read_buffer;

    SessionHandlers _handlers;
    WebSocketOptions _options;
    std::string _host_header;

    std::deque<std::shared_ptr<const std::string>> _outbox;
    std::size_t _queued_bytes = 0;

    Flags<WebSocketSessionState> _flags;
};

/**
 * Creates WebSocketSession instances on one io_context.
 */
class WebSocketSessionFactory : public SessionFactory
{
public:
    WebSocketSessionFactory(boost::asio::io_context& io_context, WebSocketOptions options);

    std::shared_ptr<StreamSession> create(SessionId id, SessionHandlers handlers) override;

private:
    boost::asio::io_context& _io_context;
    WebSocketOptions _options;
};

} // namespace umelink
