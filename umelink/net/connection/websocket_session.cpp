#include "umelink/net/connection/websocket_session.hpp"

#include "umelink/logging/umelink_logging.hpp"
#include "umelink/net/connection/stream_url.hpp"
#include "umelink/net/network_utils.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http/field.hpp>

#include <utility>

namespace umelink
{

namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;

WebSocketSession::WebSocketSession(boost::asio::io_context& io_context, SessionId id, SessionHandlers handlers, WebSocketOptions options)
    : _id(id)
    , _strand(boost::asio::make_strand(io_context))
    , _resolver(_strand)
    , _ws(_strand)
    , _handlers(std::move(handlers))
    , _options(std::move(options))
{
}

void WebSocketSession::async_open(const std::string& host, std::uint16_t port)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_flags.any_of({WebSocketSessionState::resolving, WebSocketSessionState::connecting, WebSocketSessionState::handshaking,
                       WebSocketSessionState::open, WebSocketSessionState::terminated, WebSocketSessionState::stop_signaled}))
    {
        UMELINK_LOG_WARNING("Session " << _id << " can't be opened again " << describe(_flags, {WebSocketSessionState::open}));
        return;
    }

    _flags.set_flag(WebSocketSessionState::resolving);
    _host_header = format_host_for_url(host) + ":" + std::to_string(port);
    UMELINK_LOG_DEBUG("Session " << _id << " opening " << make_stream_url("ws", host, port, _options.path));

    boost::asio::post(_strand,
                      [self = shared_from_this(), host, port]()
                      {
                          self->_resolver.async_resolve(host, std::to_string(port),
                                                        [self](const boost::system::error_code& error_code,
                                                               boost::asio::ip::tcp::resolver::results_type results)
                                                        { self->handle_resolve(error_code, results); });
                      });
}

void WebSocketSession::handle_resolve(const boost::system::error_code& error_code,
                                      const boost::asio::ip::tcp::resolver::results_type& results)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(WebSocketSessionState::resolving);
    if (_flags.get_flag(WebSocketSessionState::stop_signaled))
    {
        return;
    }

    if (error_code)
    {
        report_failure("resolve failed: " + error_code.message());
        return;
    }

    _flags.set_flag(WebSocketSessionState::connecting);
    beast::get_lowest_layer(_ws).expires_after(_options.open_timeout);
    beast::get_lowest_layer(_ws).async_connect(results,
                                               [self = shared_from_this()](const boost::system::error_code& error_code,
                                                                           const boost::asio::ip::tcp::endpoint&)
                                               { self->handle_connect(error_code); });
}

void WebSocketSession::handle_connect(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(WebSocketSessionState::connecting);
    if (_flags.get_flag(WebSocketSessionState::stop_signaled))
    {
        return;
    }

    if (error_code)
    {
        report_failure("connect failed: " + error_code.message());
        return;
    }

    // The websocket stream keeps its own timeouts from here on
    beast::get_lowest_layer(_ws).expires_never();

    websocket::stream_base::timeout timeout = websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeout.handshake_timeout               = _options.open_timeout;
    _ws.set_option(timeout);
    _ws.set_option(websocket::stream_base::decorator([](websocket::request_type& request)
                                                     { request.set(beast::http::field::user_agent, "umelink"); }));

    _flags.set_flag(WebSocketSessionState::handshaking);
    _ws.async_handshake(_host_header, normalize_path(_options.path),
                        [self = shared_from_this()](const boost::system::error_code& error_code) { self->handle_handshake(error_code); });
}

void WebSocketSession::handle_handshake(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(WebSocketSessionState::handshaking);
    if (_flags.get_flag(WebSocketSessionState::stop_signaled))
    {
        return;
    }

    if (error_code)
    {
        report_failure("handshake failed: " + error_code.message());
        return;
    }

    _flags.set_flag(WebSocketSessionState::open);
    _ws.text(true);
    UMELINK_LOG_DEBUG("Session " << _id << " open to " << _host_header);
    if (_handlers.on_opened)
    {
        _handlers.on_opened(_id);
    }
    async_read();
}

void WebSocketSession::async_read()
{
    _ws.async_read(_read_buffer, [self = shared_from_this()](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                   { self->handle_read(error_code, bytes_transferred); });
}

void WebSocketSession::handle_read(const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_flags.any_of({WebSocketSessionState::stop_signaled, WebSocketSessionState::terminated}))
    {
        return;
    }

    if (error_code)
    {
        if (error_code == websocket::error::closed)
        {
            const websocket::close_reason& reason = _ws.reason();
            report_closed(static_cast<std::uint16_t>(reason.code), std::string(reason.reason.c_str()));
        }
        else
        {
            report_failure("read failed: " + error_code.message());
        }
        return;
    }

    if (_ws.got_text())
    {
        std::string text = beast::buffers_to_string(_read_buffer.data());
        UMELINK_LOG_TRACE("Session " << _id << " received " << bytes_transferred << " bytes");
        if (_handlers.on_message)
        {
            _handlers.on_message(_id, text);
        }
    }
    else
    {
        UMELINK_LOG_TRACE("Session " << _id << " ignoring binary frame of " << bytes_transferred << " bytes");
    }
    _read_buffer.consume(_read_buffer.size());
    async_read();
}

bool WebSocketSession::send(const std::string& text)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (!_flags.get_flag(WebSocketSessionState::open) ||
        _flags.any_of({WebSocketSessionState::closing, WebSocketSessionState::terminated, WebSocketSessionState::stop_signaled}))
    {
        return false;
    }

    if (_queued_bytes + text.size() > _options.max_queued_bytes)
    {
        UMELINK_LOG_WARNING("Session " << _id << " outgoing queue full (" << _queued_bytes << " bytes), rejecting message");
        return false;
    }

    _outbox.push_back(std::make_shared<const std::string>(text));
    _queued_bytes += text.size();

    if (!_flags.get_flag(WebSocketSessionState::writing))
    {
        _flags.set_flag(WebSocketSessionState::writing);
        boost::asio::post(_strand,
                          [self = shared_from_this()]()
                          {
                              std::unique_lock<std::mutex> lock(self->_mutex);
                              self->write_next();
                          });
    }
    return true;
}

void WebSocketSession::write_next()
{
    if (_outbox.empty() || _flags.any_of({WebSocketSessionState::stop_signaled, WebSocketSessionState::terminated}))
    {
        _flags.clear_flag(WebSocketSessionState::writing);
        return;
    }

    auto message = _outbox.front();
    _ws.async_write(boost::asio::buffer(*message),
                    [self = shared_from_this(), message](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                    { self->handle_write(error_code, bytes_transferred); });
}

void WebSocketSession::handle_write(const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (!_outbox.empty())
    {
        _queued_bytes -= _outbox.front()->size();
        _outbox.pop_front();
    }

    if (error_code)
    {
        _flags.clear_flag(WebSocketSessionState::writing);
        if (error_code == boost::asio::error::operation_aborted)
        {
            UMELINK_LOG_INFO("Session " << _id << " write aborted");
            return;
        }
        report_failure("write failed: " + error_code.message());
        return;
    }

    UMELINK_LOG_TRACE("Session " << _id << " sent " << bytes_transferred << " bytes");
    write_next();
}

void WebSocketSession::close(std::uint16_t code, const std::string& reason)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_flags.get_flag(WebSocketSessionState::stop_signaled))
    {
        return;
    }

    _flags.set_flag(WebSocketSessionState::stop_signaled);
    UMELINK_LOG_DEBUG("Session " << _id << " closing (" << code << ", '" << reason << "')");
    boost::asio::post(_strand, [self = shared_from_this(), code, reason]() { self->shut_down(code, reason); });
}

void WebSocketSession::shut_down(std::uint16_t code, const std::string& reason)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _outbox.clear();
    _queued_bytes = 0;

    if (_flags.get_flag(WebSocketSessionState::open) && !_flags.any_of({WebSocketSessionState::closing, WebSocketSessionState::terminated}))
    {
        _flags.set_flag(WebSocketSessionState::closing);
        _ws.async_close(websocket::close_reason(static_cast<websocket::close_code>(code), reason),
                        [self = shared_from_this()](const boost::system::error_code& error_code)
                        {
                            std::unique_lock<std::mutex> lock(self->_mutex);
                            if (error_code && error_code != boost::asio::error::operation_aborted)
                            {
                                UMELINK_LOG_DEBUG("Session " << self->_id << " close handshake failed: " << error_code.message());
                            }
                            self->_flags.clear_flag(WebSocketSessionState::closing);
                            self->_flags.clear_flag(WebSocketSessionState::open);
                        });
        return;
    }

    // Not open yet: abort whatever step of the opening is in flight
    _resolver.cancel();
    boost::system::error_code error_code;
    beast::get_lowest_layer(_ws).socket().close(error_code);
    if (error_code)
    {
        UMELINK_LOG_DEBUG("Session " << _id << " socket close: " << error_code.message());
    }
}

std::size_t WebSocketSession::queued_bytes() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _queued_bytes;
}

std::string WebSocketSession::to_string() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return "WebSocketSession " + std::to_string(_id) + " flags: " +
           describe(_flags, {WebSocketSessionState::resolving, WebSocketSessionState::connecting, WebSocketSessionState::handshaking,
                             WebSocketSessionState::open, WebSocketSessionState::writing, WebSocketSessionState::closing,
                             WebSocketSessionState::terminated, WebSocketSessionState::stop_signaled});
}

void WebSocketSession::report_failure(const std::string& reason)
{
    if (_flags.any_of({WebSocketSessionState::terminated, WebSocketSessionState::stop_signaled}))
    {
        return;
    }

    _flags.set_flag(WebSocketSessionState::terminated);
    _flags.clear_flag(WebSocketSessionState::open);
    _outbox.clear();
    _queued_bytes = 0;

    boost::system::error_code error_code;
    beast::get_lowest_layer(_ws).socket().close(error_code);
    if (error_code)
    {
        UMELINK_LOG_DEBUG("Session " << _id << " socket close: " << error_code.message());
    }

    UMELINK_LOG_WARNING("Session " << _id << " failed: " << reason);
    if (_handlers.on_failed)
    {
        _handlers.on_failed(_id, reason);
    }
}

void WebSocketSession::report_closed(std::uint16_t code, const std::string& reason)
{
    if (_flags.any_of({WebSocketSessionState::terminated, WebSocketSessionState::stop_signaled}))
    {
        return;
    }

    _flags.set_flag(WebSocketSessionState::terminated);
    _flags.clear_flag(WebSocketSessionState::open);
    _outbox.clear();
    _queued_bytes = 0;

    UMELINK_LOG_INFO("Session " << _id << " closed by peer (" << code << ", '" << reason << "')");
    if (_handlers.on_closed)
    {
        _handlers.on_closed(_id, code, reason);
    }
}

WebSocketSessionFactory::WebSocketSessionFactory(boost::asio::io_context& io_context, WebSocketOptions options)
    : _io_context(io_context), _options(std::move(options))
{
}

std::shared_ptr<StreamSession> WebSocketSessionFactory::create(SessionId id, SessionHandlers handlers)
{
    return std::make_shared<WebSocketSession>(_io_context, id, std::move(handlers), _options);
}

} // namespace umelink
