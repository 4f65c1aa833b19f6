#include "umelink/net/discovery/udp_discovery_responder.hpp"

#include "umelink/logging/umelink_logging.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <string>

namespace umelink
{

UdpDiscoveryResponder::UdpDiscoveryResponder(boost::asio::io_context& io_context, std::uint16_t port)
    : _io_context(io_context), _socket(io_context, boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), port)), _port(port), _recv_buffer()
{
    _port = _socket.local_endpoint().port();
}

UdpDiscoveryResponder::~UdpDiscoveryResponder()
{
    boost::system::error_code ignored;
    _socket.close(ignored);
}

bool UdpDiscoveryResponder::async_start()
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_flags.get_flag(DiscoveryResponderState::listening))
    {
        return false;
    }

    if (_flags.get_flag(DiscoveryResponderState::closed))
    {
        // Restarted after stop(): take the same port again
        boost::system::error_code error_code;
        _socket.open(boost::asio::ip::udp::v4(), error_code);
        if (!error_code)
        {
            _socket.bind(boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), _port), error_code);
        }
        if (error_code)
        {
            UMELINK_LOG_ERROR("Discovery responder can't reopen UDP port " << _port << ": " << error_code.message());
            close_socket();
            return false;
        }
        _flags.clear_flag(DiscoveryResponderState::closed);
    }

    _flags.set_flag(DiscoveryResponderState::listening);
    const std::uint64_t run = ++_run;
    boost::asio::post(_io_context,
                      [self = shared_from_this(), run]()
                      {
                          std::unique_lock<std::mutex> lock(self->_mutex);
                          if (run == self->_run)
                          {
                              self->start_receive(run);
                          }
                      });
    UMELINK_LOG_INFO("Discovery responder listening on UDP port " << _port);
    return true;
}

void UdpDiscoveryResponder::stop()
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_flags.get_flag(DiscoveryResponderState::closed))
    {
        return;
    }

    ++_run;
    _flags.clear_flag(DiscoveryResponderState::listening);
    _flags.set_flag(DiscoveryResponderState::closed);
    close_socket();
}

bool UdpDiscoveryResponder::is_listening() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _flags.get_flag(DiscoveryResponderState::listening);
}

void UdpDiscoveryResponder::close_socket()
{
    boost::system::error_code error_code;
    _socket.close(error_code);
    if (error_code)
    {
        UMELINK_LOG_ERROR("Error closing discovery responder socket: " << error_code.message());
    }
}

void UdpDiscoveryResponder::add_advertisement(const ServiceAdvertisement& advertisement)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _advertisements.push_back(advertisement);
}

std::uint16_t UdpDiscoveryResponder::port() const
{
    return _port;
}

std::size_t UdpDiscoveryResponder::reply_count() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _reply_count;
}

void UdpDiscoveryResponder::start_receive(std::uint64_t run)
{
    _flags.set_flag(DiscoveryResponderState::receiving);
    _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _remote_endpoint,
                               [self = shared_from_this(), run](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                               { self->handle_receive(run, error_code, bytes_transferred); });
}

void UdpDiscoveryResponder::handle_receive(std::uint64_t run, const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (run != _run)
    {
        // Completion of a socket that stop() closed
        return;
    }
    _flags.clear_flag(DiscoveryResponderState::receiving);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            UMELINK_LOG_DEBUG("Discovery responder receive operation aborted.");
        }
        else
        {
            UMELINK_LOG_ERROR("UDP receive error: " << error_code.message());
        }
    }
    else if (bytes_transferred > 0)
    {
        std::string requested_type(_recv_buffer.data(), bytes_transferred);
        UMELINK_LOG_TRACE("Discovery request for " << requested_type << " from " << _remote_endpoint);

        for (const auto& advertisement : _advertisements)
        {
            if (advertisement.get_service_type() != requested_type)
            {
                continue;
            }

            auto send_buffer = std::make_shared<std::string>(advertisement.get_reply(_remote_endpoint));
            if (send_buffer->empty())
            {
                continue;
            }

            _flags.set_flag(DiscoveryResponderState::replying);
            _socket.async_send_to(boost::asio::buffer(*send_buffer), _remote_endpoint,
                                  [self = shared_from_this(), send_buffer](const boost::system::error_code& error_code, std::size_t)
                                  { self->handle_send(error_code); });
        }
    }

    if (_flags.get_flag(DiscoveryResponderState::listening) && _socket.is_open())
    {
        start_receive(run);
    }
}

void UdpDiscoveryResponder::handle_send(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            UMELINK_LOG_DEBUG("Discovery responder send operation aborted.");
        }
        else
        {
            UMELINK_LOG_ERROR("UDP send error: " << error_code.message());
        }
    }
    else
    {
        ++_reply_count;
    }

    _flags.clear_flag(DiscoveryResponderState::replying);
}

} // namespace umelink
