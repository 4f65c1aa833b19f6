#include "umelink/net/discovery/udp_discovery_client.hpp"

#include "umelink/logging/umelink_logging.hpp"
#include "umelink/net/discovery/discovery_string.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <utility>
#include <vector>

namespace umelink
{

UdpDiscoveryClient::UdpDiscoveryClient(boost::asio::io_context& io_context, const std::string& service_type,
                                       const std::string& name_prefix, std::uint16_t destination_port,
                                       std::chrono::milliseconds retry_timeout, std::chrono::milliseconds record_ttl)
    : _io_context(io_context)
    , _service_type(service_type)
    , _name_prefix(name_prefix)
    , _socket(io_context)
    , _destination_address(boost::asio::ip::make_address(default_broadcast_address))
    , _destination_port(destination_port)
    , _recv_buffer()
    , _retry_timeout(retry_timeout)
    , _record_ttl(record_ttl)
    , _timer(io_context)
{
}

UdpDiscoveryClient::~UdpDiscoveryClient()
{
    boost::system::error_code ignored;
    _socket.close(ignored);
}

bool UdpDiscoveryClient::async_start(DiscoveryHandlers handlers)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_flags.get_flag(UdpDiscoveryState::running))
    {
        return false;
    }

    const std::uint64_t scan = ++_scan;
    _handlers                = std::move(handlers);
    _last_seen.clear();
    _flags.clear_all();
    _flags.set_flag(UdpDiscoveryState::running);

    boost::system::error_code error_code;
    open_socket(error_code);
    if (error_code)
    {
        UMELINK_LOG_ERROR("Failed to open discovery socket: " << error_code.message());
        _flags.clear_flag(UdpDiscoveryState::running);
        auto on_failed = std::move(_handlers.on_failed);
        _handlers      = DiscoveryHandlers {};
        if (on_failed)
        {
            boost::asio::post(_io_context, [on_failed = std::move(on_failed), error_code]() { on_failed(error_code); });
        }
        return true;
    }

    UMELINK_LOG_DEBUG("Discovery scan " << scan << " started for " << _service_type << " (prefix '" << _name_prefix << "')");
    boost::asio::post(_io_context,
                      [self = shared_from_this(), scan]()
                      {
                          std::unique_lock<std::mutex> lock(self->_mutex);
                          if (scan != self->_scan)
                          {
                              return;
                          }
                          self->async_receive(scan);
                          self->send_discovery_request(scan);
                      });
    return true;
}

void UdpDiscoveryClient::open_socket(boost::system::error_code& error_code)
{
    if (_socket.is_open())
    {
        _socket.close(error_code);
        error_code.clear();
    }

    _socket.open(boost::asio::ip::udp::v4(), error_code);
    if (error_code)
    {
        return;
    }
    _socket.bind(boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), 0), error_code);
    if (error_code)
    {
        return;
    }
    _socket.set_option(boost::asio::socket_base::broadcast(true), error_code);
}

void UdpDiscoveryClient::stop()
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (!_flags.get_flag(UdpDiscoveryState::running))
    {
        return;
    }

    ++_scan;
    _flags.clear_all();
    _timer.cancel();
    boost::system::error_code error_code;
    _socket.close(error_code);
    if (error_code)
    {
        UMELINK_LOG_ERROR("Error closing discovery socket: " << error_code.message());
    }
    _handlers = DiscoveryHandlers {};
    _last_seen.clear();
    UMELINK_LOG_DEBUG("Discovery scan stopped");
}

bool UdpDiscoveryClient::is_active() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _flags.get_flag(UdpDiscoveryState::running);
}

void UdpDiscoveryClient::set_destination_address(const boost::asio::ip::address& address)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _destination_address = address;
}

std::size_t UdpDiscoveryClient::known_record_count() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _last_seen.size();
}

std::string UdpDiscoveryClient::to_string() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return "UdpDiscoveryClient flags: " +
           describe(_flags, {UdpDiscoveryState::running, UdpDiscoveryState::timer_running, UdpDiscoveryState::sending_async,
                             UdpDiscoveryState::receiving_async});
}

void UdpDiscoveryClient::async_receive(std::uint64_t scan)
{
    _flags.set_flag(UdpDiscoveryState::receiving_async);
    _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _remote_endpoint,
                               [self = shared_from_this(), scan](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                               { self->handle_response(scan, error_code, bytes_transferred); });
}

void UdpDiscoveryClient::send_discovery_request(std::uint64_t scan)
{
    boost::asio::ip::udp::endpoint destination(_destination_address, _destination_port);

    UMELINK_LOG_TRACE("Sending discovery request for " << _service_type << " to " << destination);
    _flags.set_flag(UdpDiscoveryState::sending_async);
    _socket.async_send_to(boost::asio::buffer(_service_type), destination,
                          [self = shared_from_this(), scan](const boost::system::error_code& error_code, std::size_t)
                          { self->handle_send_complete(scan, error_code); });
}

void UdpDiscoveryClient::handle_send_complete(std::uint64_t scan, const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (scan != _scan)
    {
        return;
    }
    _flags.clear_flag(UdpDiscoveryState::sending_async);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            UMELINK_LOG_INFO("Discovery request sending aborted.");
            return;
        }
        // No route to the broadcast address is usually transient (interface coming up), try again next round
        UMELINK_LOG_WARNING("Failed to send discovery request: " << error_code.message());
    }
    arm_timer(scan);
}

void UdpDiscoveryClient::arm_timer(std::uint64_t scan)
{
    _flags.set_flag(UdpDiscoveryState::timer_running);
    _timer.expires_after(_retry_timeout);
    _timer.async_wait([self = shared_from_this(), scan](const boost::system::error_code& error_code)
                      { self->handle_timeout(scan, error_code); });
}

void UdpDiscoveryClient::handle_response(std::uint64_t scan, const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (scan != _scan)
    {
        return;
    }
    _flags.clear_flag(UdpDiscoveryState::receiving_async);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            UMELINK_LOG_INFO("Discovery response receiving aborted.");
        }
        else
        {
            UMELINK_LOG_ERROR("Error receiving discovery response: " << error_code.message());
            fail_scan(error_code);
        }
        return;
    }

    std::string reply(_recv_buffer.data(), bytes_transferred);
    UMELINK_LOG_TRACE("Discovery response from " << _remote_endpoint << ": " << reply);

    auto info = DiscoveryString::parse(reply);
    if (!info)
    {
        UMELINK_LOG_DEBUG("Ignoring malformed discovery response from " << _remote_endpoint);
    }
    else if (!qualifies(info->service_type, info->service_name))
    {
        UMELINK_LOG_DEBUG("Ignoring non-matching service '" << info->service_name << "' (" << info->service_type << ")");
    }
    else
    {
        const bool fresh               = _last_seen.find(info->service_name) == _last_seen.end();
        _last_seen[info->service_name] = Clock::now();
        if (fresh)
        {
            ServiceRecord record;
            record.name            = info->service_name;
            record.type            = info->service_type;
            record.advertised_host = info->host;
            record.advertised_port = info->port;
            record.advertiser      = _remote_endpoint;

            UMELINK_LOG_INFO("Service found: " << record);
            if (_handlers.on_found)
            {
                _handlers.on_found(record);
            }
        }
    }

    async_receive(scan);
}

void UdpDiscoveryClient::handle_timeout(std::uint64_t scan, const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (scan != _scan)
    {
        return;
    }
    _flags.clear_flag(UdpDiscoveryState::timer_running);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            UMELINK_LOG_INFO("Timer operation aborted.");
        }
        else
        {
            UMELINK_LOG_ERROR("Timer error: " << error_code.message());
            fail_scan(error_code);
        }
        return;
    }

    expire_records();
    if (scan != _scan)
    {
        return;
    }
    UMELINK_LOG_TRACE("Retry timeout expired, sending discovery request for: " << _service_type);
    send_discovery_request(scan);
}

void UdpDiscoveryClient::expire_records()
{
    const auto now = Clock::now();
    std::vector<std::string> lost;
    for (auto iter = _last_seen.begin(); iter != _last_seen.end();)
    {
        if (now - iter->second > _record_ttl)
        {
            lost.push_back(iter->first);
            iter = _last_seen.erase(iter);
        }
        else
        {
            ++iter;
        }
    }

    for (const auto& name : lost)
    {
        UMELINK_LOG_INFO("Service lost: '" << name << "'");
        if (_handlers.on_lost)
        {
            _handlers.on_lost(name);
        }
    }
}

void UdpDiscoveryClient::fail_scan(const boost::system::error_code& error_code)
{
    ++_scan;
    _flags.clear_all();
    _timer.cancel();
    boost::system::error_code close_error;
    _socket.close(close_error);
    if (close_error)
    {
        UMELINK_LOG_DEBUG("Discovery socket close: " << close_error.message());
    }
    _last_seen.clear();

    auto on_failed = std::move(_handlers.on_failed);
    _handlers      = DiscoveryHandlers {};
    if (on_failed)
    {
        on_failed(error_code);
    }
}

bool UdpDiscoveryClient::qualifies(const std::string& type, const std::string& name) const
{
    return type == _service_type && name.compare(0, _name_prefix.size(), _name_prefix) == 0;
}

} // namespace umelink
