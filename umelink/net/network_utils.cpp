#include "umelink/net/network_utils.hpp"
#include "umelink/logging/umelink_logging.hpp"
#include <boost/system/error_code.hpp>

namespace umelink
{

std::optional<boost::asio::ip::address> local_address_towards(boost::asio::io_context& io_context,
                                                              const boost::asio::ip::udp::endpoint& remote_endpoint)
{
    boost::asio::ip::udp::socket route_socket(io_context);
    boost::system::error_code error_code;
    const char* step = "open";

    route_socket.open(remote_endpoint.protocol(), error_code);
    if (!error_code)
    {
        // A connected UDP socket has its source address chosen by the routing table
        step = "connect";
        route_socket.connect(remote_endpoint, error_code);
    }

    boost::asio::ip::udp::endpoint local_endpoint;
    if (!error_code)
    {
        step           = "local_endpoint";
        local_endpoint = route_socket.local_endpoint(error_code);
    }

    if (error_code)
    {
        UMELINK_LOG_WARNING("No local address towards " << remote_endpoint.address() << " (" << step << ": " << error_code.message() << ")");
        return std::nullopt;
    }

    boost::asio::ip::address address = local_endpoint.address();
    if (address.is_v6() && address.to_v6().is_v4_mapped())
    {
        address = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6());
    }
    UMELINK_LOG_DEBUG("Replying to " << remote_endpoint.address() << " from " << address);
    return address;
}

std::string format_host_for_url(const std::string& host)
{
    if (!host.empty() && host.front() != '[' && host.find(':') != std::string::npos)
    {
        return "[" + host + "]";
    }
    return host;
}

} // namespace umelink
