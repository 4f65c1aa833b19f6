#include "umelink/net/discovery/service_advertisement.hpp"

#include "umelink/net/discovery/discovery_string.hpp"
#include "umelink/net/network_utils.hpp"

#include <utility>

namespace umelink
{

ServiceAdvertisement::ServiceAdvertisement(const std::string& service_type, const std::string& service_name, ReplyCallback callback)
    : _service_type(service_type), _service_name(service_name), _callback(std::move(callback))
{
}

ServiceAdvertisement ServiceAdvertisement::for_endpoint(boost::asio::io_context& io_context, const std::string& service_type,
                                                        const std::string& service_name, const std::string& host, unsigned short port)
{
    return ServiceAdvertisement(service_type, service_name,
                                [&io_context, service_type, service_name, host, port](const boost::asio::ip::udp::endpoint& remote_endpoint)
                                {
                                    if (host != "auto")
                                    {
                                        return DiscoveryString::construct(service_type, service_name, host, port);
                                    }

                                    auto local_address = local_address_towards(io_context, remote_endpoint);
                                    if (!local_address)
                                    {
                                        // No reply rather than one the requester can't reach
                                        return std::string();
                                    }
                                    return DiscoveryString::construct(service_type, service_name, local_address->to_string(), port);
                                });
}

const std::string& ServiceAdvertisement::get_service_type() const
{
    return _service_type;
}

const std::string& ServiceAdvertisement::get_service_name() const
{
    return _service_name;
}

std::string ServiceAdvertisement::get_reply(const boost::asio::ip::udp::endpoint& remote_endpoint) const
{
    return _callback(remote_endpoint);
}

} // namespace umelink
