#pragma once

#include <boost/asio/ip/udp.hpp>

#include <functional>
#include <string>

namespace umelink
{

/**
 * @brief A backend instance the responder answers discovery requests for.
 *
 * Holds the service type and instance name and a callback that produces the discovery reply.
 * The callback receives the remote endpoint that initiated the request, so an instance listening
 * on several interfaces can reply with the address the requester can reach.
 */
class ServiceAdvertisement
{
public:
    using ReplyCallback = std::function<std::string(const boost::asio::ip::udp::endpoint&)>;

    ServiceAdvertisement(const std::string& service_type, const std::string& service_name, ReplyCallback callback);

    /**
     * @brief Advertise a fixed host and port.
     * @param host Host to announce. "auto" announces the local address routing to each requester.
     */
    static ServiceAdvertisement for_endpoint(boost::asio::io_context& io_context, const std::string& service_type,
                                             const std::string& service_name, const std::string& host, unsigned short port);

    const std::string& get_service_type() const;
    const std::string& get_service_name() const;

    /// Call the callback with the remote endpoint and return its reply string. Empty means don't answer.
    std::string get_reply(const boost::asio::ip::udp::endpoint& remote_endpoint) const;

private:
    std::string _service_type;
    std::string _service_name;
    ReplyCallback _callback;
};

} // namespace umelink
