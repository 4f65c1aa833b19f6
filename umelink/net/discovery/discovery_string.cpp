#include "umelink/net/discovery/discovery_string.hpp"

#include "umelink/logging/umelink_logging.hpp"

#include <cctype>
#include <string>

namespace umelink
{

std::string DiscoveryString::construct(const std::string& service_type, const std::string& service_name, const std::string& host,
                                       unsigned short port)
{
    return service_type + ":" + service_name + ":" + host + ":" + std::to_string(port);
}

std::optional<DiscoveryInfo> DiscoveryString::parse(const std::string& reply)
{
    // Expected format: "TYPE:NAME:HOST:PORT" (e.g., "_umebotlogics._tcp:UmebotLogicsWebSocket:192.168.1.100:8080")

    size_t first_colon_pos = reply.find(':');
    if (first_colon_pos == std::string::npos)
    {
        UMELINK_LOG_DEBUG("Invalid discovery reply format (missing type separator): " << reply);
        return std::nullopt;
    }

    size_t second_colon_pos = reply.find(':', first_colon_pos + 1);
    if (second_colon_pos == std::string::npos)
    {
        UMELINK_LOG_DEBUG("Invalid discovery reply format (missing name separator): " << reply);
        return std::nullopt;
    }

    size_t last_colon_pos = reply.rfind(':');
    if (last_colon_pos == second_colon_pos)
    {
        UMELINK_LOG_DEBUG("Invalid discovery reply format (missing port separator): " << reply);
        return std::nullopt;
    }

    std::string service_type = reply.substr(0, first_colon_pos);
    std::string service_name = reply.substr(first_colon_pos + 1, second_colon_pos - first_colon_pos - 1);
    std::string host         = reply.substr(second_colon_pos + 1, last_colon_pos - second_colon_pos - 1);
    std::string port_str     = reply.substr(last_colon_pos + 1);

    if (service_type.empty() || service_name.empty())
    {
        UMELINK_LOG_DEBUG("Invalid discovery reply format (empty type or name): " << reply);
        return std::nullopt;
    }

    // Bracketed IPv6 literals are accepted and stored bare
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    {
        host = host.substr(1, host.size() - 2);
    }

    if (host.empty())
    {
        UMELINK_LOG_DEBUG("Invalid discovery reply format (empty host): " << reply);
        return std::nullopt;
    }

    if (port_str.empty() || port_str.size() > 5)
    {
        UMELINK_LOG_DEBUG("Invalid discovery reply format (invalid port '" << port_str << "'): " << reply);
        return std::nullopt;
    }
    for (char digit : port_str)
    {
        if (std::isdigit(static_cast<unsigned char>(digit)) == 0)
        {
            UMELINK_LOG_DEBUG("Invalid discovery reply format (invalid port '" << port_str << "'): " << reply);
            return std::nullopt;
        }
    }

    unsigned long port_value = std::stoul(port_str);
    if (port_value > 65535)
    {
        UMELINK_LOG_DEBUG("Invalid discovery reply format (port out of range '" << port_str << "'): " << reply);
        return std::nullopt;
    }

    return DiscoveryInfo {service_type, service_name, host, static_cast<unsigned short>(port_value)};
}

} // namespace umelink
