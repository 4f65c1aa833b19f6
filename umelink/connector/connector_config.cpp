#include "umelink/connector/connector_config.hpp"

#include <boost/asio/ip/address.hpp>

#include <stdexcept>

namespace umelink
{

void ConnectorConfig::validate() const
{
    if (service_type.empty())
    {
        throw std::invalid_argument("service_type must not be empty");
    }
    if (service_type.find(':') != std::string::npos || name_prefix.find(':') != std::string::npos)
    {
        throw std::invalid_argument("service_type and name_prefix must not contain ':'");
    }
    if (name_prefix.empty())
    {
        throw std::invalid_argument("name_prefix must not be empty");
    }
    if (discovery_port == 0)
    {
        throw std::invalid_argument("discovery_port must not be 0");
    }
    boost::system::error_code error_code;
    boost::asio::ip::make_address(discovery_address, error_code);
    if (error_code)
    {
        throw std::invalid_argument("discovery_address '" + discovery_address + "' is not an IP address");
    }
    if (discovery_interval.count() <= 0 || record_ttl.count() <= 0 || discovery_retry_delay.count() <= 0 || open_timeout.count() <= 0)
    {
        throw std::invalid_argument("intervals and timeouts must be positive");
    }
    if (scheme != "ws")
    {
        throw std::invalid_argument("unsupported scheme '" + scheme + "'");
    }
    if (reconnect.max_attempts <= 0)
    {
        throw std::invalid_argument("reconnect.max_attempts must be at least 1");
    }
    if (reconnect.multiplier < 1.0)
    {
        throw std::invalid_argument("reconnect.multiplier must be at least 1.0");
    }
    if (reconnect.initial_delay.count() < 0 || reconnect.max_delay < reconnect.initial_delay)
    {
        throw std::invalid_argument("reconnect.max_delay must not be below reconnect.initial_delay");
    }
    if (max_discovery_failures < 0)
    {
        throw std::invalid_argument("max_discovery_failures must not be negative");
    }
    if (message_buffer_capacity == 0 || max_queued_bytes == 0)
    {
        throw std::invalid_argument("buffer sizes must be positive");
    }
}

} // namespace umelink
