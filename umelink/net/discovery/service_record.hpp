#pragma once

#include <boost/asio/ip/udp.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace umelink
{

/**
 * @brief One backend instance seen on the local network.
 *
 * Discovery fills in the name, type and the target the instance advertised. The resolver turns the
 * advertised target into a connectable host/port and sets @c resolved.
 */
struct ServiceRecord
{
    std::string name;
    std::string type;
    bool resolved = false;
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;

    std::string advertised_host;               ///< Host as announced, DNS name or literal
    std::uint16_t advertised_port = 0;         ///< Port as announced
    boost::asio::ip::udp::endpoint advertiser; ///< Where the announcement came from
};

inline std::ostream& operator<<(std::ostream& stream, const ServiceRecord& record)
{
    stream << "'" << record.name << "' (" << record.type << ")";
    if (record.resolved && record.host && record.port)
    {
        stream << " at " << *record.host << ":" << *record.port;
    }
    else
    {
        stream << " advertising " << record.advertised_host << ":" << record.advertised_port;
    }
    return stream;
}

} // namespace umelink
