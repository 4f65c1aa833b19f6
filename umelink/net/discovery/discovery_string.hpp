#pragma once

#include <optional>
#include <string>

namespace umelink
{

/**
 * @brief Parsed discovery reply
 */
struct DiscoveryInfo
{
    std::string service_type; ///< Type the responder serves, e.g. "_umebotlogics._tcp"
    std::string service_name; ///< Instance name of the discovered service
    std::string host;         ///< Host to connect to, DNS name or IP literal
    unsigned short port;      ///< Port number of the service
};

/**
 * @brief Utility class for handling discovery string creation and parsing
 */
class DiscoveryString
{
public:
    /**
     * @brief Creates a discovery reply string in "TYPE:NAME:HOST:PORT" format
     * @param service_type The type of the service
     * @param service_name The instance name of the service
     * @param host The host to include in the string
     * @param port The port number to include in the string
     * @return Discovery reply string (e.g., "_umebotlogics._tcp:UmebotLogicsWebSocket:192.168.1.100:8080")
     */
    static std::string construct(const std::string& service_type, const std::string& service_name, const std::string& host,
                                 unsigned short port);

    /**
     * @brief Parses a discovery reply string in "TYPE:NAME:HOST:PORT" format
     *
     * The type and name end at the first and second colon. The port follows the last colon, so
     * the host may be an IPv6 literal.
     *
     * @param reply The reply string to parse
     * @return Parsed DiscoveryInfo on success, std::nullopt on failure
     */
    static std::optional<DiscoveryInfo> parse(const std::string& reply);
};

} // namespace umelink
