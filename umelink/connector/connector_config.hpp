#pragma once

#include "umelink/logging/umelink_logging.hpp"
#include "umelink/net/connection/reconnect_policy.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace umelink
{

struct ConnectorConfig
{
    static constexpr const char* default_service_type = "_umebotlogics._tcp";
    static constexpr const char* default_name_prefix  = "UmebotLogicsWebSocket";
    static constexpr const char* default_path         = "/ws_bidirectional";
    static constexpr std::uint16_t default_discovery_port = 45454;

    std::string service_type = default_service_type;
    std::string name_prefix  = default_name_prefix;

    std::uint16_t discovery_port = default_discovery_port;
    /// Where discovery requests go. A unicast address queries a single host.
    std::string discovery_address = "255.255.255.255";
    std::chrono::milliseconds discovery_interval {1000};
    std::chrono::milliseconds record_ttl {5000};

    std::string scheme = "ws";
    std::string path   = default_path;
    std::chrono::milliseconds open_timeout {10000};
    std::size_t max_queued_bytes = 16 * 1024 * 1024;

    ReconnectPolicy reconnect;
    /// Pause before discovery is retried after it failed to start or a record failed to resolve
    std::chrono::milliseconds discovery_retry_delay {2000};
    /// Consecutive discovery/resolution failures before automatic recovery gives up. 0 never gives up.
    int max_discovery_failures = 0;

    std::size_t message_buffer_capacity = 32;

    /// Applied by BackendConnector::create(); callers wiring their own collaborators set it themselves.
    logging::LogLevel log_level = logging::LogLevel::Info;

    /// Throws std::invalid_argument naming the first bad field.
    void validate() const;
};

} // namespace umelink
