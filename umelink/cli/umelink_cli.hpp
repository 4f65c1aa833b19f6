#pragma once

#include "umelink/connector/connector_config.hpp"

#include <cstdint>
#include <string>

namespace umelink
{

enum class CliMode
{
    connect,
    advertise
};

/// Endpoint announced in advertise mode.
struct AdvertisedEndpoint
{
    std::string name;
    std::string host;
    std::uint16_t port = 0;
};

struct CliConfig
{
    CliMode mode = CliMode::connect;
    ConnectorConfig connector;
    AdvertisedEndpoint advertised;
    bool help_requested = false;
};

/**
 * Parse the umelink_cli command line.
 *
 * With --help the usage is printed and help_requested is set. Throws boost::program_options::error
 * on bad arguments and std::invalid_argument when the resulting connector config doesn't validate.
 */
CliConfig parse_command_line(int argc, const char* const argv[]);

} // namespace umelink
