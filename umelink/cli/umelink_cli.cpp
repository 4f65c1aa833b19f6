#include "umelink/cli/umelink_cli.hpp"
#include "umelink/logging/umelink_logging.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <iostream>
#include <limits>
#include <vector>

namespace umelink
{

namespace
{

int count_verbosity(const std::vector<std::string>& arguments)
{
    for (size_t i = 1; i < arguments.size(); ++i)
    {
        const std::string& argument = arguments[i];
        if (argument.size() >= 2 && argument[0] == '-' && argument[1] == 'v')
        {
            size_t v_count = 0;
            for (size_t j = 1; j < argument.size() && argument[j] == 'v'; ++j)
            {
                ++v_count;
            }

            if (v_count == argument.size() - 1)
            {
                return static_cast<int>(v_count);
            }
        }
    }
    return 0;
}

// NAME:HOST:PORT, the port after the last colon so an IPv6 host may contain colons.
AdvertisedEndpoint parse_advertised_endpoint(const std::string& text)
{
    namespace po = boost::program_options;

    const auto first_colon = text.find(':');
    const auto last_colon  = text.rfind(':');
    if (first_colon == std::string::npos || first_colon == last_colon || first_colon == 0)
    {
        throw po::error("--advertise expects NAME:HOST:PORT, got '" + text + "'");
    }

    AdvertisedEndpoint endpoint;
    endpoint.name = text.substr(0, first_colon);
    endpoint.host = text.substr(first_colon + 1, last_colon - first_colon - 1);
    if (endpoint.host.size() >= 2 && endpoint.host.front() == '[' && endpoint.host.back() == ']')
    {
        endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
    }

    const std::string port_text = text.substr(last_colon + 1);
    unsigned long port          = 0;
    try
    {
        size_t consumed = 0;
        port            = std::stoul(port_text, &consumed);
        if (consumed != port_text.size())
        {
            throw po::error("bad port");
        }
    }
    catch (const std::exception&)
    {
        throw po::error("--advertise port '" + port_text + "' is not a number");
    }

    if (endpoint.host.empty() || port == 0 || port > std::numeric_limits<std::uint16_t>::max())
    {
        throw po::error("--advertise needs a host and a port between 1 and 65535, got '" + text + "'");
    }
    endpoint.port = static_cast<std::uint16_t>(port);
    return endpoint;
}

} // namespace

CliConfig parse_command_line(int argc, const char* const argv[])
{
    namespace po = boost::program_options;

    CliConfig config;
    ConnectorConfig& connector = config.connector;

    po::options_description desc("umelink Options");
    // clang-format off
    desc.add_options()
        ("help,h", "Show help message")
        ("connect,c", "Find a backend and connect to it (default)")
        ("advertise,a", po::value<std::string>(), "Answer discovery requests for NAME:HOST:PORT (HOST may be 'auto')")
        ("type", po::value<std::string>()->default_value(connector.service_type), "Service type")
        ("prefix", po::value<std::string>()->default_value(connector.name_prefix), "Service name prefix")
        ("discovery-port", po::value<unsigned int>()->default_value(connector.discovery_port), "UDP discovery port")
        ("discovery-address", po::value<std::string>()->default_value(connector.discovery_address), "Where discovery requests are sent")
        ("path", po::value<std::string>()->default_value(connector.path), "Stream path on the backend")
        ("max-attempts", po::value<int>()->default_value(connector.reconnect.max_attempts), "Connection attempts before an endpoint is abandoned")
        ("initial-delay", po::value<long>()->default_value(static_cast<long>(connector.reconnect.initial_delay.count())), "First reconnect delay in ms")
        ("max-delay", po::value<long>()->default_value(static_cast<long>(connector.reconnect.max_delay.count())), "Reconnect delay cap in ms");
    // clang-format on

    std::vector<std::string> arguments;
    arguments.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i)
    {
        arguments.emplace_back(argv[i]);
    }

    const int verbosity = count_verbosity(arguments);

    po::variables_map variables;

    try
    {
        std::vector<std::string> options(arguments.begin() + (arguments.empty() ? 0 : 1), arguments.end());
        auto parser = po::command_line_parser(options).options(desc).allow_unregistered();

        po::store(parser.run(), variables);
        po::notify(variables);

        if (variables.count("help") != 0U)
        {
            std::cout << desc << '\n';
            std::cout << "\nVerbosity levels:\n"
                      << "  (none)  : Info level  - shows ERROR, WARNING and INFO messages\n"
                      << "  -v      : Debug level - adds DEBUG messages\n"
                      << "  -vv     : Trace level - shows all messages\n";
            config.help_requested = true;
            return config;
        }

        const bool wants_connect   = variables.count("connect") != 0U;
        const bool wants_advertise = variables.count("advertise") != 0U;
        if (wants_connect && wants_advertise)
        {
            throw po::error("Only one of --connect/--advertise may be specified.");
        }

        config.mode = wants_advertise ? CliMode::advertise : CliMode::connect;
        if (wants_advertise)
        {
            config.advertised = parse_advertised_endpoint(variables["advertise"].as<std::string>());
        }

        const unsigned int discovery_port = variables["discovery-port"].as<unsigned int>();
        if (discovery_port == 0 || discovery_port > std::numeric_limits<std::uint16_t>::max())
        {
            throw po::error("--discovery-port must be between 1 and 65535");
        }

        connector.service_type                = variables["type"].as<std::string>();
        connector.name_prefix                 = variables["prefix"].as<std::string>();
        connector.discovery_port              = static_cast<std::uint16_t>(discovery_port);
        connector.discovery_address           = variables["discovery-address"].as<std::string>();
        connector.path                        = variables["path"].as<std::string>();
        connector.reconnect.max_attempts      = variables["max-attempts"].as<int>();
        connector.reconnect.initial_delay     = std::chrono::milliseconds(variables["initial-delay"].as<long>());
        connector.reconnect.max_delay         = std::chrono::milliseconds(variables["max-delay"].as<long>());

        if (verbosity == 0)
        {
            connector.log_level = logging::LogLevel::Info;
        }
        else if (verbosity == 1)
        {
            connector.log_level = logging::LogLevel::Debug;
        }
        else
        {
            connector.log_level = logging::LogLevel::Trace;
        }

        connector.validate();

        UMELINK_LOG_DEBUG("Verbosity level: " << verbosity);
        UMELINK_LOG_DEBUG("Mode: " << (wants_advertise ? "advertise" : "connect"));
        UMELINK_LOG_TRACE("Command line arguments parsed successfully");
    }
    catch (const po::error& error)
    {
        UMELINK_LOG_ERROR("Error parsing command line: " << error.what());
        std::cerr << "Error: " << error.what() << '\n';
        std::cerr << desc << '\n';
        throw;
    }

    return config;
}

} // namespace umelink
