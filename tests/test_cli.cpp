#include "umelink/cli/umelink_cli.hpp"

#include <boost/program_options/errors.hpp>
#include <gtest/gtest.h>

#include <vector>

using namespace umelink;

namespace
{

CliConfig parse(std::vector<const char*> arguments)
{
    arguments.insert(arguments.begin(), "umelink_cli");
    return parse_command_line(static_cast<int>(arguments.size()), arguments.data());
}

} // namespace

TEST(CliTest, DefaultsToConnectMode)
{
    const CliConfig config = parse({});
    EXPECT_EQ(config.mode, CliMode::connect);
    EXPECT_FALSE(config.help_requested);
    EXPECT_EQ(config.connector.service_type, ConnectorConfig::default_service_type);
    EXPECT_EQ(config.connector.log_level, logging::LogLevel::Info);
}

TEST(CliTest, ConnectOptions)
{
    const CliConfig config = parse({"--connect", "--type", "_robot._tcp", "--prefix", "Robot", "--discovery-port", "5000", "--path",
                                    "stream", "--max-attempts", "5", "--initial-delay", "100", "--max-delay", "1000", "-vv"});
    EXPECT_EQ(config.mode, CliMode::connect);
    EXPECT_EQ(config.connector.service_type, "_robot._tcp");
    EXPECT_EQ(config.connector.name_prefix, "Robot");
    EXPECT_EQ(config.connector.discovery_port, 5000);
    EXPECT_EQ(config.connector.path, "stream");
    EXPECT_EQ(config.connector.reconnect.max_attempts, 5);
    EXPECT_EQ(config.connector.reconnect.initial_delay, std::chrono::milliseconds(100));
    EXPECT_EQ(config.connector.reconnect.max_delay, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.connector.log_level, logging::LogLevel::Trace);
}

TEST(CliTest, SingleVerboseFlagSelectsDebug)
{
    EXPECT_EQ(parse({"-v"}).connector.log_level, logging::LogLevel::Debug);
}

TEST(CliTest, AdvertiseEndpoint)
{
    const CliConfig config = parse({"--advertise", "UmebotLogicsWebSocket-1:10.0.0.5:9000"});
    EXPECT_EQ(config.mode, CliMode::advertise);
    EXPECT_EQ(config.advertised.name, "UmebotLogicsWebSocket-1");
    EXPECT_EQ(config.advertised.host, "10.0.0.5");
    EXPECT_EQ(config.advertised.port, 9000);
}

TEST(CliTest, AdvertiseIpv6Endpoint)
{
    const CliConfig config = parse({"-a", "Robot:[fe80::1]:9000"});
    EXPECT_EQ(config.advertised.host, "fe80::1");
    EXPECT_EQ(config.advertised.port, 9000);
}

TEST(CliTest, RejectsBadArguments)
{
    EXPECT_THROW(parse({"--advertise", "Robot"}), boost::program_options::error);
    EXPECT_THROW(parse({"--advertise", "Robot:10.0.0.5:http"}), boost::program_options::error);
    EXPECT_THROW(parse({"--advertise", "Robot:10.0.0.5:0"}), boost::program_options::error);
    EXPECT_THROW(parse({"--connect", "--advertise", "Robot:10.0.0.5:80"}), boost::program_options::error);
    EXPECT_THROW(parse({"--discovery-port", "70000"}), boost::program_options::error);
}

TEST(CliTest, InvalidConnectorSettingsAreRejected)
{
    EXPECT_THROW(parse({"--max-attempts", "0"}), std::invalid_argument);
}

TEST(CliTest, HelpIsReported)
{
    EXPECT_TRUE(parse({"--help"}).help_requested);
}
