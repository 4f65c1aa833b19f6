#include "umelink/cli/umelink_cli.hpp"
#include "umelink/connector/backend_connector.hpp"
#include "umelink/logging/umelink_logging.hpp"
#include "umelink/net/discovery/udp_discovery_responder.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/program_options/errors.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace
{

int run_connect(boost::asio::io_context& io_context, const umelink::CliConfig& config)
{
    auto connector = umelink::BackendConnector::create(io_context, config.connector);

    const auto observer = connector->state_observable().subscribe([](const umelink::ConnectionState& state)
                                                                  { std::cout << "state: " << state << std::endl; });
    auto messages = connector->subscribe_messages();

    std::atomic<bool> printing {true};
    std::thread printer(
        [&printing, messages]()
        {
            while (printing)
            {
                if (auto message = messages->receive_for(std::chrono::milliseconds(200)))
                {
                    std::cout << "<< " << *message << std::endl;
                }
            }
        });

    connector->start();

    std::string line;
    while (std::getline(std::cin, line))
    {
        if (!connector->send(line))
        {
            std::cout << "not connected (" << connector->state() << "), message dropped" << std::endl;
        }
    }

    connector->stop();
    connector->state_observable().unsubscribe(observer);
    printing = false;
    messages->close();
    printer.join();

    const umelink::ConnectorStats stats = connector->stats();
    UMELINK_LOG_INFO("sessions opened: " << stats.sessions_opened << ", messages received: " << stats.messages_received
                                         << ", sent: " << stats.messages_sent << ", dropped: " << stats.messages_dropped);
    return 0;
}

int run_advertise(boost::asio::io_context& io_context, const umelink::CliConfig& config)
{
    auto responder = std::make_shared<umelink::UdpDiscoveryResponder>(io_context, config.connector.discovery_port);
    responder->add_advertisement(umelink::ServiceAdvertisement::for_endpoint(io_context, config.connector.service_type, config.advertised.name,
                                                                             config.advertised.host, config.advertised.port));
    if (!responder->async_start())
    {
        UMELINK_LOG_ERROR("Discovery responder did not start");
        return 1;
    }

    std::cout << "Advertising " << config.advertised.name << " at " << config.advertised.host << ":" << config.advertised.port
              << ", press Enter to quit" << std::endl;
    std::string line;
    std::getline(std::cin, line);

    responder->stop();
    UMELINK_LOG_INFO("Answered " << responder->reply_count() << " discovery request(s)");
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    umelink::CliConfig config;
    try
    {
        config = umelink::parse_command_line(argc, argv);
    }
    catch (const boost::program_options::error&)
    {
        return 2;
    }
    catch (const std::invalid_argument& error)
    {
        std::cerr << "Error: " << error.what() << '\n';
        return 2;
    }

    if (config.help_requested)
    {
        return 0;
    }

    umelink::logging::current_log_level = config.connector.log_level;

    boost::asio::io_context io_context;
    auto work = boost::asio::make_work_guard(io_context);
    std::thread io_thread([&io_context]() { io_context.run(); });

    int result = 0;
    try
    {
        result = config.mode == umelink::CliMode::advertise ? run_advertise(io_context, config) : run_connect(io_context, config);
    }
    catch (const std::exception& error)
    {
        UMELINK_LOG_ERROR(error.what());
        result = 1;
    }

    work.reset();
    io_context.stop();
    io_thread.join();
    return result;
}
