#include "umelink/net/discovery/udp_discovery_client.hpp"
#include "umelink/net/discovery/udp_discovery_responder.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace umelink;
using namespace std::chrono_literals;

namespace
{

constexpr const char* service_type = "_umebotlogics._tcp";

} // namespace

class UdpDiscoveryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        responder = std::make_shared<UdpDiscoveryResponder>(io_context, 0);
        ASSERT_NE(responder->port(), 0);
    }

    std::shared_ptr<UdpDiscoveryClient> make_client(std::chrono::milliseconds record_ttl = 5000ms)
    {
        auto client = std::make_shared<UdpDiscoveryClient>(io_context, service_type, "UmebotLogicsWebSocket", responder->port(), 20ms,
                                                           record_ttl);
        client->set_destination_address(boost::asio::ip::make_address("127.0.0.1"));
        return client;
    }

    DiscoveryHandlers handlers()
    {
        DiscoveryHandlers result;
        result.on_found  = [this](const ServiceRecord& record) { found.push_back(record); };
        result.on_lost   = [this](const std::string& name) { lost.push_back(name); };
        result.on_failed = [this](const boost::system::error_code& error_code) { failures.push_back(error_code); };
        return result;
    }

    bool run_until(const std::function<bool()>& predicate)
    {
        const auto deadline = std::chrono::steady_clock::now() + 3s;
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() > deadline)
            {
                return false;
            }
            io_context.restart();
            io_context.run_for(5ms);
        }
        return true;
    }

    boost::asio::io_context io_context;
    std::shared_ptr<UdpDiscoveryResponder> responder;
    std::vector<ServiceRecord> found;
    std::vector<std::string> lost;
    std::vector<boost::system::error_code> failures;
};

TEST_F(UdpDiscoveryTest, FindsMatchingServiceOnce)
{
    responder->add_advertisement(ServiceAdvertisement::for_endpoint(io_context, service_type, "UmebotLogicsWebSocket-1", "10.0.0.5", 9000));
    ASSERT_TRUE(responder->async_start());

    auto client = make_client();
    ASSERT_TRUE(client->async_start(handlers()));
    EXPECT_TRUE(client->is_active());
    EXPECT_FALSE(client->async_start(handlers()));

    ASSERT_TRUE(run_until([this]() { return !found.empty(); }));
    // Let a few more request rounds pass; the same name isn't reported again
    ASSERT_TRUE(run_until([this]() { return responder->reply_count() >= 3; }));

    ASSERT_EQ(found.size(), 1U);
    EXPECT_EQ(found.front().name, "UmebotLogicsWebSocket-1");
    EXPECT_EQ(found.front().type, service_type);
    EXPECT_FALSE(found.front().resolved);
    EXPECT_EQ(found.front().advertised_host, "10.0.0.5");
    EXPECT_EQ(found.front().advertised_port, 9000);
    EXPECT_EQ(client->known_record_count(), 1U);
    EXPECT_TRUE(failures.empty());
    EXPECT_NE(client->to_string().find("running"), std::string::npos);

    client->stop();
    EXPECT_FALSE(client->is_active());
    EXPECT_EQ(client->to_string(), "UdpDiscoveryClient flags: []");
    responder->stop();
}

TEST_F(UdpDiscoveryTest, IgnoresOtherNamesAndTypes)
{
    responder->add_advertisement(ServiceAdvertisement::for_endpoint(io_context, service_type, "SomethingElse", "10.0.0.6", 9000));
    responder->add_advertisement(ServiceAdvertisement::for_endpoint(io_context, "_other._tcp", "UmebotLogicsWebSocket-2", "10.0.0.7", 9000));
    responder->add_advertisement(ServiceAdvertisement::for_endpoint(io_context, service_type, "UmebotLogicsWebSocket-3", "10.0.0.8", 9000));
    ASSERT_TRUE(responder->async_start());

    auto client = make_client();
    ASSERT_TRUE(client->async_start(handlers()));
    ASSERT_TRUE(run_until([this]() { return !found.empty(); }));
    ASSERT_TRUE(run_until([this]() { return responder->reply_count() >= 6; }));

    ASSERT_EQ(found.size(), 1U);
    EXPECT_EQ(found.front().name, "UmebotLogicsWebSocket-3");

    client->stop();
    responder->stop();
}

TEST_F(UdpDiscoveryTest, SilentServiceIsReportedLost)
{
    responder->add_advertisement(ServiceAdvertisement::for_endpoint(io_context, service_type, "UmebotLogicsWebSocket-1", "10.0.0.5", 9000));
    ASSERT_TRUE(responder->async_start());

    auto client = make_client(100ms);
    ASSERT_TRUE(client->async_start(handlers()));
    ASSERT_TRUE(run_until([this]() { return found.size() == 1; }));

    responder->stop();
    ASSERT_TRUE(run_until([this]() { return !lost.empty(); }));
    EXPECT_EQ(lost.front(), "UmebotLogicsWebSocket-1");
    EXPECT_EQ(client->known_record_count(), 0U);
    EXPECT_TRUE(client->is_active());

    client->stop();
}

TEST_F(UdpDiscoveryTest, StoppedClientReportsNothing)
{
    responder->add_advertisement(ServiceAdvertisement::for_endpoint(io_context, service_type, "UmebotLogicsWebSocket-1", "10.0.0.5", 9000));
    ASSERT_TRUE(responder->async_start());

    auto client = make_client();
    ASSERT_TRUE(client->async_start(handlers()));
    client->stop();

    io_context.restart();
    io_context.run_for(100ms);
    EXPECT_TRUE(found.empty());
    EXPECT_TRUE(failures.empty());

    // A stopped client can scan again
    ASSERT_TRUE(client->async_start(handlers()));
    ASSERT_TRUE(run_until([this]() { return found.size() == 1; }));

    client->stop();
    responder->stop();
}

TEST_F(UdpDiscoveryTest, StoppedResponderCanListenAgain)
{
    responder->add_advertisement(ServiceAdvertisement::for_endpoint(io_context, service_type, "UmebotLogicsWebSocket-1", "10.0.0.5", 9000));
    ASSERT_TRUE(responder->async_start());
    EXPECT_FALSE(responder->async_start());
    responder->stop();
    EXPECT_FALSE(responder->is_listening());

    // Let the aborted receive of the first run complete before listening again
    io_context.restart();
    io_context.run_for(20ms);

    ASSERT_TRUE(responder->async_start());
    EXPECT_TRUE(responder->is_listening());

    auto client = make_client();
    ASSERT_TRUE(client->async_start(handlers()));
    ASSERT_TRUE(run_until([this]() { return found.size() == 1; }));
    EXPECT_EQ(found.front().name, "UmebotLogicsWebSocket-1");

    client->stop();
    responder->stop();
}

TEST(ServiceAdvertisementTest, FixedEndpointReply)
{
    boost::asio::io_context io_context;
    auto advertisement = ServiceAdvertisement::for_endpoint(io_context, service_type, "Robot", "robot.local", 8080);

    EXPECT_EQ(advertisement.get_service_type(), service_type);
    EXPECT_EQ(advertisement.get_service_name(), "Robot");
    EXPECT_EQ(advertisement.get_reply(boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 5000)),
              "_umebotlogics._tcp:Robot:robot.local:8080");
}

TEST(ServiceAdvertisementTest, AutoHostUsesRoutableLocalAddress)
{
    boost::asio::io_context io_context;
    auto advertisement = ServiceAdvertisement::for_endpoint(io_context, service_type, "Robot", "auto", 8080);

    EXPECT_EQ(advertisement.get_reply(boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 5000)),
              "_umebotlogics._tcp:Robot:127.0.0.1:8080");
}
