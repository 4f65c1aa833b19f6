#pragma once

#include "umelink/flags/flags.hpp"
#include "umelink/net/discovery/discovery_client.hpp"
#include "umelink/net/discovery/discovery_states.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace umelink
{

/**
 * Broadcast request/reply discovery.
 *
 * Every retry timeout the service type is broadcast to the discovery port. Responders answer with
 * "TYPE:NAME:HOST:PORT" (see DiscoveryString). Replies for another type or with a name that doesn't
 * start with the prefix are ignored. A name that isn't heard from again within the record ttl is
 * reported lost.
 *
 * Must be owned by a std::shared_ptr; pending operations keep the client alive.
 */
class UdpDiscoveryClient : public DiscoveryClient, public std::enable_shared_from_this<UdpDiscoveryClient>
{
public:
    static constexpr const char* default_broadcast_address = "255.255.255.255";

    UdpDiscoveryClient(boost::asio::io_context& io_context, const std::string& service_type, const std::string& name_prefix,
                       std::uint16_t destination_port, std::chrono::milliseconds retry_timeout, std::chrono::milliseconds record_ttl);

    ~UdpDiscoveryClient() override;

    UdpDiscoveryClient(const UdpDiscoveryClient&)            = delete;
    UdpDiscoveryClient& operator=(const UdpDiscoveryClient&) = delete;
    UdpDiscoveryClient(UdpDiscoveryClient&&)                 = delete;
    UdpDiscoveryClient& operator=(UdpDiscoveryClient&&)      = delete;

    bool async_start(DiscoveryHandlers handlers) override;
    void stop() override;
    bool is_active() const override;

    /// Send requests to this address instead of the limited broadcast address. Takes effect on the next start.
    void set_destination_address(const boost::asio::ip::address& address);

    /// Names currently known, for diagnostics.
    std::size_t known_record_count() const;

    std::string to_string() const;

private:
    using Clock = std::chrono::steady_clock;

    void open_socket(boost::system::error_code& error_code);
    void async_receive(std::uint64_t scan);
    void send_discovery_request(std::uint64_t scan);
    void handle_send_complete(std::uint64_t scan, const boost::system::error_code& error_code);
    void handle_response(std::uint64_t scan, const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void handle_timeout(std::uint64_t scan, const boost::system::error_code& error_code);
    void arm_timer(std::uint64_t scan);
    void expire_records();
    void fail_scan(const boost::system::error_code& error_code);
    bool qualifies(const std::string& type, const std::string& name) const;

    mutable std::mutex _mutex;

    boost::asio::io_context& _io_context;
    std::string _service_type;
    std::string _name_prefix;
    boost::asio::ip::udp::socket _socket;
    boost::asio::ip::udp::endpoint _remote_endpoint;
    boost::asio::ip::address _destination_address;
    std::uint16_t _destination_port;
    /// Size of the receive buffer in bytes.
    static constexpr std::size_t recv_buffer_size = 1024;
    std::array<char, recv_buffer_size> _recv_buffer;
    std::chrono::milliseconds _retry_timeout;
    std::chrono::milliseconds _record_ttl;
    boost::asio::steady_timer _timer;

    DiscoveryHandlers _handlers;
    std::map<std::string, Clock::time_point> _last_seen;
    std::uint64_t _scan = 0;

    Flags<UdpDiscoveryState> _flags;
};

} // namespace umelink
