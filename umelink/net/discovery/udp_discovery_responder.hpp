#pragma once

#include "umelink/flags/flags.hpp"
#include "umelink/net/discovery/discovery_states.hpp"
#include "umelink/net/discovery/service_advertisement.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace umelink
{

/**
 * Answers discovery requests on a UDP port for the advertisements registered with it.
 *
 * A request carries a service type; every advertisement of that type replies to the sender.
 * Must be owned by a std::shared_ptr.
 */
class UdpDiscoveryResponder : public std::enable_shared_from_this<UdpDiscoveryResponder>
{
public:
    /// Binds immediately; throws boost::system::system_error if the port can't be bound. Port 0 picks a free port.
    UdpDiscoveryResponder(boost::asio::io_context& io_context, std::uint16_t port);
    ~UdpDiscoveryResponder();

    UdpDiscoveryResponder(const UdpDiscoveryResponder&)            = delete;
    UdpDiscoveryResponder& operator=(const UdpDiscoveryResponder&) = delete;
    UdpDiscoveryResponder(UdpDiscoveryResponder&&)                 = delete;
    UdpDiscoveryResponder& operator=(UdpDiscoveryResponder&&)      = delete;

    /// Start answering. Returns false if already listening, or if the port can't be reopened after stop().
    bool async_start();

    /// Stop answering and release the port. async_start() binds the same port again.
    void stop();

    bool is_listening() const;

    void add_advertisement(const ServiceAdvertisement& advertisement);

    std::uint16_t port() const;

    /// Number of replies sent so far.
    std::size_t reply_count() const;

private:
    void start_receive(std::uint64_t run);
    void handle_receive(std::uint64_t run, const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void handle_send(const boost::system::error_code& error_code);
    void close_socket();

    mutable std::mutex _mutex;

    boost::asio::io_context& _io_context;
    boost::asio::ip::udp::socket _socket;
    boost::asio::ip::udp::endpoint _remote_endpoint;
    std::uint16_t _port;

    static constexpr std::size_t recv_buffer_size = 1024;
    std::array<char, recv_buffer_size> _recv_buffer;
    std::vector<ServiceAdvertisement> _advertisements;
    std::size_t _reply_count = 0;
    /// Bumped by every start and stop; receive completions of an earlier run are dropped.
    std::uint64_t _run = 0;

    Flags<DiscoveryResponderState> _flags;
};

} // namespace umelink
