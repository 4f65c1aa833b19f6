#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>
#include <optional>
#include <string>

namespace umelink
{

/**
 * The local address the OS would pick to send to @p remote_endpoint.
 *
 * Used to fill in an "auto" host in discovery replies, so a multi-homed backend answers each
 * requester with an address on the requester's network. Only local kernel calls are made; nothing
 * is sent. Returns std::nullopt (and logs why) when no route exists.
 */
std::optional<boost::asio::ip::address> local_address_towards(boost::asio::io_context& io_context,
                                                              const boost::asio::ip::udp::endpoint& remote_endpoint);

/**
 * Wrap IPv6 literals in brackets so they can be followed by ":port".
 */
std::string format_host_for_url(const std::string& host);

} // namespace umelink
