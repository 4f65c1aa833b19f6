#pragma once

#include "umelink/net/connection/endpoint_resolver.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace umelink
{

/**
 * Resolves the advertised host of a record through the system resolver (DNS names or literals).
 *
 * Must be owned by a std::shared_ptr.
 */
class TcpEndpointResolver : public EndpointResolver, public std::enable_shared_from_this<TcpEndpointResolver>
{
public:
    explicit TcpEndpointResolver(boost::asio::io_context& io_context);

    TcpEndpointResolver(const TcpEndpointResolver&)            = delete;
    TcpEndpointResolver& operator=(const TcpEndpointResolver&) = delete;
    TcpEndpointResolver(TcpEndpointResolver&&)                 = delete;
    TcpEndpointResolver& operator=(TcpEndpointResolver&&)      = delete;

    bool async_resolve(const ServiceRecord& record, ResolveHandler handler) override;
    void cancel() override;

    std::size_t pending_count() const;

private:
    void handle_resolve(const std::string& name, const boost::system::error_code& error_code,
                        const boost::asio::ip::tcp::resolver::results_type& results);

    struct Pending
    {
        ServiceRecord record;
        ResolveHandler handler;
    };

    mutable std::mutex _mutex;
    boost::asio::io_context& _io_context;
    boost::asio::ip::tcp::resolver _resolver;
    std::map<std::string, Pending> _pending;
};

} // namespace umelink
