#include "umelink/net/connection/tcp_endpoint_resolver.hpp"

#include "umelink/logging/umelink_logging.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <string>
#include <utility>

namespace umelink
{

TcpEndpointResolver::TcpEndpointResolver(boost::asio::io_context& io_context) : _io_context(io_context), _resolver(io_context)
{
}

bool TcpEndpointResolver::async_resolve(const ServiceRecord& record, ResolveHandler handler)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_pending.count(record.name) != 0)
    {
        UMELINK_LOG_WARNING("Resolution of '" << record.name << "' already in progress, ignoring");
        return false;
    }

    if (record.advertised_host.empty() || record.advertised_port == 0)
    {
        UMELINK_LOG_ERROR("Record " << record << " has no usable host/port");
        boost::asio::post(_io_context, [handler = std::move(handler), record]()
                          { handler(boost::asio::error::make_error_code(boost::asio::error::invalid_argument), record); });
        return true;
    }

    _pending.emplace(record.name, Pending {record, std::move(handler)});
    UMELINK_LOG_DEBUG("Resolving " << record);

    const std::string name = record.name;
    _resolver.async_resolve(record.advertised_host, std::to_string(record.advertised_port),
                            boost::asio::ip::resolver_base::numeric_service,
                            [self = shared_from_this(), name](const boost::system::error_code& error_code,
                                                              boost::asio::ip::tcp::resolver::results_type results)
                            { self->handle_resolve(name, error_code, results); });
    return true;
}

void TcpEndpointResolver::cancel()
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (!_pending.empty())
    {
        _resolver.cancel();
    }
}

std::size_t TcpEndpointResolver::pending_count() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _pending.size();
}

void TcpEndpointResolver::handle_resolve(const std::string& name, const boost::system::error_code& error_code,
                                         const boost::asio::ip::tcp::resolver::results_type& results)
{
    std::unique_lock<std::mutex> lock(_mutex);
    auto iter = _pending.find(name);
    if (iter == _pending.end())
    {
        return;
    }
    Pending pending = std::move(iter->second);
    _pending.erase(iter);
    lock.unlock();

    ServiceRecord& record = pending.record;
    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            UMELINK_LOG_INFO("Resolve operation aborted by user");
        }
        else
        {
            UMELINK_LOG_ERROR("Failed to resolve '" << record.advertised_host << "' - " << error_code.message());
        }
        pending.handler(error_code, record);
        return;
    }

    if (results.empty())
    {
        UMELINK_LOG_ERROR("Resolving '" << record.advertised_host << "' returned no addresses");
        pending.handler(boost::asio::error::make_error_code(boost::asio::error::host_not_found), record);
        return;
    }

    const boost::asio::ip::tcp::endpoint endpoint = results.begin()->endpoint();
    record.resolved                               = true;
    record.host                                   = endpoint.address().to_string();
    record.port                                   = endpoint.port();
    UMELINK_LOG_DEBUG("Resolved " << record);
    pending.handler(error_code, record);
}

} // namespace umelink
