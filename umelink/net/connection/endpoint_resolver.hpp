#pragma once

#include "umelink/net/discovery/service_record.hpp"

#include <boost/system/error_code.hpp>

#include <functional>

namespace umelink
{

/**
 * Turns a found service record into a connectable host and port.
 */
class EndpointResolver
{
public:
    /// On success the record comes back with resolved set and host/port filled in.
    using ResolveHandler = std::function<void(const boost::system::error_code& error_code, const ServiceRecord& record)>;

    virtual ~EndpointResolver() = default;

    /**
     * Start resolving a record. The handler runs on the io_context.
     * @return false if a resolution of a record with the same name is still pending; the request is ignored
     */
    virtual bool async_resolve(const ServiceRecord& record, ResolveHandler handler) = 0;

    /// Abandon all pending resolutions; their handlers get operation_aborted.
    virtual void cancel() = 0;
};

} // namespace umelink
