#pragma once

#include "umelink/net/discovery/service_record.hpp"

#include <boost/system/error_code.hpp>

#include <functional>
#include <string>

namespace umelink
{

/**
 * Callbacks a discovery scan reports through. They are invoked from the io_context.
 */
struct DiscoveryHandlers
{
    std::function<void(const ServiceRecord& record)> on_found;
    std::function<void(const std::string& name)> on_lost;
    /// The scan could not start, or ended on an error. No further callbacks follow.
    std::function<void(const boost::system::error_code& error_code)> on_failed;
};

/**
 * Scans the local network for backend instances of one service type.
 */
class DiscoveryClient
{
public:
    virtual ~DiscoveryClient() = default;

    /**
     * Begin scanning.
     * @return false if a scan is already active, in which case nothing changes
     */
    virtual bool async_start(DiscoveryHandlers handlers) = 0;

    /**
     * Cancel the active scan. No callback of that scan runs after this returns. No-op when inactive.
     */
    virtual void stop() = 0;

    virtual bool is_active() const = 0;
};

} // namespace umelink
