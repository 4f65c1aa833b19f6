#include "umelink/net/connection/reconnect_policy.hpp"

#include <algorithm>
#include <cmath>

namespace umelink
{

std::chrono::milliseconds backoff_delay(const ReconnectPolicy& policy, int attempt)
{
    if (attempt <= 1)
    {
        return std::min(policy.initial_delay, policy.max_delay);
    }

    const double scaled = static_cast<double>(policy.initial_delay.count()) * std::pow(policy.multiplier, attempt - 1);
    if (scaled >= static_cast<double>(policy.max_delay.count()))
    {
        return policy.max_delay;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(scaled));
}

ReconnectCounter::ReconnectCounter(ReconnectPolicy policy) : _policy(policy)
{
}

std::optional<std::chrono::milliseconds> ReconnectCounter::next()
{
    if (_attempts < _policy.max_attempts)
    {
        ++_attempts;
    }
    if (exhausted())
    {
        return std::nullopt;
    }
    return backoff_delay(_policy, _attempts);
}

} // namespace umelink
