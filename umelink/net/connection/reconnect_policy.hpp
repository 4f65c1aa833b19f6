#pragma once

#include <chrono>
#include <optional>

namespace umelink
{

/**
 * Bounded exponential backoff for reconnecting to an endpoint that was reachable before.
 */
struct ReconnectPolicy
{
    static constexpr std::chrono::milliseconds default_initial_delay {2000};
    static constexpr std::chrono::milliseconds default_max_delay {15000};
    static constexpr double default_multiplier = 2.0;
    static constexpr int default_max_attempts  = 3;

    std::chrono::milliseconds initial_delay {default_initial_delay};
    double multiplier = default_multiplier;
    std::chrono::milliseconds max_delay {default_max_delay};
    int max_attempts = default_max_attempts;
};

/**
 * Delay before reconnect attempt @p attempt (1-based): min(initial * multiplier^(attempt-1), max_delay).
 * Attempts below 1 get the initial delay.
 */
std::chrono::milliseconds backoff_delay(const ReconnectPolicy& policy, int attempt);

/**
 * Counts consecutive reconnect attempts against one endpoint.
 */
class ReconnectCounter
{
public:
    explicit ReconnectCounter(ReconnectPolicy policy = ReconnectPolicy {});

    /**
     * Count one failed attempt.
     * @return the delay before trying again, or std::nullopt when this failure used up the last attempt
     */
    std::optional<std::chrono::milliseconds> next();

    void reset() { _attempts = 0; }

    int attempts() const { return _attempts; }
    bool exhausted() const { return _attempts >= _policy.max_attempts; }
    const ReconnectPolicy& policy() const { return _policy; }

private:
    ReconnectPolicy _policy;
    int _attempts = 0;
};

} // namespace umelink
