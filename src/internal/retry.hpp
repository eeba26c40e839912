#ifndef MCPMGR_INTERNAL_RETRY_HPP
#define MCPMGR_INTERNAL_RETRY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>

namespace mcpmgr
{
namespace internal
{

struct RetryPolicy
{
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_delay{10000};
};

// Delay after the given failed attempt (1-based):
// initial_delay * multiplier^(attempt-1), capped at max_delay
inline std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt)
{
    double factor = std::pow(policy.backoff_multiplier, std::max(0, attempt - 1));
    double delay_ms = static_cast<double>(policy.initial_delay.count()) * factor;
    double cap_ms = static_cast<double>(policy.max_delay.count());
    return std::chrono::milliseconds(static_cast<long long>(std::min(delay_ms, cap_ms)));
}

/**
 * Call fn until it succeeds or max_attempts calls have failed.
 *
 * sleep(delay) waits between attempts and returns false to abort early
 * (shutdown); on_retry(attempt, error) is told about each failure that will
 * be retried. The last failure is rethrown unchanged.
 */
template <typename Fn, typename Sleep, typename OnRetry>
auto retry_with_backoff(const RetryPolicy& policy, Fn&& fn, Sleep&& sleep, OnRetry&& on_retry)
    -> decltype(fn())
{
    const int attempts = std::max(1, policy.max_attempts);
    for (int attempt = 1;; ++attempt)
    {
        try
        {
            return fn();
        }
        catch (const std::exception& e)
        {
            if (attempt >= attempts)
                throw;

            on_retry(attempt, e);
            if (!sleep(backoff_delay(policy, attempt)))
                throw;
        }
    }
}

} // namespace internal
} // namespace mcpmgr

#endif // MCPMGR_INTERNAL_RETRY_HPP
