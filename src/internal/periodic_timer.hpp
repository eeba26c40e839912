#ifndef MCPMGR_INTERNAL_PERIODIC_TIMER_HPP
#define MCPMGR_INTERNAL_PERIODIC_TIMER_HPP

#include "logging.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace mcpmgr
{
namespace internal
{

/**
 * Runs a callback every interval on a background thread.
 *
 * The first tick happens one interval after start(). Ticks never overlap;
 * a slow tick delays the next one. stop() wakes the thread and joins it,
 * waiting for a running tick to finish.
 */
class PeriodicTimer
{
  public:
    PeriodicTimer(std::chrono::milliseconds interval, std::function<void()> tick,
                  const Logger& logger);
    ~PeriodicTimer();

    // No copy
    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    void start();
    void stop();
    bool is_running() const;

  private:
    void loop();

    std::chrono::milliseconds interval_;
    std::function<void()> tick_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool running_ = false;
    std::thread thread_;
};

} // namespace internal
} // namespace mcpmgr

#endif // MCPMGR_INTERNAL_PERIODIC_TIMER_HPP
