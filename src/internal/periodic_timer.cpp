#include "periodic_timer.hpp"

#include <exception>

namespace mcpmgr
{
namespace internal
{

PeriodicTimer::PeriodicTimer(std::chrono::milliseconds interval, std::function<void()> tick,
                             const Logger& logger)
    : interval_(interval), tick_(std::move(tick)), logger_(logger)
{
}

PeriodicTimer::~PeriodicTimer()
{
    stop();
}

void PeriodicTimer::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_)
        return;

    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread(&PeriodicTimer::loop, this);
}

void PeriodicTimer::stop()
{
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        running_ = false;
        worker = std::move(thread_);
    }
    cv_.notify_all();

    if (!worker.joinable())
        return;

    // Stopping from inside a tick: the loop exits on its own after the tick
    if (worker.get_id() == std::this_thread::get_id())
        worker.detach();
    else
        worker.join();
}

bool PeriodicTimer::is_running() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void PeriodicTimer::loop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_)
    {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; }))
            break;

        lock.unlock();
        try
        {
            tick_();
        }
        catch (const std::exception& e)
        {
            logger_.warning(std::string("Timer tick failed: ") + e.what());
        }
        lock.lock();
    }
}

} // namespace internal
} // namespace mcpmgr
