#ifndef MCPMGR_EVENTS_HPP
#define MCPMGR_EVENTS_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <vector>

namespace mcpmgr
{

/**
 * Per-instance event channel.
 *
 * Every ProtocolClient, HealthMonitor and ConnectionPool owns its own
 * signals; there is no process-wide event bus. Handlers run on the thread
 * that emits (usually a reader or timer thread) and must not block for long.
 * A handler may disconnect itself; emit() works on a snapshot of the
 * handler list taken under the lock.
 */
template <typename Event>
class Signal
{
  public:
    using Handler = std::function<void(const Event&)>;
    using Connection = std::size_t;

    Signal() = default;

    // No copy
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    Connection connect(Handler handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Connection id = next_id_++;
        handlers_.emplace(id, std::move(handler));
        return id;
    }

    void disconnect(Connection id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(id);
    }

    void disconnect_all()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.clear();
    }

    std::size_t handler_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

    void emit(const Event& event) const
    {
        std::vector<Handler> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(handlers_.size());
            for (const auto& [id, handler] : handlers_)
                snapshot.push_back(handler);
        }

        for (const auto& handler : snapshot)
        {
            try
            {
                handler(event);
            }
            catch (const std::exception& e)
            {
                // A failing observer must not take down the emitting thread
                std::cerr << "Warning: event handler threw: " << e.what() << std::endl;
            }
        }
    }

  private:
    mutable std::mutex mutex_;
    std::map<Connection, Handler> handlers_;
    Connection next_id_ = 1;
};

} // namespace mcpmgr

#endif // MCPMGR_EVENTS_HPP
