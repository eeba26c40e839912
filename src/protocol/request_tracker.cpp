#include <mcpmgr/errors.hpp>
#include <mcpmgr/protocol/request_tracker.hpp>

namespace mcpmgr
{
namespace protocol
{

RequestTracker::RequestTracker() {}

RequestTracker::~RequestTracker()
{
    close("Request tracker shutting down");
}

std::int64_t RequestTracker::next_id()
{
    return ++id_counter_;
}

std::future<nlohmann::json> RequestTracker::register_request(std::int64_t id,
                                                             const std::string& method)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_)
        throw ConnectionClosed("Cannot send " + method + ": connection is closed");

    Pending pending;
    pending.method = method;
    pending.started = std::chrono::steady_clock::now();
    auto future = pending.promise.get_future();

    pending_.emplace(id, std::move(pending));

    return future;
}

std::optional<std::chrono::milliseconds> RequestTracker::resolve(std::int64_t id,
                                                                 const nlohmann::json& result)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = pending_.find(id);
    if (it == pending_.end())
        return std::nullopt;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - it->second.started);
    it->second.promise.set_value(result);
    pending_.erase(it);
    return elapsed;
}

bool RequestTracker::reject(std::int64_t id, std::exception_ptr error)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = pending_.find(id);
    if (it == pending_.end())
        return false;

    it->second.promise.set_exception(error);
    pending_.erase(it);
    return true;
}

bool RequestTracker::cancel(std::int64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.erase(id) > 0;
}

void RequestTracker::close(const std::string& reason)
{
    std::map<std::int64_t, Pending> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        failed.swap(pending_);
    }

    for (auto& [id, pending] : failed)
        pending.promise.set_exception(std::make_exception_ptr(ConnectionClosed(reason)));
}

void RequestTracker::reopen()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

bool RequestTracker::is_closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t RequestTracker::pending_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace protocol
} // namespace mcpmgr
