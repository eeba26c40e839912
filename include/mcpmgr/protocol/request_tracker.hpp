#ifndef MCPMGR_PROTOCOL_REQUEST_TRACKER_HPP
#define MCPMGR_PROTOCOL_REQUEST_TRACKER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mcpmgr
{
namespace protocol
{

// Pending-request table - handles request/response correlation by id
class RequestTracker
{
  public:
    RequestTracker();
    ~RequestTracker();

    // No copy
    RequestTracker(const RequestTracker&) = delete;
    RequestTracker& operator=(const RequestTracker&) = delete;

    // Ids start at 1 and are never handed out twice
    std::int64_t next_id();

    // Register a waiter BEFORE the request is written.
    // Throws ConnectionClosed once the tracker was closed.
    std::future<nlohmann::json> register_request(std::int64_t id, const std::string& method);

    // Resolve with the "result" member. Returns the elapsed time since
    // registration, or nullopt when no waiter exists for the id (stray).
    std::optional<std::chrono::milliseconds> resolve(std::int64_t id,
                                                     const nlohmann::json& result);

    // Reject one waiter. Returns false when no waiter exists for the id.
    bool reject(std::int64_t id, std::exception_ptr error);

    // Drop a waiter without completing it (timeout or write failure).
    // Returns false when the waiter was already completed.
    bool cancel(std::int64_t id);

    // Reject every waiter with ConnectionClosed(reason) and refuse new ones
    // until reopen().
    void close(const std::string& reason);

    // Accept waiters again (new session)
    void reopen();

    bool is_closed() const;
    std::size_t pending_count() const;

  private:
    struct Pending
    {
        std::promise<nlohmann::json> promise;
        std::string method;
        std::chrono::steady_clock::time_point started;
    };

    std::atomic<std::int64_t> id_counter_{0};

    mutable std::mutex mutex_;
    std::map<std::int64_t, Pending> pending_;
    bool closed_ = false;
};

} // namespace protocol
} // namespace mcpmgr

#endif // MCPMGR_PROTOCOL_REQUEST_TRACKER_HPP
