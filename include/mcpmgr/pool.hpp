#ifndef MCPMGR_POOL_HPP
#define MCPMGR_POOL_HPP

#include <cstddef>
#include <mcpmgr/config.hpp>
#include <mcpmgr/types.hpp>
#include <memory>
#include <optional>
#include <string>

namespace mcpmgr
{

/**
 * Per-server pools of ready ProtocolClient sessions.
 *
 * Acquire, release and eviction for one server are serialized; different
 * servers proceed independently. A pool never holds more than
 * max_connections entries per server, and get_client() fails fast with
 * PoolExhausted instead of queuing.
 *
 * Background health checks and idle cleanup run only between start() and
 * shutdown(); run_health_checks() and run_cleanup() perform one sweep
 * synchronously.
 */
class ConnectionPool
{
  public:
    explicit ConnectionPool(PoolOptions options = PoolOptions{});
    ~ConnectionPool();

    // No copy
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Start the health check and cleanup timers
    void start();
    // Stop timers and tear down every session. Idempotent.
    void shutdown();

    /// Idle healthy session, or a new one. The caller owns the lease until
    /// release_client(). Throws PoolExhausted at capacity, or the last
    /// connection error when creating a session failed.
    std::shared_ptr<ProtocolClient> get_client(const std::string& name,
                                               const ServerDescriptor& descriptor);

    void release_client(const std::string& name, const std::shared_ptr<ProtocolClient>& client);

    /// Create and release count sessions (min_connections by default)
    void prewarm(const std::string& name, const ServerDescriptor& descriptor,
                 std::optional<std::size_t> count = std::nullopt);

    // One health sweep: ping idle entries, evict repeated failures
    void run_health_checks();
    // One cleanup sweep: evict long-idle entries down to min_connections
    void run_cleanup();

    PoolStatistics statistics() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpmgr

#endif // MCPMGR_POOL_HPP
