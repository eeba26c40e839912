#ifndef MCPMGR_CONFIG_HPP
#define MCPMGR_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mcpmgr/types.hpp>
#include <optional>
#include <string>

namespace mcpmgr
{

class ProtocolClient;

// ============================================================================
// Protocol client
// ============================================================================

struct ClientOptions
{
    // Timeouts
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds shutdown_grace{5000};

    // Automatic reconnect after an unexpected non-zero exit (linear backoff)
    bool auto_reconnect = true;
    int max_reconnect_attempts = 3;
    std::chrono::milliseconds reconnect_base_delay{1000};

    // initialize parameters
    std::string protocol_version = "2024-11-05";
    std::string client_name = "mcpmgr";
    std::string client_version; // defaults to version_string()

    // Subprocess environment: inherit the parent's before applying the descriptor's env
    bool inherit_environment = true;

    // Largest single line accepted from the server (1MB)
    std::size_t max_line_size = 1024 * 1024;

    // Server stderr lines; inherited by the child when unset
    std::optional<std::function<void(const std::string&)>> stderr_callback;

    std::optional<LogCallback> log_callback;
};

/// Creates an unconnected client for a descriptor. Consumers call connect().
using ClientFactory =
    std::function<std::shared_ptr<ProtocolClient>(const ServerDescriptor&, const ClientOptions&)>;

/// Default factory: ProtocolClient over a subprocess transport
ClientFactory default_client_factory();

// ============================================================================
// Capability inspector
// ============================================================================

struct InspectorOptions
{
    // Servers inspected in parallel by inspect_many()
    std::size_t batch_size = 3;

    // Age after which a cached snapshot is inspected again. Unset: entries
    // live until clear_cache() or a forced refresh.
    std::optional<std::chrono::milliseconds> cache_ttl;

    ClientOptions client_options;
    ClientFactory client_factory;

    std::optional<LogCallback> log_callback;
};

// ============================================================================
// Health monitor
// ============================================================================

struct MonitorOptions
{
    std::chrono::milliseconds ping_interval{30000};
    int max_error_count = 3;

    // Smart refresh
    std::chrono::milliseconds fresh_window{5 * 60 * 1000};
    std::chrono::milliseconds backoff_unit{60 * 1000};
    std::chrono::milliseconds max_backoff{30 * 60 * 1000};
    std::size_t refresh_batch_size = 3;
    std::chrono::milliseconds refresh_batch_delay{500};
    std::chrono::milliseconds refresh_timeout{10000};

    ClientOptions client_options;
    ClientFactory client_factory;

    // Wall clock used for lastPing/backoff decisions; Clock::now when unset
    std::function<TimePoint()> now;

    std::optional<LogCallback> log_callback;
};

// ============================================================================
// Connection pool
// ============================================================================

struct PoolOptions
{
    std::size_t max_connections = 10;
    std::size_t min_connections = 2;
    std::chrono::milliseconds connection_timeout{30000};
    std::chrono::milliseconds idle_timeout{5 * 60 * 1000};
    std::chrono::milliseconds health_check_interval{60000};
    std::chrono::milliseconds cleanup_interval{60000};

    // Session creation retry (exponential backoff)
    int max_retries = 3;
    std::chrono::milliseconds retry_initial_delay{1000};
    double retry_backoff_multiplier = 2.0;
    std::chrono::milliseconds retry_max_delay{10000};

    // Consecutive failed health pings before an idle entry is evicted
    int max_health_failures = 3;

    ClientOptions client_options;
    ClientFactory client_factory;

    std::optional<LogCallback> log_callback;
};

// ============================================================================
// Environment overrides
// ============================================================================
//
// Invalid or non-positive values are ignored and the base value is kept.
//
//   MCPMGR_REQUEST_TIMEOUT_MS       ClientOptions::request_timeout
//   MCPMGR_CONNECT_TIMEOUT_MS       ClientOptions::connect_timeout
//   MCPMGR_SHUTDOWN_GRACE_MS        ClientOptions::shutdown_grace
//   MCPMGR_MAX_RECONNECT_ATTEMPTS   ClientOptions::max_reconnect_attempts
//   MCPMGR_PING_INTERVAL_MS         MonitorOptions::ping_interval
//   MCPMGR_POOL_MAX_CONNECTIONS     PoolOptions::max_connections
//   MCPMGR_POOL_MIN_CONNECTIONS     PoolOptions::min_connections
//   MCPMGR_POOL_IDLE_TIMEOUT_MS     PoolOptions::idle_timeout

ClientOptions client_options_from_env(ClientOptions base = ClientOptions{});
MonitorOptions monitor_options_from_env(MonitorOptions base = MonitorOptions{});
PoolOptions pool_options_from_env(PoolOptions base = PoolOptions{});

} // namespace mcpmgr

#endif // MCPMGR_CONFIG_HPP
