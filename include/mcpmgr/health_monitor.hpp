#ifndef MCPMGR_HEALTH_MONITOR_HPP
#define MCPMGR_HEALTH_MONITOR_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <mcpmgr/config.hpp>
#include <mcpmgr/events.hpp>
#include <mcpmgr/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpmgr
{

/**
 * Live status of actively used servers.
 *
 * Each monitored server gets its own session and a periodic ping timer.
 * schedule_smart_refresh() revalidates a set of servers in the background
 * while skipping fresh servers and servers inside their backoff window.
 *
 * State per server:
 *   connecting -> connected <-> error -> disconnected
 * error is not terminal: a successful ping returns the server to connected.
 */
class HealthMonitor
{
  public:
    explicit HealthMonitor(MonitorOptions options = MonitorOptions{});
    ~HealthMonitor();

    // No copy
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /// Connects and starts pinging. Throws if the connection fails; the
    /// status is left in error in that case.
    void start_monitoring(const std::string& name, const ServerDescriptor& descriptor);
    void stop_monitoring(const std::string& name);
    void stop_all();

    /// One ping probe. Driven by the timer; callable directly.
    void ping_server(const std::string& name);

    /// Background revalidation of servers that need it. Never throws for
    /// server failures.
    void schedule_smart_refresh(const std::map<std::string, ServerDescriptor>& descriptors);

    std::optional<ConnectionStatus> get_connection_status(const std::string& name) const;
    std::vector<ConnectionStatus> get_all_connection_statuses() const;
    std::size_t get_connected_count() const;
    std::chrono::milliseconds get_average_response_time() const;
    std::optional<ClientMetrics> get_real_metrics(const std::string& name) const;
    std::vector<std::string> get_servers_needing_refresh() const;
    std::optional<HealthRecord> get_health_record(const std::string& name) const;

    /// Whether smart refresh would probe a server with this record now
    bool is_refresh_due(const std::string& name) const;

    Signal<ConnectionStatus>& status_changes();
    Signal<MonitorEvent>& events();

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// min(max_backoff, 2^error_count * unit)
std::chrono::milliseconds refresh_backoff(int error_count,
                                          std::chrono::milliseconds unit = std::chrono::minutes(1),
                                          std::chrono::milliseconds max_backoff =
                                              std::chrono::minutes(30));

} // namespace mcpmgr

#endif // MCPMGR_HEALTH_MONITOR_HPP
