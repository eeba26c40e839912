#include "internal/logging.hpp"
#include "internal/periodic_timer.hpp"

#include <algorithm>
#include <condition_variable>
#include <future>
#include <mcpmgr/client.hpp>
#include <mcpmgr/errors.hpp>
#include <mcpmgr/health_monitor.hpp>
#include <mutex>

namespace mcpmgr
{

std::chrono::milliseconds refresh_backoff(int error_count, std::chrono::milliseconds unit,
                                          std::chrono::milliseconds max_backoff)
{
    std::chrono::milliseconds backoff = unit;
    for (int i = 0; i < error_count && backoff < max_backoff; ++i)
        backoff *= 2;
    return std::min(backoff, max_backoff);
}

namespace
{
struct Monitored
{
    std::shared_ptr<ProtocolClient> client;
    Signal<ClientEvent>::Connection subscription = 0;
    std::unique_ptr<internal::PeriodicTimer> timer;
    ConnectionStatus status;
};
} // namespace

class HealthMonitor::Impl
{
  public:
    MonitorOptions options_;
    ClientFactory factory_;
    internal::Logger logger_;

    Signal<ConnectionStatus> status_changes_;
    Signal<MonitorEvent> events_;

    // Guards servers_ and records_
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Monitored>> servers_;
    // Outlives stop/start so the refresh backoff keeps growing
    std::map<std::string, HealthRecord> records_;

    // Serializes start/stop per name
    std::mutex name_locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> name_locks_;

    std::mutex shutdown_mutex_;
    std::condition_variable shutdown_cv_;
    bool shutting_down_ = false;

    explicit Impl(MonitorOptions options)
        : options_(std::move(options)), logger_("ConnectionMonitor", options_.log_callback)
    {
        factory_ = options_.client_factory ? options_.client_factory : default_client_factory();
        if (!options_.now)
            options_.now = [] { return Clock::now(); };
        if (options_.refresh_batch_size == 0)
            options_.refresh_batch_size = 1;
    }

    TimePoint now() const
    {
        return options_.now();
    }

    std::shared_ptr<std::mutex> name_lock(const std::string& name)
    {
        std::lock_guard<std::mutex> lock(name_locks_mutex_);
        auto& entry = name_locks_[name];
        if (!entry)
            entry = std::make_shared<std::mutex>();
        return entry;
    }

    void emit(const ConnectionStatus& status, std::optional<MonitorEventType> type,
              std::optional<std::chrono::milliseconds> response_time = std::nullopt,
              const std::string& message = "")
    {
        status_changes_.emit(status);
        if (!type)
            return;

        MonitorEvent event;
        event.type = *type;
        event.server_name = status.server_name;
        event.timestamp = now();
        event.response_time = response_time;
        event.message = message;
        events_.emit(event);
    }

    // Apply fn to the status of entry if it is still the monitored one.
    // Returns the updated copy for emission outside the lock.
    template <typename Fn>
    std::optional<ConnectionStatus> update(const std::string& name,
                                           const std::shared_ptr<Monitored>& entry, Fn&& fn)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end() || it->second != entry)
            return std::nullopt;
        fn(entry->status, records_[name]);
        return entry->status;
    }

    // ------------------------------------------------------------------
    // Start / stop
    // ------------------------------------------------------------------

    // Connect, giving up after bound. On overrun the session is torn down,
    // which fails whatever connect() is still waiting on.
    void connect_within(const std::string& name, const std::shared_ptr<ProtocolClient>& client,
                        std::chrono::milliseconds bound)
    {
        auto pending = std::async(std::launch::async, [client] { client->connect(); });
        if (pending.wait_for(bound) == std::future_status::ready)
        {
            pending.get();
            return;
        }

        client->disconnect();
        try
        {
            pending.get();
        }
        catch (const std::exception& e)
        {
            logger_.debug("Abandoned connect to " + name + ": " + e.what());
        }
        throw McpError("Refresh of " + name + " did not finish within " +
                       std::to_string(bound.count()) + "ms");
    }

    void start_monitoring(const std::string& name, const ServerDescriptor& descriptor,
                          const ClientOptions& client_options,
                          std::optional<std::chrono::milliseconds> bound = std::nullopt)
    {
        auto guard_mutex = name_lock(name);
        std::lock_guard<std::mutex> guard(*guard_mutex);

        stop_monitoring_locked(name);

        auto entry = std::make_shared<Monitored>();
        entry->status.server_name = name;
        entry->status.status = ConnectionState::Connecting;
        entry->status.last_ping = now();

        ServerDescriptor named = descriptor;
        named.name = name;
        entry->client = factory_(named, client_options);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            servers_[name] = entry;
        }
        status_changes_.emit(entry->status);

        try
        {
            if (bound)
                connect_within(name, entry->client, *bound);
            else
                entry->client->connect();
        }
        catch (const std::exception& e)
        {
            logger_.warning("Failed to connect to " + name + ": " + e.what());
            auto status = update(name, entry,
                                 [&](ConnectionStatus& s, HealthRecord& r)
                                 {
                                     s.status = ConnectionState::Error;
                                     s.error_count++;
                                     s.last_error = e.what();
                                     s.last_ping = now();
                                     r.status = ConnectionState::Error;
                                     r.consecutive_errors++;
                                     r.last_probe = s.last_ping;
                                 });
            if (status)
                emit(*status, MonitorEventType::Error, std::nullopt, e.what());
            throw;
        }

        auto connected = update(name, entry,
                                [&](ConnectionStatus& s, HealthRecord& r)
                                {
                                    s.status = ConnectionState::Connected;
                                    s.connected_at = now();
                                    s.last_ping = *s.connected_at;
                                    s.error_count = 0;
                                    s.uptime = std::chrono::seconds(0);
                                    s.last_error.reset();
                                    r.status = ConnectionState::Connected;
                                    r.consecutive_errors = 0;
                                    r.last_probe = s.last_ping;
                                });

        std::weak_ptr<Monitored> weak = entry;
        auto subscription = entry->client->events().connect(
            [this, name, weak](const ClientEvent& event)
            {
                if (auto target = weak.lock())
                    on_client_event(name, target, event);
            });

        auto timer = std::make_unique<internal::PeriodicTimer>(
            options_.ping_interval, [this, name] { ping_server(name); }, logger_);
        timer->start();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            entry->subscription = subscription;
            entry->timer = std::move(timer);
        }

        if (connected)
            emit(*connected, MonitorEventType::Connected);
    }

    // Requires the name lock
    void stop_monitoring_locked(const std::string& name)
    {
        std::shared_ptr<Monitored> entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = servers_.find(name);
            if (it == servers_.end())
                return;
            entry = std::move(it->second);
            servers_.erase(it);
        }

        std::unique_ptr<internal::PeriodicTimer> timer;
        Signal<ClientEvent>::Connection subscription;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            timer = std::move(entry->timer);
            subscription = entry->subscription;
        }

        if (timer)
            timer->stop();

        if (entry->client)
        {
            if (subscription != 0)
                entry->client->events().disconnect(subscription);
            try
            {
                entry->client->disconnect();
            }
            catch (const std::exception& e)
            {
                logger_.warning("Error disconnecting " + name + ": " + e.what());
            }
        }

        ConnectionStatus final_status = entry->status;
        final_status.status = ConnectionState::Disconnected;
        emit(final_status, MonitorEventType::Disconnected);
    }

    void stop_monitoring(const std::string& name)
    {
        auto guard_mutex = name_lock(name);
        std::lock_guard<std::mutex> guard(*guard_mutex);
        stop_monitoring_locked(name);
    }

    std::vector<std::string> monitored_names() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [name, entry] : servers_)
            names.push_back(name);
        return names;
    }

    // ------------------------------------------------------------------
    // Events and pings
    // ------------------------------------------------------------------

    void on_client_event(const std::string& name, const std::shared_ptr<Monitored>& entry,
                         const ClientEvent& event)
    {
        switch (event.type)
        {
        case ClientEventType::Connected:
        {
            auto status = update(name, entry,
                                 [&](ConnectionStatus& s, HealthRecord& r)
                                 {
                                     s.status = ConnectionState::Connected;
                                     s.connected_at = now();
                                     s.error_count = 0;
                                     r.status = ConnectionState::Connected;
                                     r.consecutive_errors = 0;
                                     r.last_probe = *s.connected_at;
                                 });
            if (status)
                emit(*status, MonitorEventType::Connected);
            break;
        }
        case ClientEventType::Disconnected:
        {
            auto status = update(name, entry,
                                 [&](ConnectionStatus& s, HealthRecord&)
                                 {
                                     s.status = ConnectionState::Disconnected;
                                     if (!event.message.empty())
                                         s.last_error = event.message;
                                 });
            if (status)
                emit(*status, MonitorEventType::Disconnected, std::nullopt, event.message);
            break;
        }
        case ClientEventType::Error:
        {
            auto status = update(name, entry,
                                 [&](ConnectionStatus& s, HealthRecord& r)
                                 {
                                     s.status = ConnectionState::Error;
                                     s.error_count++;
                                     s.last_error = event.message;
                                     r.status = ConnectionState::Error;
                                 });
            if (status)
                emit(*status, MonitorEventType::Error, std::nullopt, event.message);
            break;
        }
        case ClientEventType::Notification:
            break;
        }
    }

    void ping_server(const std::string& name)
    {
        std::shared_ptr<Monitored> entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = servers_.find(name);
            if (it == servers_.end())
                return;
            entry = it->second;
            // error is not terminal: keep probing so a recovery is noticed
            if (entry->status.status != ConnectionState::Connected &&
                entry->status.status != ConnectionState::Error)
                return;
        }
        if (!entry->client)
            return;

        try
        {
            auto latency = entry->client->ping();

            bool recovered = false;
            auto status = update(name, entry,
                                 [&](ConnectionStatus& s, HealthRecord& r)
                                 {
                                     recovered = s.status == ConnectionState::Error;
                                     s.status = ConnectionState::Connected;
                                     s.response_time = latency;
                                     s.last_ping = now();
                                     s.error_count = 0;
                                     if (s.connected_at)
                                         s.uptime = std::chrono::duration_cast<std::chrono::seconds>(
                                             s.last_ping - *s.connected_at);
                                     r.status = ConnectionState::Connected;
                                     r.consecutive_errors = 0;
                                     r.last_probe = s.last_ping;
                                 });
            if (!status)
                return;

            if (recovered)
                logger_.info(name + " recovered");
            emit(*status, MonitorEventType::Ping, latency);
        }
        catch (const std::exception& e)
        {
            bool entered_error = false;
            auto status = update(name, entry,
                                 [&](ConnectionStatus& s, HealthRecord& r)
                                 {
                                     s.error_count++;
                                     s.last_ping = now();
                                     s.last_error = e.what();
                                     r.consecutive_errors++;
                                     r.last_probe = s.last_ping;
                                     if (s.error_count >= options_.max_error_count &&
                                         s.status != ConnectionState::Error)
                                     {
                                         s.status = ConnectionState::Error;
                                         r.status = ConnectionState::Error;
                                         entered_error = true;
                                     }
                                 });
            if (!status)
                return;

            logger_.debug("Ping of " + name + " failed: " + e.what());
            if (entered_error)
            {
                logger_.warning(name + " failed " + std::to_string(status->error_count) +
                                " consecutive pings");
                emit(*status, MonitorEventType::Error, std::nullopt, e.what());
            }
            else
            {
                status_changes_.emit(*status);
            }
        }
    }

    // ------------------------------------------------------------------
    // Smart refresh
    // ------------------------------------------------------------------

    bool is_refresh_due(const std::string& name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(name);
        if (it == records_.end() || !it->second.last_probe)
            return true;

        const HealthRecord& record = it->second;
        auto since = now() - *record.last_probe;

        if (record.status == ConnectionState::Connected && since < options_.fresh_window)
            return false;

        if (record.status == ConnectionState::Error &&
            since < refresh_backoff(record.consecutive_errors, options_.backoff_unit,
                                    options_.max_backoff))
            return false;

        return true;
    }

    void refresh_one(const std::string& name, const ServerDescriptor& descriptor)
    {
        if (descriptor.command.empty())
        {
            logger_.info("No valid config for " + name + ", skipping");
            return;
        }

        ClientOptions client_options = options_.client_options;
        client_options.connect_timeout =
            std::min(client_options.connect_timeout, options_.refresh_timeout);

        try
        {
            start_monitoring(name, descriptor, client_options, options_.refresh_timeout);
            logger_.info("Successfully refreshed " + name);
        }
        catch (const std::exception& e)
        {
            logger_.warning("Failed to refresh " + name + ": " + e.what());
        }
    }

    void schedule_smart_refresh(const std::map<std::string, ServerDescriptor>& descriptors)
    {
        std::vector<std::pair<std::string, ServerDescriptor>> due;
        for (const auto& [name, descriptor] : descriptors)
        {
            if (is_refresh_due(name))
                due.emplace_back(name, descriptor);
            else
                logger_.debug("Skipping " + name + " (fresh or in backoff)");
        }

        if (due.empty())
        {
            logger_.info("All servers are fresh or in backoff, skipping refresh");
            return;
        }

        const std::size_t batch_size = options_.refresh_batch_size;
        for (std::size_t i = 0; i < due.size(); i += batch_size)
        {
            std::size_t end = std::min(due.size(), i + batch_size);

            std::vector<std::future<void>> batch;
            for (std::size_t j = i; j < end; ++j)
            {
                batch.push_back(std::async(std::launch::async,
                                           [this, name = due[j].first,
                                            descriptor = due[j].second]
                                           { refresh_one(name, descriptor); }));
            }
            for (auto& future : batch)
                future.get();

            if (end < due.size())
            {
                std::unique_lock<std::mutex> lock(shutdown_mutex_);
                if (shutdown_cv_.wait_for(lock, options_.refresh_batch_delay,
                                          [this] { return shutting_down_; }))
                    return;
            }
        }
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(shutdown_mutex_);
            shutting_down_ = true;
        }
        shutdown_cv_.notify_all();
    }
};

// ============================================================================
// HealthMonitor
// ============================================================================

HealthMonitor::HealthMonitor(MonitorOptions options)
    : impl_(std::make_unique<Impl>(std::move(options)))
{
}

HealthMonitor::~HealthMonitor()
{
    impl_->shutdown();
    stop_all();
}

void HealthMonitor::start_monitoring(const std::string& name, const ServerDescriptor& descriptor)
{
    impl_->start_monitoring(name, descriptor, impl_->options_.client_options);
}

void HealthMonitor::stop_monitoring(const std::string& name)
{
    impl_->stop_monitoring(name);
}

void HealthMonitor::stop_all()
{
    for (const auto& name : impl_->monitored_names())
        impl_->stop_monitoring(name);
}

void HealthMonitor::ping_server(const std::string& name)
{
    impl_->ping_server(name);
}

void HealthMonitor::schedule_smart_refresh(
    const std::map<std::string, ServerDescriptor>& descriptors)
{
    impl_->schedule_smart_refresh(descriptors);
}

std::optional<ConnectionStatus> HealthMonitor::get_connection_status(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    auto it = impl_->servers_.find(name);
    if (it == impl_->servers_.end())
        return std::nullopt;
    return it->second->status;
}

std::vector<ConnectionStatus> HealthMonitor::get_all_connection_statuses() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    std::vector<ConnectionStatus> statuses;
    for (const auto& [name, entry] : impl_->servers_)
        statuses.push_back(entry->status);
    return statuses;
}

std::size_t HealthMonitor::get_connected_count() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    return static_cast<std::size_t>(
        std::count_if(impl_->servers_.begin(), impl_->servers_.end(), [](const auto& item)
                      { return item.second->status.status == ConnectionState::Connected; }));
}

std::chrono::milliseconds HealthMonitor::get_average_response_time() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    long long total = 0;
    long long connected = 0;
    for (const auto& [name, entry] : impl_->servers_)
    {
        if (entry->status.status != ConnectionState::Connected)
            continue;
        total += entry->status.response_time.count();
        connected++;
    }
    if (connected == 0)
        return std::chrono::milliseconds(0);
    // Rounded to the nearest millisecond
    return std::chrono::milliseconds((total + connected / 2) / connected);
}

std::optional<ClientMetrics> HealthMonitor::get_real_metrics(const std::string& name) const
{
    std::shared_ptr<ProtocolClient> client;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        auto it = impl_->servers_.find(name);
        if (it == impl_->servers_.end())
            return std::nullopt;
        client = it->second->client;
    }
    if (!client || !client->is_connected())
        return std::nullopt;
    return client->metrics();
}

std::vector<std::string> HealthMonitor::get_servers_needing_refresh() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    auto now = impl_->now();
    std::vector<std::string> names;
    for (const auto& [name, entry] : impl_->servers_)
    {
        const auto& status = entry->status;
        if (status.status == ConnectionState::Disconnected ||
            now - status.last_ping > impl_->options_.fresh_window)
            names.push_back(name);
    }
    return names;
}

std::optional<HealthRecord> HealthMonitor::get_health_record(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    auto it = impl_->records_.find(name);
    if (it == impl_->records_.end())
        return std::nullopt;
    return it->second;
}

bool HealthMonitor::is_refresh_due(const std::string& name) const
{
    return impl_->is_refresh_due(name);
}

Signal<ConnectionStatus>& HealthMonitor::status_changes()
{
    return impl_->status_changes_;
}

Signal<MonitorEvent>& HealthMonitor::events()
{
    return impl_->events_;
}

} // namespace mcpmgr
