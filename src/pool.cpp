#include "internal/logging.hpp"
#include "internal/periodic_timer.hpp"
#include "internal/retry.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <future>
#include <mcpmgr/client.hpp>
#include <mcpmgr/errors.hpp>
#include <mcpmgr/pool.hpp>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace mcpmgr
{

namespace
{
using SteadyClock = std::chrono::steady_clock;

struct PoolEntry
{
    std::shared_ptr<ProtocolClient> client;
    bool in_use = false;
    SteadyClock::time_point last_used;
    int failed_checks = 0;
    bool healthy = true;
};

using EntryPtr = std::shared_ptr<PoolEntry>;

struct ServerPool
{
    std::mutex mutex;
    std::vector<EntryPtr> entries;
    // Slots reserved by sessions being created outside the lock
    std::size_t pending = 0;
    // Removed from the pool map; acquirers must look the pool up again
    bool retired = false;
};

// Least recently used idle entry, optionally skipping one
EntryPtr lru_idle(const std::vector<EntryPtr>& entries, const EntryPtr& skip = nullptr)
{
    EntryPtr best;
    for (const auto& entry : entries)
    {
        if (entry->in_use || entry == skip)
            continue;
        if (!best || entry->last_used < best->last_used)
            best = entry;
    }
    return best;
}

void remove_entry(std::vector<EntryPtr>& entries, const EntryPtr& entry)
{
    entries.erase(std::remove(entries.begin(), entries.end(), entry), entries.end());
}
} // namespace

class ConnectionPool::Impl
{
  public:
    PoolOptions options_;
    ClientFactory factory_;
    internal::Logger logger_;

    mutable std::shared_mutex pools_mutex_;
    std::map<std::string, std::shared_ptr<ServerPool>> pools_;

    std::atomic<bool> shut_down_{false};
    std::mutex shutdown_mutex_;
    std::condition_variable shutdown_cv_;

    std::mutex timers_mutex_;
    std::unique_ptr<internal::PeriodicTimer> health_timer_;
    std::unique_ptr<internal::PeriodicTimer> cleanup_timer_;

    explicit Impl(PoolOptions options)
        : options_(std::move(options)), logger_("ConnectionPool", options_.log_callback)
    {
        factory_ = options_.client_factory ? options_.client_factory : default_client_factory();
        if (options_.max_connections == 0)
            options_.max_connections = 1;
        options_.min_connections = std::min(options_.min_connections, options_.max_connections);
    }

    std::shared_ptr<ServerPool> pool_for(const std::string& name)
    {
        {
            std::shared_lock<std::shared_mutex> lock(pools_mutex_);
            auto it = pools_.find(name);
            if (it != pools_.end())
                return it->second;
        }

        std::unique_lock<std::shared_mutex> lock(pools_mutex_);
        auto& pool = pools_[name];
        if (!pool)
            pool = std::make_shared<ServerPool>();
        return pool;
    }

    std::shared_ptr<ServerPool> find_pool(const std::string& name) const
    {
        std::shared_lock<std::shared_mutex> lock(pools_mutex_);
        auto it = pools_.find(name);
        if (it == pools_.end())
            return nullptr;
        return it->second;
    }

    std::vector<std::pair<std::string, std::shared_ptr<ServerPool>>> all_pools() const
    {
        std::shared_lock<std::shared_mutex> lock(pools_mutex_);
        return {pools_.begin(), pools_.end()};
    }

    void close_entry(const std::string& name, const EntryPtr& entry)
    {
        try
        {
            entry->client->disconnect();
            logger_.info("Closed connection for " + name);
        }
        catch (const std::exception& e)
        {
            logger_.error("Error closing connection for " + name + ": " + e.what());
        }
    }

    // False when shutdown interrupted the wait
    bool sleep_unless_shutdown(std::chrono::milliseconds delay)
    {
        std::unique_lock<std::mutex> lock(shutdown_mutex_);
        return !shutdown_cv_.wait_for(lock, delay, [this] { return shut_down_.load(); });
    }

    std::shared_ptr<ProtocolClient> create_client(const std::string& name,
                                                  const ServerDescriptor& descriptor)
    {
        ServerDescriptor named = descriptor;
        named.name = name;

        ClientOptions client_options = options_.client_options;
        client_options.connect_timeout =
            std::min(client_options.connect_timeout, options_.connection_timeout);

        internal::RetryPolicy policy;
        policy.max_attempts = options_.max_retries;
        policy.initial_delay = options_.retry_initial_delay;
        policy.backoff_multiplier = options_.retry_backoff_multiplier;
        policy.max_delay = options_.retry_max_delay;

        return internal::retry_with_backoff(
            policy,
            [&]
            {
                auto client = factory_(named, client_options);
                client->connect();
                return client;
            },
            [this](std::chrono::milliseconds delay) { return sleep_unless_shutdown(delay); },
            [&](int attempt, const std::exception& e)
            {
                logger_.warning("Retry " + std::to_string(attempt) + " for " + name + ": " +
                                e.what());
            });
    }

    std::shared_ptr<ProtocolClient> get_client(const std::string& name,
                                               const ServerDescriptor& descriptor)
    {
        while (true)
        {
            if (shut_down_)
                throw McpError("Connection pool is shut down");

            auto pool = pool_for(name);
            EntryPtr reclaimed;
            {
                std::lock_guard<std::mutex> lock(pool->mutex);
                if (pool->retired)
                    continue;

                for (const auto& entry : pool->entries)
                {
                    if (entry->in_use || !entry->healthy)
                        continue;
                    if (!entry->client->is_connected())
                    {
                        entry->healthy = false;
                        continue;
                    }
                    entry->in_use = true;
                    entry->last_used = SteadyClock::now();
                    logger_.debug("Reusing connection for " + name);
                    return entry->client;
                }

                if (pool->entries.size() + pool->pending >= options_.max_connections)
                {
                    reclaimed = lru_idle(pool->entries);
                    if (!reclaimed)
                        throw PoolExhausted("Connection pool exhausted for " + name + " (" +
                                                std::to_string(options_.max_connections) +
                                                " in use)",
                                            name);
                    remove_entry(pool->entries, reclaimed);
                }
                pool->pending++;
            }

            if (reclaimed)
            {
                logger_.info("Reclaiming least recently used idle connection for " + name);
                close_entry(name, reclaimed);
            }

            std::shared_ptr<ProtocolClient> client;
            try
            {
                client = create_client(name, descriptor);
            }
            catch (const std::exception& e)
            {
                {
                    std::lock_guard<std::mutex> lock(pool->mutex);
                    pool->pending--;
                }
                logger_.error("Failed to get connection for " + name + ": " + e.what());
                throw;
            }

            auto entry = std::make_shared<PoolEntry>();
            entry->client = client;
            entry->in_use = true;
            entry->last_used = SteadyClock::now();

            std::size_t size;
            {
                std::lock_guard<std::mutex> lock(pool->mutex);
                pool->pending--;
                if (!shut_down_)
                    pool->entries.push_back(entry);
                size = pool->entries.size();
            }

            if (shut_down_)
            {
                close_entry(name, entry);
                throw McpError("Connection pool is shut down");
            }

            logger_.info("Created new connection for " + name + " (" + std::to_string(size) +
                         "/" + std::to_string(options_.max_connections) + ")");
            return client;
        }
    }

    void release_client(const std::string& name, const std::shared_ptr<ProtocolClient>& client)
    {
        auto pool = find_pool(name);
        if (!pool)
            return;

        EntryPtr excess;
        {
            std::lock_guard<std::mutex> lock(pool->mutex);
            auto it = std::find_if(pool->entries.begin(), pool->entries.end(),
                                   [&](const EntryPtr& e) { return e->client == client; });
            if (it == pool->entries.end())
            {
                logger_.debug("Release of a session not owned by the " + name + " pool ignored");
                return;
            }

            EntryPtr entry = *it;
            entry->in_use = false;
            entry->last_used = SteadyClock::now();
            if (!entry->client->is_connected())
                entry->healthy = false;

            std::size_t idle = static_cast<std::size_t>(
                std::count_if(pool->entries.begin(), pool->entries.end(),
                              [](const EntryPtr& e) { return !e->in_use; }));
            if (idle > options_.min_connections)
            {
                excess = lru_idle(pool->entries, entry);
                if (excess)
                    remove_entry(pool->entries, excess);
            }
        }

        logger_.debug("Released connection for " + name);
        if (excess)
            close_entry(name, excess);
    }

    void run_health_checks()
    {
        for (const auto& [name, pool] : all_pools())
        {
            std::vector<EntryPtr> idle;
            {
                std::lock_guard<std::mutex> lock(pool->mutex);
                for (const auto& entry : pool->entries)
                    if (!entry->in_use)
                        idle.push_back(entry);
            }

            std::vector<EntryPtr> evicted;
            for (const auto& entry : idle)
            {
                bool healthy = true;
                try
                {
                    entry->client->ping();
                }
                catch (const std::exception& e)
                {
                    healthy = false;
                    logger_.warning("Unhealthy connection for " + name + ": " + e.what());
                }

                std::lock_guard<std::mutex> lock(pool->mutex);
                entry->healthy = healthy;
                if (healthy)
                {
                    entry->failed_checks = 0;
                    continue;
                }

                entry->failed_checks++;
                if (entry->failed_checks >= options_.max_health_failures && !entry->in_use)
                {
                    remove_entry(pool->entries, entry);
                    evicted.push_back(entry);
                }
            }

            for (const auto& entry : evicted)
            {
                close_entry(name, entry);
                logger_.info("Removed unhealthy connection for " + name);
            }
        }
    }

    void run_cleanup()
    {
        auto now = SteadyClock::now();
        std::vector<std::string> emptied;

        for (const auto& [name, pool] : all_pools())
        {
            std::vector<EntryPtr> expired;
            {
                std::lock_guard<std::mutex> lock(pool->mutex);
                for (const auto& entry : pool->entries)
                    if (!entry->in_use && now - entry->last_used > options_.idle_timeout)
                        expired.push_back(entry);

                std::sort(expired.begin(), expired.end(),
                          [](const EntryPtr& a, const EntryPtr& b)
                          { return a->last_used < b->last_used; });

                // Never drop below min_connections
                std::size_t removable = pool->entries.size() > options_.min_connections
                                            ? pool->entries.size() - options_.min_connections
                                            : 0;
                if (expired.size() > removable)
                    expired.resize(removable);

                for (const auto& entry : expired)
                    remove_entry(pool->entries, entry);

                if (pool->entries.empty() && pool->pending == 0)
                    emptied.push_back(name);
            }

            for (const auto& entry : expired)
            {
                close_entry(name, entry);
                logger_.info("Cleaned up idle connection for " + name);
            }
        }

        if (emptied.empty())
            return;

        std::unique_lock<std::shared_mutex> lock(pools_mutex_);
        for (const auto& name : emptied)
        {
            auto it = pools_.find(name);
            if (it == pools_.end())
                continue;

            auto& pool = it->second;
            std::lock_guard<std::mutex> pool_lock(pool->mutex);
            // Someone may have started using it again since the sweep
            if (pool->entries.empty() && pool->pending == 0)
            {
                pool->retired = true;
                pools_.erase(it);
            }
        }
    }

    void start()
    {
        if (shut_down_)
            throw McpError("Connection pool is shut down");

        std::lock_guard<std::mutex> lock(timers_mutex_);
        if (!health_timer_)
        {
            health_timer_ = std::make_unique<internal::PeriodicTimer>(
                options_.health_check_interval, [this] { run_health_checks(); }, logger_);
            health_timer_->start();
        }
        if (!cleanup_timer_)
        {
            cleanup_timer_ = std::make_unique<internal::PeriodicTimer>(
                options_.cleanup_interval, [this] { run_cleanup(); }, logger_);
            cleanup_timer_->start();
        }
    }

    void shutdown()
    {
        if (shut_down_.exchange(true))
            return;

        logger_.info("Shutting down connection pool...");
        {
            // Pairs with sleep_unless_shutdown()
            std::lock_guard<std::mutex> lock(shutdown_mutex_);
        }
        shutdown_cv_.notify_all();

        {
            std::lock_guard<std::mutex> lock(timers_mutex_);
            if (health_timer_)
                health_timer_->stop();
            if (cleanup_timer_)
                cleanup_timer_->stop();
        }

        std::map<std::string, std::shared_ptr<ServerPool>> pools;
        {
            std::unique_lock<std::shared_mutex> lock(pools_mutex_);
            pools.swap(pools_);
        }

        for (auto& [name, pool] : pools)
        {
            std::vector<EntryPtr> entries;
            {
                std::lock_guard<std::mutex> lock(pool->mutex);
                pool->retired = true;
                entries.swap(pool->entries);
            }
            for (const auto& entry : entries)
                close_entry(name, entry);
        }

        logger_.info("Connection pool shut down");
    }

    PoolStatistics statistics() const
    {
        PoolStatistics stats;
        for (const auto& [name, pool] : all_pools())
        {
            ServerPoolStats server;
            {
                std::lock_guard<std::mutex> lock(pool->mutex);
                server.total = pool->entries.size();
                for (const auto& entry : pool->entries)
                {
                    if (entry->in_use)
                        server.active++;
                    else
                        server.idle++;
                    if (entry->healthy)
                        server.healthy++;
                }
            }

            stats.total_connections += server.total;
            stats.active_connections += server.active;
            stats.idle_connections += server.idle;
            stats.pools_by_server[name] = server;
        }
        return stats;
    }
};

// ============================================================================
// ConnectionPool
// ============================================================================

ConnectionPool::ConnectionPool(PoolOptions options)
    : impl_(std::make_unique<Impl>(std::move(options)))
{
}

ConnectionPool::~ConnectionPool()
{
    impl_->shutdown();
}

void ConnectionPool::start()
{
    impl_->start();
}

void ConnectionPool::shutdown()
{
    impl_->shutdown();
}

std::shared_ptr<ProtocolClient> ConnectionPool::get_client(const std::string& name,
                                                           const ServerDescriptor& descriptor)
{
    return impl_->get_client(name, descriptor);
}

void ConnectionPool::release_client(const std::string& name,
                                    const std::shared_ptr<ProtocolClient>& client)
{
    impl_->release_client(name, client);
}

void ConnectionPool::prewarm(const std::string& name, const ServerDescriptor& descriptor,
                             std::optional<std::size_t> count)
{
    std::size_t target = count.value_or(impl_->options_.min_connections);
    impl_->logger_.info("Pre-warming " + std::to_string(target) + " connections for " + name);

    std::vector<std::future<void>> tasks;
    for (std::size_t i = 0; i < target; ++i)
    {
        tasks.push_back(std::async(std::launch::async,
                                   [this, &name, &descriptor]
                                   {
                                       auto client = get_client(name, descriptor);
                                       release_client(name, client);
                                   }));
    }

    std::exception_ptr first_failure;
    for (auto& task : tasks)
    {
        try
        {
            task.get();
        }
        catch (const std::exception& e)
        {
            impl_->logger_.warning("Pre-warming " + name + " failed: " + e.what());
            if (!first_failure)
                first_failure = std::current_exception();
        }
    }

    if (first_failure)
        std::rethrow_exception(first_failure);

    impl_->logger_.info("Pre-warming complete for " + name);
}

void ConnectionPool::run_health_checks()
{
    impl_->run_health_checks();
}

void ConnectionPool::run_cleanup()
{
    impl_->run_cleanup();
}

PoolStatistics ConnectionPool::statistics() const
{
    return impl_->statistics();
}

} // namespace mcpmgr
