#include "internal/logging.hpp"

#include <algorithm>
#include <future>
#include <mcpmgr/client.hpp>
#include <mcpmgr/errors.hpp>
#include <mcpmgr/inspector.hpp>
#include <mutex>
#include <shared_mutex>

namespace mcpmgr
{

std::size_t estimate_tokens(const std::string& text)
{
    return (text.size() + 3) / 4;
}

std::size_t estimate_token_usage(const std::vector<ToolInfo>& tools,
                                 const std::vector<ResourceInfo>& resources,
                                 const std::vector<PromptInfo>& prompts)
{
    std::size_t total = 0;
    for (const auto& tool : tools)
    {
        total += estimate_tokens(tool.name);
        total += estimate_tokens(tool.description);
        total += estimate_tokens(tool.input_schema.dump());
    }
    for (const auto& resource : resources)
    {
        total += estimate_tokens(resource.name);
        total += estimate_tokens(resource.description.value_or(""));
        total += estimate_tokens(resource.uri);
    }
    for (const auto& prompt : prompts)
    {
        total += estimate_tokens(prompt.name);
        total += estimate_tokens(prompt.description.value_or(""));
    }
    return total;
}

class CapabilityInspector::Impl
{
  public:
    InspectorOptions options_;
    ClientFactory factory_;
    internal::Logger logger_;

    mutable std::shared_mutex cache_mutex_;
    std::map<std::string, CapabilitySnapshot> cache_;

    mutable std::mutex clients_mutex_;
    std::map<std::string, std::shared_ptr<ProtocolClient>> active_clients_;

    // One in-flight inspection per name
    std::mutex inflight_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> inflight_;

    explicit Impl(InspectorOptions options)
        : options_(std::move(options)), logger_("MCPServerInspector", options_.log_callback)
    {
        factory_ = options_.client_factory ? options_.client_factory : default_client_factory();
        if (options_.batch_size == 0)
            options_.batch_size = 1;
    }

    bool is_fresh(const CapabilitySnapshot& snapshot) const
    {
        if (!options_.cache_ttl)
            return true;
        return Clock::now() - snapshot.timestamp < *options_.cache_ttl;
    }

    std::optional<CapabilitySnapshot> cached(const std::string& name) const
    {
        std::shared_lock<std::shared_mutex> lock(cache_mutex_);
        auto it = cache_.find(name);
        if (it == cache_.end() || !is_fresh(it->second))
            return std::nullopt;
        return it->second;
    }

    std::shared_ptr<std::mutex> inflight_lock(const std::string& name)
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        auto& entry = inflight_[name];
        if (!entry)
            entry = std::make_shared<std::mutex>();
        return entry;
    }

    CapabilitySnapshot inspect(const std::string& name, const ServerDescriptor& descriptor,
                               bool force_refresh)
    {
        if (!force_refresh)
        {
            if (auto hit = cached(name))
                return *hit;
        }

        auto requested_at = Clock::now();
        auto name_lock = inflight_lock(name);
        std::lock_guard<std::mutex> guard(*name_lock);

        // A concurrent inspection of the same name may have finished meanwhile
        if (auto hit = cached(name))
        {
            if (!force_refresh || hit->timestamp >= requested_at)
                return *hit;
        }

        CapabilitySnapshot snapshot = run_inspection(name, descriptor);
        {
            std::unique_lock<std::shared_mutex> lock(cache_mutex_);
            cache_[name] = snapshot;
        }
        return snapshot;
    }

    std::shared_ptr<ProtocolClient> obtain_client(const std::string& name,
                                                  const ServerDescriptor& descriptor)
    {
        std::shared_ptr<ProtocolClient> stale;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            auto it = active_clients_.find(name);
            if (it != active_clients_.end())
            {
                if (it->second->is_connected())
                    return it->second;
                stale = std::move(it->second);
                active_clients_.erase(it);
            }
        }
        if (stale)
            stale->disconnect();

        ServerDescriptor named = descriptor;
        named.name = name;
        auto client = factory_(named, options_.client_options);
        client->connect();

        std::lock_guard<std::mutex> lock(clients_mutex_);
        active_clients_[name] = client;
        return client;
    }

    void drop_client(const std::string& name)
    {
        std::shared_ptr<ProtocolClient> client;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            auto it = active_clients_.find(name);
            if (it == active_clients_.end())
                return;
            client = std::move(it->second);
            active_clients_.erase(it);
        }

        try
        {
            client->disconnect();
        }
        catch (const std::exception& e)
        {
            logger_.warning("Error disconnecting " + name + ": " + e.what());
        }
    }

    CapabilitySnapshot run_inspection(const std::string& name, const ServerDescriptor& descriptor)
    {
        logger_.info("Inspecting server: " + name);

        CapabilitySnapshot snapshot;
        snapshot.server_name = name;
        snapshot.timestamp = Clock::now();

        try
        {
            auto client = obtain_client(name, descriptor);

            snapshot.server_info = client->server_info();
            snapshot.tools = client->get_tools();
            snapshot.resources = client->get_resources();

            // prompts/list is optional in the protocol
            try
            {
                snapshot.prompts = client->get_prompts();
                snapshot.prompts_supported = true;
            }
            catch (const McpError& e)
            {
                logger_.debug(name + " doesn't support prompts: " + e.what());
            }

            snapshot.tool_count = snapshot.tools.size();
            snapshot.resource_count = snapshot.resources.size();
            snapshot.prompt_count = snapshot.prompts.size();
            snapshot.token_estimate =
                estimate_token_usage(snapshot.tools, snapshot.resources, snapshot.prompts);

            logger_.info(name + " has " + std::to_string(snapshot.tools.size()) + " tools, " +
                         std::to_string(snapshot.resources.size()) + " resources");
        }
        catch (const std::exception& e)
        {
            logger_.warning("Failed to inspect " + name + ": " + e.what());

            CapabilitySnapshot failed;
            failed.server_name = name;
            failed.timestamp = snapshot.timestamp;
            failed.error = e.what();
            drop_client(name);
            return failed;
        }

        return snapshot;
    }

    void disconnect_all()
    {
        std::map<std::string, std::shared_ptr<ProtocolClient>> clients;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            clients.swap(active_clients_);
        }

        for (auto& [name, client] : clients)
        {
            try
            {
                client->disconnect();
            }
            catch (const std::exception& e)
            {
                logger_.error("Error disconnecting client " + name + ": " + e.what());
            }
        }
    }
};

CapabilityInspector::CapabilityInspector(InspectorOptions options)
    : impl_(std::make_unique<Impl>(std::move(options)))
{
}

CapabilityInspector::~CapabilityInspector()
{
    impl_->disconnect_all();
}

CapabilitySnapshot CapabilityInspector::inspect(const std::string& name,
                                                const ServerDescriptor& descriptor,
                                                bool force_refresh)
{
    return impl_->inspect(name, descriptor, force_refresh);
}

std::map<std::string, CapabilitySnapshot>
CapabilityInspector::inspect_many(const std::map<std::string, ServerDescriptor>& servers,
                                  bool force_refresh)
{
    std::map<std::string, CapabilitySnapshot> results;
    std::vector<std::pair<std::string, ServerDescriptor>> entries(servers.begin(), servers.end());

    for (std::size_t i = 0; i < entries.size(); i += impl_->options_.batch_size)
    {
        std::size_t end = std::min(entries.size(), i + impl_->options_.batch_size);

        std::vector<std::pair<std::string, std::future<CapabilitySnapshot>>> batch;
        for (std::size_t j = i; j < end; ++j)
        {
            const auto& [name, descriptor] = entries[j];
            batch.emplace_back(name, std::async(std::launch::async,
                                                [this, name = name, descriptor = descriptor,
                                                 force_refresh]
                                                { return inspect(name, descriptor, force_refresh); }));
        }

        for (auto& [name, future] : batch)
        {
            try
            {
                results[name] = future.get();
            }
            catch (const std::exception& e)
            {
                CapabilitySnapshot failed;
                failed.server_name = name;
                failed.timestamp = Clock::now();
                failed.error = e.what();
                results[name] = failed;
            }
        }
    }

    return results;
}

std::optional<CapabilitySnapshot> CapabilityInspector::get_cached(const std::string& name) const
{
    return impl_->cached(name);
}

void CapabilityInspector::clear_cache(const std::optional<std::string>& name)
{
    std::unique_lock<std::shared_mutex> lock(impl_->cache_mutex_);
    if (name)
        impl_->cache_.erase(*name);
    else
        impl_->cache_.clear();
}

void CapabilityInspector::disconnect_all()
{
    impl_->disconnect_all();
}

ServerMetricsSummary CapabilityInspector::server_metrics(const std::string& name,
                                                         const ServerDescriptor& descriptor)
{
    auto snapshot = inspect(name, descriptor);

    ServerMetricsSummary summary;
    summary.tool_count = snapshot.tool_count.value_or(0);
    summary.token_usage = snapshot.token_estimate;
    summary.is_connected = snapshot.ok() && summary.tool_count > 0;
    return summary;
}

std::size_t CapabilityInspector::active_client_count() const
{
    std::lock_guard<std::mutex> lock(impl_->clients_mutex_);
    return impl_->active_clients_.size();
}

} // namespace mcpmgr
