#include "internal/env.hpp"

#include <cstdlib>
#include <mcpmgr/client.hpp>
#include <mcpmgr/config.hpp>
#include <stdexcept>
#include <string>

namespace mcpmgr
{

namespace internal
{

std::optional<long long> env_positive_int(const char* name)
{
    const char* env = std::getenv(name);
    if (env == nullptr || env[0] == '\0')
        return std::nullopt;

    try
    {
        std::size_t consumed = 0;
        long long parsed = std::stoll(env, &consumed);
        if (consumed != std::string(env).size() || parsed <= 0)
            return std::nullopt;
        return parsed;
    }
    catch (const std::invalid_argument&)
    {
        // Ignore parse errors; keep default
        return std::nullopt;
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
}

} // namespace internal

namespace
{
void override_ms(std::chrono::milliseconds& target, const char* name)
{
    if (auto value = internal::env_positive_int(name))
        target = std::chrono::milliseconds(*value);
}
} // namespace

ClientFactory default_client_factory()
{
    return [](const ServerDescriptor& descriptor, const ClientOptions& options)
    { return std::make_shared<ProtocolClient>(descriptor, options); };
}

ClientOptions client_options_from_env(ClientOptions base)
{
    override_ms(base.request_timeout, "MCPMGR_REQUEST_TIMEOUT_MS");
    override_ms(base.connect_timeout, "MCPMGR_CONNECT_TIMEOUT_MS");
    override_ms(base.shutdown_grace, "MCPMGR_SHUTDOWN_GRACE_MS");
    if (auto attempts = internal::env_positive_int("MCPMGR_MAX_RECONNECT_ATTEMPTS"))
        base.max_reconnect_attempts = static_cast<int>(*attempts);
    return base;
}

MonitorOptions monitor_options_from_env(MonitorOptions base)
{
    override_ms(base.ping_interval, "MCPMGR_PING_INTERVAL_MS");
    base.client_options = client_options_from_env(base.client_options);
    return base;
}

PoolOptions pool_options_from_env(PoolOptions base)
{
    if (auto max = internal::env_positive_int("MCPMGR_POOL_MAX_CONNECTIONS"))
        base.max_connections = static_cast<std::size_t>(*max);
    if (auto min = internal::env_positive_int("MCPMGR_POOL_MIN_CONNECTIONS"))
        base.min_connections = static_cast<std::size_t>(*min);
    override_ms(base.idle_timeout, "MCPMGR_POOL_IDLE_TIMEOUT_MS");
    base.client_options = client_options_from_env(base.client_options);
    return base;
}

} // namespace mcpmgr
