#include <mcpmgr/errors.hpp>
#include <mcpmgr/types.hpp>

namespace mcpmgr
{

namespace
{
std::int64_t to_unix_ms(TimePoint tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

// Optional string members are often sent as null by servers
std::optional<std::string> optional_string(const json& j, const char* key)
{
    if (j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return std::nullopt;
}
} // namespace

const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

const char* to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Disconnected:
        return "disconnected";
    case SessionState::Connecting:
        return "connecting";
    case SessionState::Connected:
        return "connected";
    case SessionState::Reconnecting:
        return "reconnecting";
    case SessionState::Closing:
        return "closing";
    case SessionState::Unavailable:
        return "unavailable";
    }
    return "unknown";
}

const char* to_string(ClientEventType type)
{
    switch (type)
    {
    case ClientEventType::Connected:
        return "connected";
    case ClientEventType::Disconnected:
        return "disconnected";
    case ClientEventType::Error:
        return "error";
    case ClientEventType::Notification:
        return "notification";
    }
    return "unknown";
}

const char* to_string(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Connected:
        return "connected";
    case ConnectionState::Disconnected:
        return "disconnected";
    case ConnectionState::Error:
        return "error";
    }
    return "unknown";
}

const char* to_string(MonitorEventType type)
{
    switch (type)
    {
    case MonitorEventType::Connected:
        return "connected";
    case MonitorEventType::Disconnected:
        return "disconnected";
    case MonitorEventType::Error:
        return "error";
    case MonitorEventType::Ping:
        return "ping";
    }
    return "unknown";
}

// ============================================================================
// ServerDescriptor
// ============================================================================

json ServerDescriptor::to_json() const
{
    json j = {{"command", command}, {"args", args}};
    if (!env.empty())
        j["env"] = env;
    if (cwd)
        j["cwd"] = *cwd;
    return j;
}

ServerDescriptor ServerDescriptor::from_json(const std::string& name, const json& j)
{
    if (!j.is_object() || !j.contains("command") || !j["command"].is_string())
        throw MessageParseError("Server '" + name + "' has no command", j);

    ServerDescriptor descriptor;
    descriptor.name = name;
    descriptor.command = j["command"].get<std::string>();
    if (j.contains("args") && j["args"].is_array())
        descriptor.args = j["args"].get<std::vector<std::string>>();
    if (j.contains("env") && j["env"].is_object())
    {
        for (auto it = j["env"].begin(); it != j["env"].end(); ++it)
            if (it.value().is_string())
                descriptor.env[it.key()] = it.value().get<std::string>();
    }
    descriptor.cwd = optional_string(j, "cwd");
    return descriptor;
}

// ============================================================================
// Capabilities
// ============================================================================

json ToolInfo::to_json() const
{
    return json{{"name", name}, {"description", description}, {"inputSchema", input_schema}};
}

ToolInfo ToolInfo::from_json(const json& j)
{
    ToolInfo tool;
    tool.name = j.at("name").get<std::string>();
    tool.description = optional_string(j, "description").value_or("");
    if (j.contains("inputSchema") && !j["inputSchema"].is_null())
        tool.input_schema = j["inputSchema"];
    return tool;
}

json ResourceInfo::to_json() const
{
    json j = {{"uri", uri}, {"name", name}};
    if (description)
        j["description"] = *description;
    if (mime_type)
        j["mimeType"] = *mime_type;
    return j;
}

ResourceInfo ResourceInfo::from_json(const json& j)
{
    ResourceInfo resource;
    resource.uri = j.at("uri").get<std::string>();
    resource.name = optional_string(j, "name").value_or("");
    resource.description = optional_string(j, "description");
    resource.mime_type = optional_string(j, "mimeType");
    return resource;
}

json PromptInfo::to_json() const
{
    json j = {{"name", name}, {"arguments", arguments}};
    if (description)
        j["description"] = *description;
    return j;
}

PromptInfo PromptInfo::from_json(const json& j)
{
    PromptInfo prompt;
    prompt.name = j.at("name").get<std::string>();
    prompt.description = optional_string(j, "description");
    if (j.contains("arguments") && j["arguments"].is_array())
        prompt.arguments = j["arguments"];
    return prompt;
}

json ServerInfo::to_json() const
{
    return json{{"name", name},
                {"version", version},
                {"protocolVersion", protocol_version},
                {"capabilities", capabilities}};
}

ServerInfo ServerInfo::from_initialize_result(const json& result)
{
    ServerInfo info;
    info.protocol_version = optional_string(result, "protocolVersion").value_or("");
    if (result.contains("capabilities") && result["capabilities"].is_object())
        info.capabilities = result["capabilities"];
    if (result.contains("serverInfo") && result["serverInfo"].is_object())
    {
        const auto& server = result["serverInfo"];
        info.name = optional_string(server, "name").value_or("");
        info.version = optional_string(server, "version").value_or("");
    }
    return info;
}

// ============================================================================
// Metrics and status
// ============================================================================

json ClientMetrics::to_json() const
{
    json j = {{"toolCount", tool_count},
              {"resourceCount", resource_count},
              {"responseTime", response_time.count()},
              {"lastActivity", to_unix_ms(last_activity)},
              {"errorCount", error_count},
              {"isConnected", is_connected},
              {"status", to_string(status)},
              {"retryAttempts", retry_attempts},
              {"strayResponses", stray_responses}};
    if (last_error)
        j["lastError"] = *last_error;
    if (server_info)
        j["serverInfo"] = server_info->to_json();
    return j;
}

void CapabilitySnapshot::throw_if_error() const
{
    if (error)
        throw InspectionError("Inspection of '" + server_name + "' failed: " + *error, server_name);
}

json CapabilitySnapshot::to_json() const
{
    json j = {{"serverName", server_name},
              {"tokenEstimate", token_estimate},
              {"timestamp", to_unix_ms(timestamp)}};

    if (error)
    {
        j["error"] = *error;
        return j;
    }

    json tools_json = json::array();
    for (const auto& tool : tools)
        tools_json.push_back(tool.to_json());
    json resources_json = json::array();
    for (const auto& resource : resources)
        resources_json.push_back(resource.to_json());
    json prompts_json = json::array();
    for (const auto& prompt : prompts)
        prompts_json.push_back(prompt.to_json());

    j["toolCount"] = tool_count.value_or(0);
    j["resourceCount"] = resource_count.value_or(0);
    j["promptCount"] = prompt_count.value_or(0);
    j["tools"] = tools_json;
    j["resources"] = resources_json;
    j["prompts"] = prompts_json;
    if (server_info)
        j["serverInfo"] = server_info->to_json();
    return j;
}

json ConnectionStatus::to_json() const
{
    json j = {{"serverName", server_name},
              {"status", to_string(status)},
              {"lastPing", to_unix_ms(last_ping)},
              {"responseTime", response_time.count()},
              {"errorCount", error_count},
              {"uptime", uptime.count()}};
    if (connected_at)
        j["connectedAt"] = to_unix_ms(*connected_at);
    if (last_error)
        j["lastError"] = *last_error;
    return j;
}

json PoolStatistics::to_json() const
{
    json per_server = json::object();
    for (const auto& [name, stats] : pools_by_server)
    {
        per_server[name] = {{"total", stats.total},
                            {"active", stats.active},
                            {"idle", stats.idle},
                            {"healthy", stats.healthy}};
    }
    return json{{"totalConnections", total_connections},
                {"activeConnections", active_connections},
                {"idleConnections", idle_connections},
                {"poolsByServer", per_server}};
}

} // namespace mcpmgr
