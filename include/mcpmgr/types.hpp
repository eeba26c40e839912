#ifndef MCPMGR_TYPES_HPP
#define MCPMGR_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcpmgr
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

const char* to_string(LogLevel level);

/// Receives every log line of a component. When no callback is installed,
/// warnings and errors are written to std::cerr.
using LogCallback = std::function<void(LogLevel, const std::string&)>;

// ============================================================================
// Server launch description
// ============================================================================

/// Identity plus launch command of one server. Supplied by the caller.
struct ServerDescriptor
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> cwd;

    /// {command, args, env, cwd}; the name is the key of the surrounding map
    json to_json() const;

    static ServerDescriptor from_json(const std::string& name, const json& j);
};

// ============================================================================
// Capabilities advertised by a server
// ============================================================================

struct ToolInfo
{
    std::string name;
    std::string description;
    json input_schema = json::object();

    json to_json() const;
    static ToolInfo from_json(const json& j);
};

struct ResourceInfo
{
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    json to_json() const;
    static ResourceInfo from_json(const json& j);
};

struct PromptInfo
{
    std::string name;
    std::optional<std::string> description;
    json arguments = json::array();

    json to_json() const;
    static PromptInfo from_json(const json& j);
};

/// Negotiated during initialize
struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocol_version;
    json capabilities = json::object();

    bool supports(const std::string& capability) const
    {
        return capabilities.is_object() && capabilities.contains(capability);
    }

    json to_json() const;

    /// Built from the "result" member of an initialize response
    static ServerInfo from_initialize_result(const json& result);
};

// ============================================================================
// Protocol client state
// ============================================================================

enum class SessionState
{
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Closing,
    Unavailable
};

const char* to_string(SessionState state);

/// Rolling metrics of one protocol session
struct ClientMetrics
{
    std::size_t tool_count = 0;
    std::size_t resource_count = 0;
    std::chrono::milliseconds response_time{0};
    TimePoint last_activity{};
    int error_count = 0;
    bool is_connected = false;
    SessionState status = SessionState::Disconnected;
    int retry_attempts = 0;
    std::size_t stray_responses = 0;
    std::optional<std::string> last_error;
    std::optional<ServerInfo> server_info;

    json to_json() const;
};

enum class ClientEventType
{
    Connected,
    Disconnected,
    Error,
    Notification
};

const char* to_string(ClientEventType type);

/// Lifecycle transition or server notification of one ProtocolClient
struct ClientEvent
{
    ClientEventType type = ClientEventType::Connected;
    std::string server_name;
    TimePoint timestamp{};

    // Disconnected: exit code when the process exited on its own
    std::optional<int> exit_code;
    // Disconnected: automatic reconnect gave up, the client is unavailable
    bool reconnect_exhausted = false;

    // Error: human readable reason
    std::string message;

    // Notification: method and params
    std::string method;
    json params;
};

// ============================================================================
// Capability inspection
// ============================================================================

/// Result of one complete inspection pass, success or explicit error.
/// Counts are only set for successful passes.
struct CapabilitySnapshot
{
    std::string server_name;
    std::vector<ToolInfo> tools;
    std::vector<ResourceInfo> resources;
    std::vector<PromptInfo> prompts;
    std::optional<std::size_t> tool_count;
    std::optional<std::size_t> resource_count;
    std::optional<std::size_t> prompt_count;
    bool prompts_supported = false;
    std::optional<ServerInfo> server_info;
    std::size_t token_estimate = 0;
    TimePoint timestamp{};
    std::optional<std::string> error;

    bool ok() const
    {
        return !error.has_value();
    }

    /// Throws InspectionError when this snapshot records a failed pass
    void throw_if_error() const;

    json to_json() const;
};

/// Compact per-server figures for display
struct ServerMetricsSummary
{
    std::size_t tool_count = 0;
    std::size_t token_usage = 0;
    bool is_connected = false;
};

// ============================================================================
// Health monitoring
// ============================================================================

enum class ConnectionState
{
    Connecting,
    Connected,
    Disconnected,
    Error
};

const char* to_string(ConnectionState state);

struct ConnectionStatus
{
    std::string server_name;
    ConnectionState status = ConnectionState::Connecting;
    TimePoint last_ping{};
    std::chrono::milliseconds response_time{0};
    int error_count = 0;
    std::chrono::seconds uptime{0};
    std::optional<TimePoint> connected_at;
    std::optional<std::string> last_error;

    json to_json() const;
};

/// Scheduling state behind the background refresh backoff
struct HealthRecord
{
    ConnectionState status = ConnectionState::Disconnected;
    std::optional<TimePoint> last_probe;
    int consecutive_errors = 0;
};

enum class MonitorEventType
{
    Connected,
    Disconnected,
    Error,
    Ping
};

const char* to_string(MonitorEventType type);

struct MonitorEvent
{
    MonitorEventType type = MonitorEventType::Connected;
    std::string server_name;
    TimePoint timestamp{};
    std::optional<std::chrono::milliseconds> response_time;
    std::string message;
};

// ============================================================================
// Connection pool
// ============================================================================

struct ServerPoolStats
{
    std::size_t total = 0;
    std::size_t active = 0;
    std::size_t idle = 0;
    std::size_t healthy = 0;
};

struct PoolStatistics
{
    std::size_t total_connections = 0;
    std::size_t active_connections = 0;
    std::size_t idle_connections = 0;
    std::map<std::string, ServerPoolStats> pools_by_server;

    json to_json() const;
};

} // namespace mcpmgr

#endif // MCPMGR_TYPES_HPP
