#ifndef MCPMGR_PROTOCOL_JSONRPC_HPP
#define MCPMGR_PROTOCOL_JSONRPC_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mcpmgr
{

// JSON type alias (also defined in types.hpp)
using json = nlohmann::json;

namespace protocol
{

constexpr const char* JSONRPC_VERSION = "2.0";

/// Method names used by the client
namespace Method
{
constexpr const char* Initialize = "initialize";
constexpr const char* Initialized = "notifications/initialized";
constexpr const char* ToolsList = "tools/list";
constexpr const char* ResourcesList = "resources/list";
constexpr const char* PromptsList = "prompts/list";
constexpr const char* Ping = "ping";
} // namespace Method

/// Standard JSON-RPC 2.0 error codes
namespace ErrorCode
{
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;
} // namespace ErrorCode

enum class MessageKind
{
    Request,      // method + id (server -> client)
    Response,     // id + result|error
    Notification, // method, no id
};

/// One decoded line from the server
struct IncomingMessage
{
    MessageKind kind = MessageKind::Notification;

    // Raw "id" as sent (number or string); null for notifications
    json id;
    // Numeric id when "id" is an integer
    std::optional<std::int64_t> numeric_id;

    // Requests and notifications
    std::string method;
    json params;

    // Responses
    json result;
    std::optional<json> error;

    bool is_error() const
    {
        return error.has_value();
    }
};

// Serialized message followed by '\n'. params is omitted when null.
std::string build_request(std::int64_t id, const std::string& method, const json& params = nullptr);
std::string build_notification(const std::string& method, const json& params = nullptr);
std::string build_result(const json& id, const json& result);
std::string build_error(const json& id, int code, const std::string& message);

// Decode and classify one line.
// Throws JSONDecodeError for invalid JSON, MessageParseError for JSON that is
// not a JSON-RPC 2.0 message.
IncomingMessage parse_message(const std::string& line);

// "message" of an error object, with a fallback for malformed ones
std::string error_message(const json& error);
int error_code(const json& error);

} // namespace protocol
} // namespace mcpmgr

#endif // MCPMGR_PROTOCOL_JSONRPC_HPP
