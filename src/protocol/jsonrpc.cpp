#include <mcpmgr/errors.hpp>
#include <mcpmgr/protocol/jsonrpc.hpp>

namespace mcpmgr
{
namespace protocol
{

std::string build_request(std::int64_t id, const std::string& method, const json& params)
{
    json msg = {{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"method", method}};
    if (!params.is_null())
        msg["params"] = params;
    return msg.dump() + "\n";
}

std::string build_notification(const std::string& method, const json& params)
{
    json msg = {{"jsonrpc", JSONRPC_VERSION}, {"method", method}};
    if (!params.is_null())
        msg["params"] = params;
    return msg.dump() + "\n";
}

std::string build_result(const json& id, const json& result)
{
    json msg = {{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"result", result}};
    return msg.dump() + "\n";
}

std::string build_error(const json& id, int code, const std::string& message)
{
    json msg = {{"jsonrpc", JSONRPC_VERSION},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}};
    return msg.dump() + "\n";
}

IncomingMessage parse_message(const std::string& line)
{
    json j;
    try
    {
        j = json::parse(line);
    }
    catch (const json::exception& e)
    {
        throw JSONDecodeError(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object())
        throw MessageParseError("JSON-RPC message is not an object", j);

    IncomingMessage msg;
    const bool has_id = j.contains("id") && !j["id"].is_null();
    const bool has_method = j.contains("method");

    if (has_id)
    {
        msg.id = j["id"];
        if (msg.id.is_number_integer())
            msg.numeric_id = msg.id.get<std::int64_t>();
        else if (!msg.id.is_string())
            throw MessageParseError("JSON-RPC id must be a number or a string", j);
    }

    if (has_method)
    {
        if (!j["method"].is_string())
            throw MessageParseError("JSON-RPC method must be a string", j);

        msg.method = j["method"].get<std::string>();
        msg.params = j.value("params", json(nullptr));
        msg.kind = has_id ? MessageKind::Request : MessageKind::Notification;
        return msg;
    }

    if (!has_id)
        throw MessageParseError("JSON-RPC message has neither id nor method", j);

    if (j.contains("error") && !j["error"].is_null())
    {
        msg.error = j["error"];
    }
    else if (j.contains("result"))
    {
        msg.result = j["result"];
    }
    else
    {
        throw MessageParseError("JSON-RPC response has neither result nor error", j);
    }

    msg.kind = MessageKind::Response;
    return msg;
}

std::string error_message(const json& error)
{
    if (error.is_object() && error.contains("message") && error["message"].is_string())
        return error["message"].get<std::string>();
    if (error.is_string())
        return error.get<std::string>();
    return "Unknown error";
}

int error_code(const json& error)
{
    if (error.is_object() && error.contains("code") && error["code"].is_number_integer())
        return error["code"].get<int>();
    return ErrorCode::InternalError;
}

} // namespace protocol
} // namespace mcpmgr
