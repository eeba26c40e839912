#ifndef MCPMGR_ERRORS_HPP
#define MCPMGR_ERRORS_HPP

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcpmgr
{

// Base exception
class McpError : public std::runtime_error
{
  public:
    explicit McpError(const std::string& message) : std::runtime_error(message) {}
};

// initialize failed: process exited, malformed response or timeout
class HandshakeError : public McpError
{
  public:
    explicit HandshakeError(const std::string& message) : McpError(message) {}

    HandshakeError(const std::string& message, int exit_code)
        : McpError(message), exit_code_(exit_code)
    {
    }

    std::optional<int> exit_code() const
    {
        return exit_code_;
    }

  private:
    std::optional<int> exit_code_;
};

// No matching response within the request window
class RequestTimeout : public McpError
{
  public:
    RequestTimeout(const std::string& message, const std::string& method, std::int64_t id)
        : McpError(message), method_(method), id_(id)
    {
    }

    const std::string& method() const
    {
        return method_;
    }

    std::int64_t id() const
    {
        return id_;
    }

  private:
    std::string method_;
    std::int64_t id_;
};

// Session torn down while a caller was waiting on it
class ConnectionClosed : public McpError
{
  public:
    explicit ConnectionClosed(const std::string& message) : McpError(message) {}
};

// No pool entry available at capacity
class PoolExhausted : public McpError
{
  public:
    PoolExhausted(const std::string& message, const std::string& server_name)
        : McpError(message), server_name_(server_name)
    {
    }

    const std::string& server_name() const
    {
        return server_name_;
    }

  private:
    std::string server_name_;
};

// Raised from a cached error snapshot on demand
class InspectionError : public McpError
{
  public:
    InspectionError(const std::string& message, const std::string& server_name)
        : McpError(message), server_name_(server_name)
    {
    }

    const std::string& server_name() const
    {
        return server_name_;
    }

  private:
    std::string server_name_;
};

// Server answered with a JSON-RPC error object
class RpcError : public McpError
{
  public:
    RpcError(const std::string& message, int code)
        : McpError(message), code_(code), data_(nullptr)
    {
    }

    RpcError(const std::string& message, int code, const nlohmann::json& data)
        : McpError(message), code_(code), data_(std::make_shared<nlohmann::json>(data))
    {
    }

    int code() const
    {
        return code_;
    }

    // Optional "data" member of the error object
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    int code_;
    std::shared_ptr<nlohmann::json> data_;
};

// Client gave up reconnecting; reset_unavailable() re-enables connect()
class ServerUnavailableError : public McpError
{
  public:
    explicit ServerUnavailableError(const std::string& message) : McpError(message) {}
};

// JSON decode error
class JSONDecodeError : public McpError
{
  public:
    explicit JSONDecodeError(const std::string& message) : McpError(message) {}
};

// Well-formed JSON that is not a JSON-RPC 2.0 message
class MessageParseError : public McpError
{
  public:
    explicit MessageParseError(const std::string& message) : McpError(message), data_(nullptr) {}

    MessageParseError(const std::string& message, const nlohmann::json& data)
        : McpError(message), data_(std::make_shared<nlohmann::json>(data))
    {
    }

    // Get the optional data associated with the parse error
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    std::shared_ptr<nlohmann::json> data_;
};

} // namespace mcpmgr

#endif // MCPMGR_ERRORS_HPP
