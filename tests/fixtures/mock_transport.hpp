#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mcpmgr/client.hpp>
#include <mcpmgr/errors.hpp>
#include <mcpmgr/transport.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcpmgr::test
{

// Behaviour of one scripted server
struct MockScript
{
    std::string server_name = "mock-server";
    std::string server_version = "1.0.0";
    json capabilities = {{"tools", json::object()}};

    json tools = json::array();
    // nullopt: answer with "Method not found"
    std::optional<json> resources = json::array();
    std::optional<json> prompts;

    // connect() throws, as a failed spawn would
    bool fail_spawn = false;
    // Process "exits" right after connect() with this code
    std::optional<int> exit_on_connect;
    // Requests with these methods are never answered
    std::set<std::string> ignored_methods;
    // Requests with these methods are answered with a -32603 error
    std::set<std::string> failing_methods;

    // Custom replies. Returning nullopt falls back to the default reply;
    // an empty vector swallows the request.
    std::function<std::optional<std::vector<json>>(const json& request)> handler;
};

inline json tool_json(const std::string& name, const std::string& description = "")
{
    return {{"name", name},
            {"description", description},
            {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}};
}

inline json response_json(const json& id, const json& result)
{
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

inline json error_json(const json& id, int code, const std::string& message)
{
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

/**
 * In-memory server behind MockTransport.
 *
 * Shared between the transport (owned by the client) and the test, so the
 * test can inspect traffic and inject lines, crashes or late responses.
 */
class MockServer
{
  public:
    explicit MockServer(MockScript script = MockScript{}) : script_(std::move(script)) {}

    void set_script(MockScript script)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        script_ = std::move(script);
    }

    void update_script(const std::function<void(MockScript&)>& fn)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fn(script_);
    }

    // Transport side

    void connect()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_count_++;
        if (script_.fail_spawn)
            throw McpError("Failed to start server '" + script_.server_name + "': spawn failed");

        queue_.clear();
        exit_code_.reset();
        running_ = true;
        stream_open_ = true;

        if (script_.exit_on_connect)
            end_locked(*script_.exit_on_connect);
        cv_.notify_all();
    }

    void write(const std::string& data)
    {
        json message;
        MockScript script;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_)
                throw ConnectionClosed("mock server is not running");

            message = json::parse(data);
            received_.push_back(message);
            script = script_;
        }
        cv_.notify_all();

        // Notifications and replies to server requests need no answer
        if (!message.contains("method") || !message.contains("id"))
            return;

        std::vector<json> replies;
        std::optional<std::vector<json>> custom;
        if (script.handler)
            custom = script.handler(message);
        if (custom)
            replies = std::move(*custom);
        else if (auto reply = default_reply(script, message))
            replies.push_back(std::move(*reply));

        for (const auto& reply : replies)
            push_line(reply.dump());
    }

    std::vector<std::string> read_lines()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(100),
                     [this] { return !queue_.empty() || !stream_open_; });
        std::vector<std::string> lines(queue_.begin(), queue_.end());
        queue_.clear();
        return lines;
    }

    bool has_messages() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return !queue_.empty() || stream_open_;
    }

    void terminate()
    {
        end(143);
    }

    void kill()
    {
        end(137);
    }

    std::optional<int> wait_for_exit(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !running_; });
        if (running_)
            return std::nullopt;
        return exit_code_;
    }

    void close()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_)
            end_locked(137);
        queue_.clear();
        cv_.notify_all();
    }

    bool is_running() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    // Test side

    // Deliver a raw line as if the server printed it
    void push_line(const std::string& line)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(line);
        }
        cv_.notify_all();
    }

    void push(const json& message)
    {
        push_line(message.dump());
    }

    // The process dies on its own
    void crash(int exit_code)
    {
        end(exit_code);
    }

    int connect_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return connect_count_;
    }

    std::vector<json> received() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    std::vector<json> received_with_method(const std::string& method) const
    {
        std::vector<json> matching;
        for (const auto& message : received())
            if (message.value("method", "") == method)
                matching.push_back(message);
        return matching;
    }

    // Wait until a message satisfying pred was written by the client
    bool wait_for_received(const std::function<bool(const json&)>& pred,
                           std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout,
                            [&]
                            {
                                for (const auto& message : received_)
                                    if (pred(message))
                                        return true;
                                return false;
                            });
    }

  private:
    static std::optional<json> default_reply(const MockScript& script, const json& request)
    {
        const std::string method = request["method"].get<std::string>();
        const json& id = request["id"];

        if (script.ignored_methods.count(method))
            return std::nullopt;
        if (script.failing_methods.count(method))
            return error_json(id, -32603, method + " failed");

        if (method == "initialize")
            return response_json(
                id, {{"protocolVersion", "2024-11-05"},
                     {"capabilities", script.capabilities},
                     {"serverInfo",
                      {{"name", script.server_name}, {"version", script.server_version}}}});
        if (method == "tools/list")
            return response_json(id, {{"tools", script.tools}});
        if (method == "resources/list")
        {
            if (!script.resources)
                return error_json(id, -32601, "Method not found: resources/list");
            return response_json(id, {{"resources", *script.resources}});
        }
        if (method == "prompts/list")
        {
            if (!script.prompts)
                return error_json(id, -32601, "Method not found: prompts/list");
            return response_json(id, {{"prompts", *script.prompts}});
        }
        if (method == "ping")
            return response_json(id, json::object());

        return error_json(id, -32601, "Method not found: " + method);
    }

    void end(int exit_code)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_)
            end_locked(exit_code);
        cv_.notify_all();
    }

    void end_locked(int exit_code)
    {
        running_ = false;
        stream_open_ = false;
        exit_code_ = exit_code;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    MockScript script_;

    std::deque<std::string> queue_;
    bool running_ = false;
    bool stream_open_ = false;
    std::optional<int> exit_code_;
    int connect_count_ = 0;
    std::vector<json> received_;
};

class MockTransport : public Transport
{
  public:
    explicit MockTransport(std::shared_ptr<MockServer> server) : server_(std::move(server)) {}

    void connect() override
    {
        server_->connect();
    }

    void write(const std::string& data) override
    {
        server_->write(data);
    }

    std::vector<std::string> read_lines() override
    {
        return server_->read_lines();
    }

    bool has_messages() const override
    {
        return server_->has_messages();
    }

    void terminate() override
    {
        server_->terminate();
    }

    void kill() override
    {
        server_->kill();
    }

    std::optional<int> wait_for_exit(std::chrono::milliseconds timeout) override
    {
        return server_->wait_for_exit(timeout);
    }

    void close() override
    {
        server_->close();
    }

    bool is_running() const override
    {
        return server_->is_running();
    }

  private:
    std::shared_ptr<MockServer> server_;
};

inline std::shared_ptr<ProtocolClient> make_mock_client(const std::shared_ptr<MockServer>& server,
                                                        const ServerDescriptor& descriptor,
                                                        ClientOptions options = ClientOptions{})
{
    return std::make_shared<ProtocolClient>(descriptor, std::move(options),
                                            std::make_unique<MockTransport>(server));
}

/**
 * Factory handing out clients over fresh MockServers, one per created
 * client. Scripts are chosen by server name, falling back to a default.
 */
class MockServerFarm
{
  public:
    explicit MockServerFarm(MockScript default_script = MockScript{})
        : default_script_(std::move(default_script))
    {
    }

    void set_script(const std::string& name, MockScript script)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[name] = std::move(script);
    }

    ClientFactory factory()
    {
        return [this](const ServerDescriptor& descriptor, const ClientOptions& options)
        {
            std::shared_ptr<MockServer> server;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = scripts_.find(descriptor.name);
                server = std::make_shared<MockServer>(it != scripts_.end() ? it->second
                                                                           : default_script_);
                servers_[descriptor.name].push_back(server);
            }
            return make_mock_client(server, descriptor, options);
        };
    }

    std::vector<std::shared_ptr<MockServer>> servers(const std::string& name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end())
            return {};
        return it->second;
    }

    std::size_t created(const std::string& name) const
    {
        return servers(name).size();
    }

  private:
    mutable std::mutex mutex_;
    MockScript default_script_;
    std::map<std::string, MockScript> scripts_;
    std::map<std::string, std::vector<std::shared_ptr<MockServer>>> servers_;
};

} // namespace mcpmgr::test
