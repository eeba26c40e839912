#include "internal/logging.hpp"

#include <atomic>
#include <condition_variable>
#include <mcpmgr/client.hpp>
#include <mcpmgr/errors.hpp>
#include <mcpmgr/protocol/jsonrpc.hpp>
#include <mcpmgr/protocol/request_tracker.hpp>
#include <mcpmgr/version.hpp>
#include <mutex>
#include <thread>

namespace mcpmgr
{

namespace
{
// Exit code lookup after stdout reached EOF
constexpr std::chrono::milliseconds EXIT_CODE_WAIT{1000};

// Malformed lines are logged with this many leading characters
constexpr std::size_t LOG_PREVIEW_CHARS = 100;

std::string preview(const std::string& line)
{
    if (line.size() <= LOG_PREVIEW_CHARS)
        return line;
    return line.substr(0, LOG_PREVIEW_CHARS) + "...";
}

void join_or_detach(std::thread& thread)
{
    if (!thread.joinable())
        return;
    if (thread.get_id() == std::this_thread::get_id())
        thread.detach();
    else
        thread.join();
}
} // namespace

// ProtocolClient::Impl - JSON-RPC session over a Transport
class ProtocolClient::Impl
{
  public:
    ServerDescriptor descriptor_;
    ClientOptions options_;
    std::unique_ptr<Transport> transport_;
    protocol::RequestTracker tracker_;
    internal::Logger logger_;
    Signal<ClientEvent> events_;

    // Single mutation point for state_, metrics_ and server_info_
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    SessionState state_ = SessionState::Disconnected;
    ClientMetrics metrics_;
    std::optional<ServerInfo> server_info_;
    std::optional<int> last_exit_code_;

    // Serializes session setup and teardown
    std::mutex lifecycle_mutex_;

    // Serializes stdin writes
    std::mutex write_mutex_;

    // Background reading
    std::thread reader_thread_;
    std::atomic<bool> reading_{false};

    std::mutex reconnect_mutex_;
    std::thread reconnect_thread_;

    Impl(ServerDescriptor descriptor, ClientOptions options, std::unique_ptr<Transport> transport)
        : descriptor_(std::move(descriptor)), options_(std::move(options)),
          transport_(std::move(transport)),
          logger_("MCPClient:" + descriptor_.name, options_.log_callback)
    {
        if (!transport_)
            transport_ = create_subprocess_transport(descriptor_, options_);
        if (options_.client_version.empty())
            options_.client_version = version_string();
    }

    ~Impl()
    {
        try
        {
            disconnect();
        }
        catch (const std::exception& e)
        {
            logger_.warning(std::string("Error while closing session: ") + e.what());
        }
    }

    // ------------------------------------------------------------------
    // State helpers
    // ------------------------------------------------------------------

    SessionState state() const
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    void record_error(const std::string& message)
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        metrics_.error_count++;
        metrics_.last_error = message;
    }

    ClientEvent make_event(ClientEventType type) const
    {
        ClientEvent event;
        event.type = type;
        event.server_name = descriptor_.name;
        event.timestamp = Clock::now();
        return event;
    }

    void emit_error(const std::string& message)
    {
        auto event = make_event(ClientEventType::Error);
        event.message = message;
        events_.emit(event);
    }

    // ------------------------------------------------------------------
    // Reader
    // ------------------------------------------------------------------

    void start_reader()
    {
        reading_ = true;
        reader_thread_ = std::thread(&Impl::reader_loop, this);
    }

    void reader_loop()
    {
        while (reading_)
        {
            auto lines = transport_->read_lines();

            if (lines.empty() && !transport_->has_messages())
                break; // Output ended

            for (const auto& line : lines)
                handle_line(line);
        }

        // Stopped by teardown: nothing to report
        if (reading_)
            handle_transport_exit();
    }

    void handle_line(const std::string& line)
    {
        protocol::IncomingMessage msg;
        try
        {
            msg = protocol::parse_message(line);
        }
        catch (const McpError& e)
        {
            record_error(e.what());
            logger_.warning("Ignoring malformed line from server: " + preview(line));
            return;
        }

        switch (msg.kind)
        {
        case protocol::MessageKind::Response:
            handle_response(msg);
            break;
        case protocol::MessageKind::Request:
            handle_server_request(msg);
            break;
        case protocol::MessageKind::Notification:
        {
            auto event = make_event(ClientEventType::Notification);
            event.method = msg.method;
            event.params = msg.params;
            events_.emit(event);
            break;
        }
        }
    }

    void handle_response(const protocol::IncomingMessage& msg)
    {
        bool matched = false;
        if (msg.numeric_id)
        {
            if (msg.is_error())
            {
                const json& error = *msg.error;
                std::exception_ptr ex;
                if (error.is_object() && error.contains("data"))
                    ex = std::make_exception_ptr(RpcError(protocol::error_message(error),
                                                          protocol::error_code(error),
                                                          error["data"]));
                else
                    ex = std::make_exception_ptr(
                        RpcError(protocol::error_message(error), protocol::error_code(error)));
                matched = tracker_.reject(*msg.numeric_id, ex);
            }
            else if (auto elapsed = tracker_.resolve(*msg.numeric_id, msg.result))
            {
                matched = true;
                std::lock_guard<std::mutex> lock(state_mutex_);
                metrics_.response_time = *elapsed;
                metrics_.last_activity = Clock::now();
            }
        }

        if (!matched)
        {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                metrics_.stray_responses++;
            }
            logger_.debug("Dropping response with unknown id " + msg.id.dump());
        }
    }

    void handle_server_request(const protocol::IncomingMessage& msg)
    {
        std::string reply;
        if (msg.method == protocol::Method::Ping)
            reply = protocol::build_result(msg.id, json::object());
        else
            reply = protocol::build_error(msg.id, protocol::ErrorCode::MethodNotFound,
                                          "Method not found: " + msg.method);

        try
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            transport_->write(reply);
        }
        catch (const McpError& e)
        {
            logger_.warning("Failed to answer server request '" + msg.method + "': " + e.what());
        }
    }

    // The server closed its output: the process exited or is about to
    void handle_transport_exit()
    {
        auto exit_code = transport_->wait_for_exit(EXIT_CODE_WAIT);

        bool was_connected = false;
        bool reconnect = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            last_exit_code_ = exit_code;
            if (state_ == SessionState::Connected)
            {
                was_connected = true;
                reconnect = options_.auto_reconnect && options_.max_reconnect_attempts > 0 &&
                            (!exit_code || *exit_code != 0);
                state_ = reconnect ? SessionState::Reconnecting : SessionState::Disconnected;
                metrics_.is_connected = false;
            }
        }

        std::string reason = "Server '" + descriptor_.name + "' exited";
        if (exit_code)
            reason += " with code " + std::to_string(*exit_code);
        tracker_.close(reason);

        if (!was_connected)
            return;

        logger_.info(reason);

        auto event = make_event(ClientEventType::Disconnected);
        event.exit_code = exit_code;
        event.message = reason;
        events_.emit(event);

        if (reconnect)
            schedule_reconnect();
    }

    // ------------------------------------------------------------------
    // Reconnect
    // ------------------------------------------------------------------

    void schedule_reconnect()
    {
        std::thread previous;
        {
            std::lock_guard<std::mutex> lock(reconnect_mutex_);
            previous = std::move(reconnect_thread_);
            reconnect_thread_ = std::thread(&Impl::reconnect_loop, this);
        }
        // A previous reconnect thread has already finished its work
        join_or_detach(previous);
    }

    void reconnect_loop()
    {
        const int max_attempts = options_.max_reconnect_attempts;
        for (int attempt = 1; attempt <= max_attempts; ++attempt)
        {
            {
                // Any other state means disconnect() or connect() took over
                std::unique_lock<std::mutex> lock(state_mutex_);
                if (state_ != SessionState::Reconnecting)
                    return;
                metrics_.retry_attempts = attempt;

                auto delay = options_.reconnect_base_delay * attempt;
                if (state_cv_.wait_for(lock, delay,
                                       [this] { return state_ != SessionState::Reconnecting; }))
                    return;
            }

            logger_.info("Reconnect attempt " + std::to_string(attempt) + "/" +
                         std::to_string(max_attempts));
            try
            {
                connect(true);
                std::lock_guard<std::mutex> lock(state_mutex_);
                metrics_.retry_attempts = 0;
                return;
            }
            catch (const std::exception& e)
            {
                logger_.warning("Reconnect attempt " + std::to_string(attempt) +
                                " failed: " + e.what());
            }
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != SessionState::Reconnecting)
                return;
            state_ = SessionState::Unavailable;
            metrics_.is_connected = false;
        }

        logger_.warning("Giving up after " + std::to_string(max_attempts) +
                        " reconnect attempts; server marked unavailable");

        auto event = make_event(ClientEventType::Disconnected);
        event.reconnect_exhausted = true;
        event.message = "Reconnect attempts exhausted";
        events_.emit(event);
    }

    // ------------------------------------------------------------------
    // Session setup and teardown
    // ------------------------------------------------------------------

    // Requires lifecycle_mutex_
    void teardown_session()
    {
        reading_ = false;

        if (transport_->is_running())
        {
            transport_->terminate();
            if (!transport_->wait_for_exit(options_.shutdown_grace))
            {
                logger_.warning("Server did not exit within " +
                                std::to_string(options_.shutdown_grace.count()) +
                                "ms; killing it");
                transport_->kill();
            }
        }
        transport_->close();

        join_or_detach(reader_thread_);
    }

    void connect(bool from_reconnect = false)
    {
        {
            std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                switch (state_)
                {
                case SessionState::Connected:
                    return;
                case SessionState::Unavailable:
                    throw ServerUnavailableError("Server '" + descriptor_.name +
                                                 "' is unavailable after failed reconnects");
                case SessionState::Closing:
                    throw ConnectionClosed("Server '" + descriptor_.name +
                                           "' is disconnecting");
                default:
                    break;
                }
            }

            // Remains of a previous session; its reader must be gone before reopen()
            teardown_session();
            tracker_.reopen();

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (state_ == SessionState::Closing)
                    throw ConnectionClosed("Server '" + descriptor_.name + "' is disconnecting");
                state_ = SessionState::Connecting;
                last_exit_code_.reset();
            }

            try
            {
                open_session();
            }
            catch (const std::exception& e)
            {
                teardown_session();
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    if (state_ != SessionState::Closing)
                        state_ = from_reconnect ? SessionState::Reconnecting
                                                : SessionState::Disconnected;
                    metrics_.is_connected = false;
                    metrics_.error_count++;
                    metrics_.last_error = e.what();
                }
                emit_error(e.what());
                throw;
            }
        }

        events_.emit(make_event(ClientEventType::Connected));
    }

    // Spawn, handshake and initial probe. Requires lifecycle_mutex_.
    void open_session()
    {
        try
        {
            transport_->connect();
        }
        catch (const McpError& e)
        {
            throw HandshakeError(e.what());
        }
        start_reader();

        json params = {{"protocolVersion", options_.protocol_version},
                       {"capabilities",
                        {{"tools", json::object()},
                         {"resources", json::object()},
                         {"prompts", json::object()}}},
                       {"clientInfo",
                        {{"name", options_.client_name}, {"version", options_.client_version}}}};

        json result;
        try
        {
            result = send_request(protocol::Method::Initialize, params, options_.connect_timeout);
        }
        catch (const RequestTimeout&)
        {
            throw HandshakeError("No initialize response from '" + descriptor_.name + "' within " +
                                 std::to_string(options_.connect_timeout.count()) + "ms");
        }
        catch (const RpcError& e)
        {
            throw HandshakeError("Server '" + descriptor_.name +
                                 "' rejected initialize: " + e.what());
        }
        catch (const ConnectionClosed& e)
        {
            std::optional<int> exit_code;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                exit_code = last_exit_code_;
            }
            std::string message = "Server '" + descriptor_.name +
                                  "' closed the connection during initialize: " + e.what();
            if (exit_code)
                throw HandshakeError(message, *exit_code);
            throw HandshakeError(message);
        }

        if (!result.is_object())
            throw HandshakeError("Malformed initialize response from '" + descriptor_.name + "'");

        auto info = ServerInfo::from_initialize_result(result);

        write_line(protocol::build_notification(protocol::Method::Initialized));

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == SessionState::Closing)
                throw ConnectionClosed("Server '" + descriptor_.name + "' is disconnecting");
            state_ = SessionState::Connected;
            server_info_ = info;
            metrics_.server_info = info;
            metrics_.is_connected = true;
            metrics_.last_activity = Clock::now();
        }

        logger_.info("Connected to " + (info.name.empty() ? descriptor_.name : info.name) +
                     (info.version.empty() ? "" : " " + info.version));

        // Warm metrics; a failing probe does not fail the connect
        try
        {
            list_tools();
            list_resources();
        }
        catch (const McpError& e)
        {
            record_error(e.what());
            logger_.warning(std::string("Initial capability probe failed: ") + e.what());
        }
    }

    void disconnect()
    {
        SessionState previous;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            previous = state_;
            if (previous != SessionState::Disconnected && previous != SessionState::Unavailable)
                state_ = SessionState::Closing;
        }
        state_cv_.notify_all();

        // Fail waiters (including an in-flight handshake) right away
        tracker_.close("Client disconnected from '" + descriptor_.name + "'");

        std::thread reconnect;
        {
            std::lock_guard<std::mutex> lock(reconnect_mutex_);
            reconnect = std::move(reconnect_thread_);
        }
        join_or_detach(reconnect);

        {
            std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
            teardown_session();
        }

        if (previous == SessionState::Disconnected || previous == SessionState::Unavailable)
            return;

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = SessionState::Disconnected;
            metrics_.is_connected = false;
            metrics_.retry_attempts = 0;
        }

        if (previous == SessionState::Connected || previous == SessionState::Reconnecting)
        {
            auto event = make_event(ClientEventType::Disconnected);
            event.message = "Disconnected by client";
            events_.emit(event);
        }
    }

    void reset_unavailable()
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Unavailable)
        {
            state_ = SessionState::Disconnected;
            metrics_.retry_attempts = 0;
        }
    }

    // ------------------------------------------------------------------
    // Requests
    // ------------------------------------------------------------------

    void write_line(const std::string& line)
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        transport_->write(line);
    }

    json send_request(const std::string& method, const json& params,
                      std::chrono::milliseconds timeout)
    {
        std::int64_t id = tracker_.next_id();
        auto future = tracker_.register_request(id, method);

        try
        {
            write_line(protocol::build_request(id, method, params));
        }
        catch (const McpError& e)
        {
            tracker_.cancel(id);
            record_error(e.what());
            throw ConnectionClosed(std::string("Failed to send ") + method + ": " + e.what());
        }

        if (future.wait_for(timeout) != std::future_status::ready)
        {
            // cancel() fails only when the response won the race
            if (tracker_.cancel(id))
            {
                std::string message = method + " to '" + descriptor_.name + "' timed out after " +
                                      std::to_string(timeout.count()) + "ms";
                record_error(message);
                throw RequestTimeout(message, method, id);
            }
        }

        return future.get();
    }

    json request(const std::string& method, const json& params, std::chrono::milliseconds timeout)
    {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != SessionState::Connected)
                throw ConnectionClosed("Server '" + descriptor_.name + "' is not connected (" +
                                       to_string(state_) + ")");
        }
        return send_request(method, params, timeout);
    }

    std::vector<ToolInfo> list_tools()
    {
        json result = send_request(protocol::Method::ToolsList, nullptr, options_.request_timeout);

        std::vector<ToolInfo> tools;
        try
        {
            if (result.is_object() && result.contains("tools") && result["tools"].is_array())
                for (const auto& tool : result["tools"])
                    tools.push_back(ToolInfo::from_json(tool));
        }
        catch (const json::exception& e)
        {
            throw MessageParseError(std::string("Malformed tools/list result: ") + e.what(),
                                    result);
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        metrics_.tool_count = tools.size();
        return tools;
    }

    // Servers without resources answer with an error or not at all; that is an
    // empty list. Only a lost session propagates.
    std::vector<ResourceInfo> list_resources()
    {
        std::vector<ResourceInfo> resources;
        try
        {
            json result =
                send_request(protocol::Method::ResourcesList, nullptr, options_.request_timeout);
            if (result.is_object() && result.contains("resources") &&
                result["resources"].is_array())
                for (const auto& resource : result["resources"])
                    resources.push_back(ResourceInfo::from_json(resource));
        }
        catch (const RpcError& e)
        {
            logger_.debug(std::string("resources/list not supported: ") + e.what());
        }
        catch (const ConnectionClosed&)
        {
            throw;
        }
        catch (const McpError& e)
        {
            logger_.warning(std::string("resources/list failed, assuming no resources: ") +
                            e.what());
        }
        catch (const json::exception& e)
        {
            logger_.warning(std::string("Malformed resources/list result: ") + e.what());
            resources.clear();
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        metrics_.resource_count = resources.size();
        return resources;
    }

    std::vector<PromptInfo> list_prompts()
    {
        json result = send_request(protocol::Method::PromptsList, nullptr, options_.request_timeout);

        std::vector<PromptInfo> prompts;
        try
        {
            if (result.is_object() && result.contains("prompts") && result["prompts"].is_array())
                for (const auto& prompt : result["prompts"])
                    prompts.push_back(PromptInfo::from_json(prompt));
        }
        catch (const json::exception& e)
        {
            throw MessageParseError(std::string("Malformed prompts/list result: ") + e.what(),
                                    result);
        }
        return prompts;
    }

    void require_connected() const
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::Connected)
            throw ConnectionClosed("Server '" + descriptor_.name + "' is not connected (" +
                                   to_string(state_) + ")");
    }

    ClientMetrics metrics() const
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ClientMetrics snapshot = metrics_;
        snapshot.status = state_;
        snapshot.is_connected = state_ == SessionState::Connected;
        return snapshot;
    }
};

// ============================================================================
// ProtocolClient
// ============================================================================

ProtocolClient::ProtocolClient(ServerDescriptor descriptor, ClientOptions options)
    : impl_(std::make_unique<Impl>(std::move(descriptor), std::move(options), nullptr))
{
}

ProtocolClient::ProtocolClient(ServerDescriptor descriptor, ClientOptions options,
                               std::unique_ptr<Transport> transport)
    : impl_(std::make_unique<Impl>(std::move(descriptor), std::move(options),
                                   std::move(transport)))
{
}

ProtocolClient::~ProtocolClient() = default;

ProtocolClient::ProtocolClient(ProtocolClient&&) noexcept = default;
ProtocolClient& ProtocolClient::operator=(ProtocolClient&&) noexcept = default;

void ProtocolClient::connect()
{
    impl_->connect();
}

void ProtocolClient::disconnect()
{
    impl_->disconnect();
}

bool ProtocolClient::is_connected() const
{
    return impl_->state() == SessionState::Connected;
}

SessionState ProtocolClient::state() const
{
    return impl_->state();
}

void ProtocolClient::reset_unavailable()
{
    impl_->reset_unavailable();
}

long ProtocolClient::get_pid() const
{
    if (!is_connected())
        return 0;
    return impl_->transport_->get_pid();
}

json ProtocolClient::request(const std::string& method, const json& params)
{
    return impl_->request(method, params, impl_->options_.request_timeout);
}

json ProtocolClient::request(const std::string& method, const json& params,
                             std::chrono::milliseconds timeout)
{
    return impl_->request(method, params, timeout);
}

void ProtocolClient::notify(const std::string& method, const json& params)
{
    impl_->require_connected();
    impl_->write_line(protocol::build_notification(method, params));
}

std::chrono::milliseconds ProtocolClient::ping()
{
    impl_->require_connected();

    auto start = std::chrono::steady_clock::now();
    try
    {
        impl_->list_tools();
    }
    catch (const McpError& e)
    {
        impl_->record_error(std::string("Ping failed: ") + e.what());
        throw;
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::lock_guard<std::mutex> lock(impl_->state_mutex_);
    impl_->metrics_.response_time = latency;
    impl_->metrics_.last_activity = Clock::now();
    return latency;
}

std::vector<ToolInfo> ProtocolClient::get_tools()
{
    impl_->require_connected();
    return impl_->list_tools();
}

std::vector<ResourceInfo> ProtocolClient::get_resources()
{
    impl_->require_connected();
    return impl_->list_resources();
}

std::vector<PromptInfo> ProtocolClient::get_prompts()
{
    impl_->require_connected();
    return impl_->list_prompts();
}

const ServerDescriptor& ProtocolClient::descriptor() const
{
    return impl_->descriptor_;
}

const std::string& ProtocolClient::name() const
{
    return impl_->descriptor_.name;
}

std::optional<ServerInfo> ProtocolClient::server_info() const
{
    std::lock_guard<std::mutex> lock(impl_->state_mutex_);
    return impl_->server_info_;
}

ClientMetrics ProtocolClient::metrics() const
{
    return impl_->metrics();
}

Signal<ClientEvent>& ProtocolClient::events()
{
    return impl_->events_;
}

} // namespace mcpmgr
