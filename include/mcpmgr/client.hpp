#ifndef MCPMGR_CLIENT_HPP
#define MCPMGR_CLIENT_HPP

#include <chrono>
#include <mcpmgr/config.hpp>
#include <mcpmgr/events.hpp>
#include <mcpmgr/transport.hpp>
#include <mcpmgr/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpmgr
{

/**
 * JSON-RPC session with one server over a line transport.
 *
 * Thread-safe: request() may be called from many threads at once; responses
 * are matched by id, never by arrival order. connect()/disconnect() are
 * serialized internally.
 *
 * Events are delivered through events() on the client's reader thread.
 */
class ProtocolClient
{
  public:
    explicit ProtocolClient(ServerDescriptor descriptor, ClientOptions options = ClientOptions{});
    // Test-only/advanced: inject a custom transport implementation.
    ProtocolClient(ServerDescriptor descriptor, ClientOptions options,
                   std::unique_ptr<Transport> transport);
    ~ProtocolClient();

    // No copy, move only
    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;
    ProtocolClient(ProtocolClient&&) noexcept;
    ProtocolClient& operator=(ProtocolClient&&) noexcept;

    // Connection lifecycle
    void connect();
    void disconnect();
    bool is_connected() const;
    SessionState state() const;

    // Clear the unavailable mark left by exhausted reconnect attempts
    void reset_unavailable();

    // Returns 0 if not connected
    long get_pid() const;

    /// Send a request and wait for its "result". Throws RequestTimeout,
    /// ConnectionClosed, or RpcError when the server answered with an error.
    json request(const std::string& method, const json& params = nullptr);
    json request(const std::string& method, const json& params, std::chrono::milliseconds timeout);

    /// Fire-and-forget notification
    void notify(const std::string& method, const json& params = nullptr);

    /// tools/list round trip used as a liveness probe; returns the latency
    std::chrono::milliseconds ping();

    std::vector<ToolInfo> get_tools();
    // Servers without resource support yield an empty list
    std::vector<ResourceInfo> get_resources();
    std::vector<PromptInfo> get_prompts();

    const ServerDescriptor& descriptor() const;
    const std::string& name() const;
    std::optional<ServerInfo> server_info() const;
    ClientMetrics metrics() const;

    Signal<ClientEvent>& events();

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpmgr

#endif // MCPMGR_CLIENT_HPP
