#ifndef MCPMGR_TRANSPORT_HPP
#define MCPMGR_TRANSPORT_HPP

#include <chrono>
#include <mcpmgr/config.hpp>
#include <mcpmgr/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpmgr
{

/**
 * Abstract line transport between a ProtocolClient and one server.
 *
 * This is a low-level interface that handles raw I/O with the server
 * process. ProtocolClient builds the JSON-RPC session on top of it.
 *
 * A transport is reusable: connect() after close() starts a fresh session
 * (the client relies on this for automatic reconnect).
 *
 * Implementations include:
 * - SubprocessTransport: local subprocess using stdin/stdout
 * - Test transports that script a server in memory
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Start the server (spawn the process) and begin reading its output.
     * Throws on spawn failure.
     */
    virtual void connect() = 0;

    /**
     * Write raw data to the server.
     * @param data One serialized JSON-RPC message followed by '\n'
     */
    virtual void write(const std::string& data) = 0;

    /**
     * Return the complete lines received so far, without the trailing
     * newline. Waits briefly (about 100ms) when nothing is buffered.
     * Returns an empty vector when nothing arrived.
     */
    virtual std::vector<std::string> read_lines() = 0;

    /**
     * True while buffered lines remain or the server may still produce
     * output. False once the output stream ended and was drained.
     */
    virtual bool has_messages() const = 0;

    /**
     * Ask the server to stop (SIGTERM for processes).
     */
    virtual void terminate() = 0;

    /**
     * Stop the server forcefully (SIGKILL for processes).
     */
    virtual void kill() = 0;

    /**
     * Wait up to timeout for the server to exit. Returns its exit code,
     * or nullopt if it is still running.
     */
    virtual std::optional<int> wait_for_exit(std::chrono::milliseconds timeout) = 0;

    /**
     * Release pipes and reader threads. The server must have exited or
     * been killed; close() reaps it if needed.
     */
    virtual void close() = 0;

    /**
     * Check if the server is still running.
     */
    virtual bool is_running() const = 0;

    /**
     * Get the process ID for subprocess transports.
     * Returns 0 for non-subprocess transports.
     */
    virtual long get_pid() const
    {
        return 0;
    }
};

// Factory function for the default transport
std::unique_ptr<Transport> create_subprocess_transport(const ServerDescriptor& descriptor,
                                                       const ClientOptions& options);

} // namespace mcpmgr

#endif // MCPMGR_TRANSPORT_HPP
