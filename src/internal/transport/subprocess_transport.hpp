#ifndef MCPMGR_INTERNAL_SUBPROCESS_TRANSPORT_HPP
#define MCPMGR_INTERNAL_SUBPROCESS_TRANSPORT_HPP

#include "../line_buffer.hpp"
#include "../logging.hpp"
#include "../subprocess/process.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mcpmgr/config.hpp>
#include <mcpmgr/transport.hpp>
#include <mcpmgr/types.hpp>
#include <memory>
#include <mutex>
#include <thread>

namespace mcpmgr
{
namespace internal
{

/**
 * Subprocess transport: one server process speaking newline-delimited
 * JSON-RPC over its stdin/stdout.
 *
 * A background thread drains stdout into a line queue until EOF. When a
 * stderr callback is configured, a second thread forwards stderr lines;
 * otherwise the child inherits our stderr.
 */
class SubprocessTransport : public Transport
{
  public:
    SubprocessTransport(ServerDescriptor descriptor, ClientOptions options);
    ~SubprocessTransport() override;

    // Transport interface
    void connect() override;
    void write(const std::string& data) override;
    std::vector<std::string> read_lines() override;
    bool has_messages() const override;
    void terminate() override;
    void kill() override;
    std::optional<int> wait_for_exit(std::chrono::milliseconds timeout) override;
    void close() override;
    bool is_running() const override;
    long get_pid() const override;

  private:
    subprocess::ProcessOptions build_process_options() const;

    // Background reader thread (stdout)
    void reader_loop();
    void stop_reader();

    // Background stderr reader thread
    void stderr_reader_loop();
    void stop_stderr_reader();

    ServerDescriptor descriptor_;
    ClientOptions options_;
    Logger logger_;

    // Guards process_ lifetime, signals and reaping
    mutable std::mutex process_mutex_;
    std::unique_ptr<subprocess::Process> process_;

    LineBuffer line_buffer_;

    // Thread-safe line queue
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> line_queue_;
    bool queue_stopped_ = true;

    // Serialize stdin writes
    std::mutex write_mutex_;

    std::thread reader_thread_;
    std::atomic<bool> running_{false};

    std::thread stderr_reader_thread_;
    std::atomic<bool> stderr_running_{false};
};

} // namespace internal
} // namespace mcpmgr

#endif // MCPMGR_INTERNAL_SUBPROCESS_TRANSPORT_HPP
