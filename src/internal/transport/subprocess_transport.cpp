#include "subprocess_transport.hpp"

#include <chrono>
#include <mcpmgr/errors.hpp>

namespace mcpmgr
{
namespace internal
{

namespace
{
constexpr int POLL_INTERVAL_MS = 100;
} // namespace

SubprocessTransport::SubprocessTransport(ServerDescriptor descriptor, ClientOptions options)
    : descriptor_(std::move(descriptor)), options_(std::move(options)),
      logger_("Transport:" + descriptor_.name, options_.log_callback),
      line_buffer_(options_.max_line_size)
{
}

SubprocessTransport::~SubprocessTransport()
{
    close();
}

subprocess::ProcessOptions SubprocessTransport::build_process_options() const
{
    subprocess::ProcessOptions proc_opts;
    proc_opts.redirect_stdin = true;
    proc_opts.redirect_stdout = true;
    // Redirect stderr if callback is present
    proc_opts.redirect_stderr = options_.stderr_callback.has_value();
    proc_opts.inherit_environment = options_.inherit_environment;

    if (descriptor_.cwd)
        proc_opts.working_directory = *descriptor_.cwd;

    // Descriptor variables always override inherited ones
    for (const auto& [key, value] : descriptor_.env)
        proc_opts.environment[key] = value;

    return proc_opts;
}

void SubprocessTransport::connect()
{
    if (is_running())
        return; // Already connected

    // Leftovers of a previous session
    close();

    if (descriptor_.command.empty())
        throw McpError("Server '" + descriptor_.name + "' has no command");

    auto process = std::make_unique<subprocess::Process>();
    try
    {
        process->spawn(descriptor_.command, descriptor_.args, build_process_options());
    }
    catch (const std::runtime_error& e)
    {
        throw McpError("Failed to start server '" + descriptor_.name + "': " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        line_queue_.clear();
        queue_stopped_ = false;
    }
    line_buffer_.clear_buffer();

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process_ = std::move(process);
    }

    logger_.debug("Spawned '" + descriptor_.command + "' (pid " + std::to_string(get_pid()) +
                  ")");

    running_ = true;
    reader_thread_ = std::thread(&SubprocessTransport::reader_loop, this);

    if (options_.stderr_callback.has_value())
    {
        stderr_running_ = true;
        stderr_reader_thread_ = std::thread(&SubprocessTransport::stderr_reader_loop, this);
    }
}

void SubprocessTransport::write(const std::string& data)
{
    std::lock_guard<std::mutex> write_lock(write_mutex_);

    subprocess::WritePipe* pipe = nullptr;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (!process_)
            throw ConnectionClosed("Cannot write: server '" + descriptor_.name +
                                   "' is not running");
        pipe = &process_->stdin_pipe();
    }

    // process_ is only replaced by connect()/close(), which the client
    // never runs concurrently with writes
    try
    {
        pipe->write_all(data);
    }
    catch (const std::runtime_error& e)
    {
        throw ConnectionClosed("Write to server '" + descriptor_.name + "' failed: " + e.what());
    }
}

std::vector<std::string> SubprocessTransport::read_lines()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);

    // Wait for lines with timeout
    queue_cv_.wait_for(lock, std::chrono::milliseconds(POLL_INTERVAL_MS),
                       [this] { return !line_queue_.empty() || queue_stopped_; });

    std::vector<std::string> lines(std::make_move_iterator(line_queue_.begin()),
                                   std::make_move_iterator(line_queue_.end()));
    line_queue_.clear();
    return lines;
}

bool SubprocessTransport::has_messages() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return !line_queue_.empty() || !queue_stopped_;
}

void SubprocessTransport::terminate()
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (process_)
        process_->terminate();
}

void SubprocessTransport::kill()
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (process_)
        process_->kill();
}

std::optional<int> SubprocessTransport::wait_for_exit(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        {
            std::lock_guard<std::mutex> lock(process_mutex_);
            if (!process_)
                return std::nullopt;
            if (auto code = process_->try_wait())
                return code;
        }

        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void SubprocessTransport::close()
{
    // Closing stdin is the polite end-of-session signal for stdio servers
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (process_ && process_->stdin_pipe().is_open())
            process_->stdin_pipe().close();
    }

    std::unique_ptr<subprocess::Process> process;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (process_ && process_->is_running())
            process_->kill();
    }

    // Stop reader threads
    stop_reader();
    stop_stderr_reader();

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process = std::move(process_);
    }

    if (process)
    {
        try
        {
            process->wait();
        }
        catch (const std::runtime_error& e)
        {
            logger_.warning(std::string("Failed to reap server process: ") + e.what());
        }
        process.reset();
    }

    // Clear line queue
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        line_queue_.clear();
        queue_stopped_ = true;
    }
    queue_cv_.notify_all();
}

bool SubprocessTransport::is_running() const
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    return process_ && process_->is_running();
}

long SubprocessTransport::get_pid() const
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (process_)
        return static_cast<long>(process_->pid());
    return 0;
}

void SubprocessTransport::reader_loop()
{
    subprocess::ReadPipe* pipe = nullptr;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (process_)
            pipe = &process_->stdout_pipe();
    }

    try
    {
        // Read until EOF so output written right before exit is not lost
        while (running_ && pipe != nullptr)
        {
            if (!pipe->has_data(POLL_INTERVAL_MS))
                continue;

            char buffer[4096];
            size_t n = pipe->read(buffer, sizeof(buffer));
            if (n == 0)
                break; // EOF reached

            std::vector<std::string> lines;
            try
            {
                lines = line_buffer_.add_data(std::string(buffer, n));
            }
            catch (const JSONDecodeError& e)
            {
                logger_.warning(std::string("Dropping oversized output: ") + e.what());
                continue;
            }

            if (!lines.empty())
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                for (auto& line : lines)
                    line_queue_.push_back(std::move(line));
                queue_cv_.notify_all();
            }
        }

        if (auto rest = line_buffer_.take_remainder())
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            line_queue_.push_back(std::move(*rest));
        }
    }
    catch (const std::exception& e)
    {
        logger_.warning(std::string("Reading server output failed: ") + e.what());
    }

    // Mark queue as stopped
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_stopped_ = true;
    }
    queue_cv_.notify_all();
}

void SubprocessTransport::stop_reader()
{
    running_ = false;
    if (reader_thread_.joinable())
        reader_thread_.join();
}

void SubprocessTransport::stderr_reader_loop()
{
    subprocess::ReadPipe* pipe = nullptr;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (process_)
            pipe = &process_->stderr_pipe();
    }

    LineBuffer stderr_lines(options_.max_line_size);
    auto forward = [this](const std::string& line)
    {
        try
        {
            (*options_.stderr_callback)(line);
        }
        catch (const std::exception& e)
        {
            logger_.warning(std::string("stderr callback threw: ") + e.what());
        }
    };

    try
    {
        while (stderr_running_ && pipe != nullptr)
        {
            if (!pipe->has_data(POLL_INTERVAL_MS))
                continue;

            char buffer[4096];
            size_t n = pipe->read(buffer, sizeof(buffer));
            if (n == 0)
                break;

            for (const auto& line : stderr_lines.add_data(std::string(buffer, n)))
                forward(line);
        }

        if (auto rest = stderr_lines.take_remainder())
            forward(*rest);
    }
    catch (const std::exception& e)
    {
        logger_.debug(std::string("stderr reader stopped: ") + e.what());
    }
}

void SubprocessTransport::stop_stderr_reader()
{
    stderr_running_ = false;
    if (stderr_reader_thread_.joinable())
        stderr_reader_thread_.join();
}

} // namespace internal

// Factory function
std::unique_ptr<Transport> create_subprocess_transport(const ServerDescriptor& descriptor,
                                                       const ClientOptions& options)
{
    return std::make_unique<internal::SubprocessTransport>(descriptor, options);
}

} // namespace mcpmgr
