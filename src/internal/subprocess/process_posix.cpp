// POSIX implementation of subprocess process management

#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <stdexcept>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcpmgr
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

// A server that exits while we write must surface as EPIPE, not kill us
static void ignore_sigpipe_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

static void close_pair(int fds[2])
{
    for (int i = 0; i < 2; ++i)
    {
        if (fds[i] >= 0)
        {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

// pipe() with both ends close-on-exec; pipe2 is not available on macOS
static bool make_cloexec_pipe(int fds[2])
{
    if (::pipe(fds) != 0)
        return false;
    for (int i = 0; i < 2; ++i)
    {
        if (::fcntl(fds[i], F_SETFD, FD_CLOEXEC) != 0)
        {
            int err = errno;
            close_pair(fds);
            errno = err;
            return false;
        }
    }
    return true;
}

static int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// KEY=VALUE strings for the child, built before fork
static std::vector<std::string> build_environment(const ProcessOptions& options)
{
    std::map<std::string, std::string> merged;
    if (options.inherit_environment && environ != nullptr)
    {
        for (char** entry = environ; *entry != nullptr; ++entry)
        {
            std::string kv(*entry);
            auto eq = kv.find('=');
            if (eq == std::string::npos)
                continue;
            merged[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        merged[key] = value;

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged)
        result.push_back(key + "=" + value);
    return result;
}

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
        throw std::runtime_error("Read failed: " + get_errno_message());

    return static_cast<size_t>(bytes_read);
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(handle_->fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw std::runtime_error("select failed: " + get_errno_message());
    }

    return result > 0 && FD_ISSET(handle_->fd, &read_fds);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

void WritePipe::write_all(const std::string& data)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    size_t offset = 0;
    while (offset < data.size())
    {
        ssize_t written = ::write(handle_->fd, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw std::runtime_error("Broken pipe (process closed stdin)");
            throw std::runtime_error("Write failed: " + get_errno_message());
        }
        offset += static_cast<size_t>(written);
    }
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        kill();
        try
        {
            wait();
        }
        catch (const std::exception&)
        {
            // Already reaped elsewhere; nothing left to clean up
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (handle_->running)
        throw std::runtime_error("Process already running");

    ignore_sigpipe_once();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    // Reports exec failure to the parent; closed by a successful exec
    int exec_pipe[2] = {-1, -1};

    auto cleanup = [&]
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
    };

    if ((options.redirect_stdin && !make_cloexec_pipe(stdin_pipe)) ||
        (options.redirect_stdout && !make_cloexec_pipe(stdout_pipe)) ||
        (options.redirect_stderr && !make_cloexec_pipe(stderr_pipe)) ||
        !make_cloexec_pipe(exec_pipe))
    {
        int err = errno;
        cleanup();
        throw std::runtime_error("Failed to create pipe: " + get_errno_message(err));
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> env_strings = build_environment(options);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings)
        envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        cleanup();
        throw std::runtime_error("Failed to fork process: " + get_errno_message(err));
    }

    if (pid == 0)
    {
        // Child process: only async-signal-safe calls from here on
        auto fail = [&](int err)
        {
            ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        };

        std::signal(SIGPIPE, SIG_DFL);

        if (options.redirect_stdin && dup2(stdin_pipe[0], STDIN_FILENO) < 0)
            fail(errno);
        if (options.redirect_stdout && dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
            fail(errno);
        if (options.redirect_stderr && dup2(stderr_pipe[1], STDERR_FILENO) < 0)
            fail(errno);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            fail(errno);

        execvpe(executable.c_str(), argv.data(), envp.data());
        fail(errno);
    }

    // Parent process
    ::close(exec_pipe[1]);
    exec_pipe[1] = -1;

    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);
    exec_pipe[0] = -1;

    if (n > 0)
    {
        int status = 0;
        waitpid(pid, &status, 0);
        cleanup();
        throw std::runtime_error("Failed to start '" + executable +
                                 "': " + get_errno_message(child_errno));
    }

    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]);
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]);
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::runtime_error("stderr not redirected");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    // Peek without reaping so try_wait() still sees the exit status
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(handle_->pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        return false;
    return info.si_pid == 0;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

} // namespace subprocess
} // namespace mcpmgr
