#include "../../src/internal/subprocess/process.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace mcpmgr::subprocess;

namespace
{
// Everything the pipe produces until EOF
std::string read_all(ReadPipe& pipe)
{
    std::string output;
    char buffer[256];
    while (true)
    {
        size_t n = pipe.read(buffer, sizeof(buffer));
        if (n == 0)
            break;
        output.append(buffer, n);
    }
    return output;
}
} // namespace

// Test basic process spawn
TEST(ProcessTest, SpawnEcho)
{
    Process proc;
    proc.spawn("echo", {"Hello"});

    EXPECT_GT(proc.pid(), 0);
    EXPECT_EQ(proc.wait(), 0);
}

// Test stdout capture
TEST(ProcessTest, CaptureStdout)
{
    Process proc;
    proc.spawn("echo", {"TestOutput"});

    std::string output = read_all(proc.stdout_pipe());
    EXPECT_EQ(output, "TestOutput\n");
    proc.wait();
}

// Test stdin write
TEST(ProcessTest, WriteStdin)
{
    Process proc;
    proc.spawn("cat", {});

    proc.stdin_pipe().write_all("Hello\n");
    proc.stdin_pipe().close(); // EOF

    EXPECT_EQ(read_all(proc.stdout_pipe()), "Hello\n");
    EXPECT_EQ(proc.wait(), 0);
}

TEST(ProcessTest, ExitCodeIsReported)
{
    Process proc;
    proc.spawn("sh", {"-c", "exit 3"});
    EXPECT_EQ(proc.wait(), 3);
}

TEST(ProcessTest, MissingExecutableThrows)
{
    Process proc;
    EXPECT_THROW(proc.spawn("mcpmgr-definitely-not-a-command", {}), std::runtime_error);
}

// Test process termination
TEST(ProcessTest, Terminate)
{
    Process proc;
    proc.spawn("sleep", {"10"});
    EXPECT_TRUE(proc.is_running());

    proc.terminate();
    int exit_code = proc.wait();

    // Killed by SIGTERM
    EXPECT_EQ(exit_code, 128 + 15);
    EXPECT_FALSE(proc.is_running());
}

TEST(ProcessTest, TryWaitWhileRunning)
{
    Process proc;
    proc.spawn("sleep", {"10"});

    EXPECT_FALSE(proc.try_wait().has_value());
    // Peeking does not reap
    EXPECT_TRUE(proc.is_running());

    proc.kill();
    EXPECT_EQ(proc.wait(), 128 + 9);
}

TEST(ProcessTest, EnvironmentOverrides)
{
    Process proc;
    ProcessOptions options;
    options.environment["MCPMGR_TEST_VALUE"] = "forty-two";
    proc.spawn("sh", {"-c", "printf %s \"$MCPMGR_TEST_VALUE\""}, options);

    EXPECT_EQ(read_all(proc.stdout_pipe()), "forty-two");
    proc.wait();
}

TEST(ProcessTest, WorkingDirectory)
{
    Process proc;
    ProcessOptions options;
    options.working_directory = "/";
    proc.spawn("pwd", {}, options);

    EXPECT_EQ(read_all(proc.stdout_pipe()), "/\n");
    proc.wait();
}

TEST(ProcessTest, HasDataTimesOutOnSilentChild)
{
    Process proc;
    proc.spawn("sleep", {"10"});

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(proc.stdout_pipe().has_data(50));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));

    proc.kill();
    proc.wait();
}

TEST(ProcessTest, WriteToExitedChildThrows)
{
    Process proc;
    proc.spawn("true", {});
    proc.wait();

    // EPIPE instead of SIGPIPE
    EXPECT_THROW(
        {
            for (int i = 0; i < 64; ++i)
                proc.stdin_pipe().write_all(std::string(4096, 'x'));
        },
        std::runtime_error);
}

// Test that pipes are close-on-exec: a later child must not hold an
// earlier child's stdin open, or the earlier child never sees EOF
TEST(ProcessTest, PipesAreNotInheritedBySiblings)
{
    Process reader;
    reader.spawn("cat", {});

    Process sibling;
    sibling.spawn("sleep", {"5"});

    reader.stdin_pipe().close();
    ASSERT_TRUE(reader.stdout_pipe().has_data(2000));
    EXPECT_EQ(read_all(reader.stdout_pipe()), "");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    std::optional<int> exit_code;
    while (!exit_code && std::chrono::steady_clock::now() < deadline)
    {
        exit_code = reader.try_wait();
        if (!exit_code)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(exit_code.value_or(-1), 0);

    sibling.kill();
    sibling.wait();
}
