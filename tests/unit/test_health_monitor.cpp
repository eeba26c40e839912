#include "../fixtures/mock_transport.hpp"
#include "../test_utils.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <mcpmgr/errors.hpp>
#include <mcpmgr/health_monitor.hpp>
#include <mutex>
#include <vector>

using namespace mcpmgr;
using namespace mcpmgr::test;
using namespace std::chrono;

namespace
{
MockScript two_tools()
{
    MockScript script;
    script.tools = json::array({tool_json("a"), tool_json("b")});
    return script;
}

// Manually advanced wall clock
struct FakeClock
{
    std::mutex mutex;
    TimePoint current = TimePoint(hours(24 * 365 * 50));

    TimePoint now()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return current;
    }

    void advance(milliseconds delta)
    {
        std::lock_guard<std::mutex> lock(mutex);
        current += delta;
    }
};

MonitorOptions options_for(MockServerFarm& farm)
{
    MonitorOptions options;
    // Tests drive pings by hand unless they shorten this
    options.ping_interval = hours(1);
    options.refresh_batch_delay = milliseconds(10);
    options.client_factory = farm.factory();
    options.client_options.connect_timeout = milliseconds(1000);
    options.client_options.request_timeout = milliseconds(100);
    options.client_options.shutdown_grace = milliseconds(100);
    options.client_options.auto_reconnect = false;
    options.client_options.log_callback = quiet_log();
    options.log_callback = quiet_log();
    return options;
}

struct MonitorLog
{
    std::mutex mutex;
    std::vector<ConnectionStatus> statuses;
    std::vector<MonitorEvent> events;

    void attach(HealthMonitor& monitor)
    {
        monitor.status_changes().connect(
            [this](const ConnectionStatus& status)
            {
                std::lock_guard<std::mutex> lock(mutex);
                statuses.push_back(status);
            });
        monitor.events().connect(
            [this](const MonitorEvent& event)
            {
                std::lock_guard<std::mutex> lock(mutex);
                events.push_back(event);
            });
    }

    std::size_t count(MonitorEventType type)
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const auto& event : events)
            if (event.type == type)
                ++n;
        return n;
    }

    std::vector<ConnectionState> states()
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<ConnectionState> result;
        for (const auto& status : statuses)
            result.push_back(status.status);
        return result;
    }
};

void set_tools_list_ignored(MockServerFarm& farm, const std::string& name, bool ignored)
{
    for (const auto& server : farm.servers(name))
        server->update_script(
            [ignored](MockScript& s)
            {
                if (ignored)
                    s.ignored_methods.insert("tools/list");
                else
                    s.ignored_methods.erase("tools/list");
            });
}
} // namespace

TEST(HealthMonitorTest, StartMonitoringConnects)
{
    MockServerFarm farm(two_tools());
    HealthMonitor monitor(options_for(farm));
    MonitorLog log;
    log.attach(monitor);

    monitor.start_monitoring("srv", mock_descriptor("srv"));

    auto status = monitor.get_connection_status("srv");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, ConnectionState::Connected);
    EXPECT_EQ(status->error_count, 0);
    EXPECT_TRUE(status->connected_at.has_value());
    EXPECT_EQ(monitor.get_connected_count(), 1u);

    auto states = log.states();
    ASSERT_GE(states.size(), 2u);
    EXPECT_EQ(states.front(), ConnectionState::Connecting);
    EXPECT_EQ(states.back(), ConnectionState::Connected);
    EXPECT_EQ(log.count(MonitorEventType::Connected), 1u);

    auto metrics = monitor.get_real_metrics("srv");
    ASSERT_TRUE(metrics.has_value());
    EXPECT_EQ(metrics->tool_count, 2u);
}

TEST(HealthMonitorTest, ThreeFailedPingsEnterErrorAndRecover)
{
    MockServerFarm farm(two_tools());
    HealthMonitor monitor(options_for(farm));
    MonitorLog log;
    log.attach(monitor);
    monitor.start_monitoring("srv", mock_descriptor("srv"));

    set_tools_list_ignored(farm, "srv", true);

    monitor.ping_server("srv");
    EXPECT_EQ(monitor.get_connection_status("srv")->status, ConnectionState::Connected);
    EXPECT_EQ(monitor.get_connection_status("srv")->error_count, 1);

    monitor.ping_server("srv");
    EXPECT_EQ(monitor.get_connection_status("srv")->status, ConnectionState::Connected);
    EXPECT_EQ(monitor.get_connection_status("srv")->error_count, 2);

    monitor.ping_server("srv");
    auto failed = monitor.get_connection_status("srv");
    EXPECT_EQ(failed->status, ConnectionState::Error);
    EXPECT_EQ(failed->error_count, 3);
    EXPECT_TRUE(failed->last_error.has_value());
    EXPECT_EQ(log.count(MonitorEventType::Error), 1u);
    EXPECT_EQ(monitor.get_health_record("srv")->consecutive_errors, 3);

    // error is not terminal
    set_tools_list_ignored(farm, "srv", false);
    monitor.ping_server("srv");

    auto recovered = monitor.get_connection_status("srv");
    EXPECT_EQ(recovered->status, ConnectionState::Connected);
    EXPECT_EQ(recovered->error_count, 0);
    EXPECT_EQ(monitor.get_health_record("srv")->consecutive_errors, 0);
    EXPECT_EQ(log.count(MonitorEventType::Ping), 1u);
}

TEST(HealthMonitorTest, ConnectFailureLeavesErrorStatus)
{
    MockServerFarm farm(two_tools());
    MockScript broken;
    broken.fail_spawn = true;
    farm.set_script("bad", broken);
    HealthMonitor monitor(options_for(farm));
    MonitorLog log;
    log.attach(monitor);

    EXPECT_THROW(monitor.start_monitoring("bad", mock_descriptor("bad")), HandshakeError);

    auto status = monitor.get_connection_status("bad");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, ConnectionState::Error);
    EXPECT_EQ(status->error_count, 1);
    EXPECT_EQ(monitor.get_health_record("bad")->consecutive_errors, 1);
    EXPECT_EQ(log.count(MonitorEventType::Error), 1u);
    EXPECT_EQ(monitor.get_connected_count(), 0u);
}

TEST(HealthMonitorTest, StopMonitoringEmitsFinalDisconnect)
{
    MockServerFarm farm(two_tools());
    HealthMonitor monitor(options_for(farm));
    MonitorLog log;
    log.attach(monitor);
    monitor.start_monitoring("srv", mock_descriptor("srv"));

    monitor.stop_monitoring("srv");

    EXPECT_FALSE(monitor.get_connection_status("srv").has_value());
    EXPECT_EQ(log.states().back(), ConnectionState::Disconnected);
    EXPECT_EQ(log.count(MonitorEventType::Disconnected), 1u);
    EXPECT_FALSE(farm.servers("srv").front()->is_running());

    // Stopping an unknown name is harmless
    monitor.stop_monitoring("srv");
    EXPECT_EQ(log.count(MonitorEventType::Disconnected), 1u);
}

TEST(HealthMonitorTest, RestartReplacesTheSession)
{
    MockServerFarm farm(two_tools());
    HealthMonitor monitor(options_for(farm));
    monitor.start_monitoring("srv", mock_descriptor("srv"));
    monitor.start_monitoring("srv", mock_descriptor("srv"));

    auto servers = farm.servers("srv");
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_FALSE(servers[0]->is_running());
    EXPECT_TRUE(servers[1]->is_running());
    EXPECT_EQ(monitor.get_all_connection_statuses().size(), 1u);
}

TEST(HealthMonitorTest, ServerExitUpdatesStatus)
{
    MockServerFarm farm(two_tools());
    HealthMonitor monitor(options_for(farm));
    monitor.start_monitoring("srv", mock_descriptor("srv"));

    farm.servers("srv").front()->crash(1);

    EXPECT_TRUE(wait_until(
        [&]
        { return monitor.get_connection_status("srv")->status == ConnectionState::Disconnected; }));
    EXPECT_FALSE(monitor.get_real_metrics("srv").has_value());
    EXPECT_EQ(monitor.get_servers_needing_refresh(), std::vector<std::string>{"srv"});
}

TEST(HealthMonitorTest, TimerDrivesPings)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.ping_interval = milliseconds(20);
    HealthMonitor monitor(options);
    MonitorLog log;
    log.attach(monitor);

    monitor.start_monitoring("srv", mock_descriptor("srv"));
    EXPECT_TRUE(wait_until([&] { return log.count(MonitorEventType::Ping) >= 2; }));

    monitor.stop_all();
    auto pings = log.count(MonitorEventType::Ping);
    std::this_thread::sleep_for(milliseconds(80));
    EXPECT_EQ(log.count(MonitorEventType::Ping), pings);
}

TEST(HealthMonitorTest, SmartRefreshSkipsFreshServers)
{
    FakeClock clock;
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.now = [&clock] { return clock.now(); };
    HealthMonitor monitor(options);

    monitor.start_monitoring("fresh", mock_descriptor("fresh"));

    std::map<std::string, ServerDescriptor> servers = {{"fresh", mock_descriptor("fresh")},
                                                       {"unknown", mock_descriptor("unknown")}};
    monitor.schedule_smart_refresh(servers);

    EXPECT_EQ(farm.created("fresh"), 1u);
    EXPECT_EQ(farm.created("unknown"), 1u);
    EXPECT_EQ(monitor.get_connection_status("unknown")->status, ConnectionState::Connected);

    // Fresh window is 5 minutes
    clock.advance(minutes(4));
    EXPECT_FALSE(monitor.is_refresh_due("fresh"));
    clock.advance(minutes(2));
    EXPECT_TRUE(monitor.is_refresh_due("fresh"));
    EXPECT_EQ(monitor.get_servers_needing_refresh().size(), 2u);

    monitor.schedule_smart_refresh(servers);
    EXPECT_EQ(farm.created("fresh"), 2u);
}

TEST(HealthMonitorTest, SmartRefreshBacksOffFailingServers)
{
    FakeClock clock;
    MockServerFarm farm(two_tools());
    MockScript broken;
    broken.fail_spawn = true;
    farm.set_script("bad", broken);
    auto options = options_for(farm);
    options.now = [&clock] { return clock.now(); };
    HealthMonitor monitor(options);

    std::map<std::string, ServerDescriptor> servers = {{"bad", mock_descriptor("bad")}};

    // Failures never escape the refresh
    EXPECT_NO_THROW(monitor.schedule_smart_refresh(servers));
    EXPECT_EQ(farm.created("bad"), 1u);
    EXPECT_EQ(monitor.get_health_record("bad")->consecutive_errors, 1);

    // 1 error: 2 minute window
    clock.advance(seconds(110));
    monitor.schedule_smart_refresh(servers);
    EXPECT_EQ(farm.created("bad"), 1u);

    clock.advance(seconds(20));
    monitor.schedule_smart_refresh(servers);
    EXPECT_EQ(farm.created("bad"), 2u);
    EXPECT_EQ(monitor.get_health_record("bad")->consecutive_errors, 2);

    // 2 errors: 4 minute window
    clock.advance(minutes(3));
    EXPECT_FALSE(monitor.is_refresh_due("bad"));
    clock.advance(minutes(1));
    EXPECT_TRUE(monitor.is_refresh_due("bad"));
}

TEST(HealthMonitorTest, SmartRefreshWorksInBatches)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.refresh_batch_size = 2;
    options.refresh_batch_delay = milliseconds(60);
    HealthMonitor monitor(options);

    std::map<std::string, ServerDescriptor> servers;
    for (const auto& name : {"a", "b", "c", "d", "e"})
        servers[name] = mock_descriptor(name);

    auto start = steady_clock::now();
    monitor.schedule_smart_refresh(servers);
    auto elapsed = steady_clock::now() - start;

    // Three batches, two pauses between them
    EXPECT_GE(elapsed, milliseconds(110));
    EXPECT_EQ(monitor.get_connected_count(), 5u);
}

// Test that a server hanging after initialize cannot hold a refresh past its bound
TEST(HealthMonitorTest, SmartRefreshIsBoundedByRefreshTimeout)
{
    auto script = two_tools();
    script.ignored_methods = {"tools/list", "resources/list"};
    MockServerFarm farm(script);
    auto options = options_for(farm);
    options.refresh_timeout = milliseconds(200);
    options.client_options.request_timeout = milliseconds(1500);
    HealthMonitor monitor(options);

    auto start = steady_clock::now();
    monitor.schedule_smart_refresh({{"hangs", mock_descriptor("hangs")}});
    auto elapsed = steady_clock::now() - start;

    EXPECT_LT(elapsed, milliseconds(700));

    auto status = monitor.get_connection_status("hangs");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, ConnectionState::Error);
    ASSERT_TRUE(status->last_error.has_value());

    auto record = monitor.get_health_record("hangs");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, ConnectionState::Error);
    EXPECT_EQ(record->consecutive_errors, 1);
}

TEST(HealthMonitorTest, SmartRefreshSkipsDescriptorsWithoutCommand)
{
    MockServerFarm farm(two_tools());
    HealthMonitor monitor(options_for(farm));

    ServerDescriptor empty;
    empty.name = "empty";
    monitor.schedule_smart_refresh({{"empty", empty}});

    EXPECT_EQ(farm.created("empty"), 0u);
    EXPECT_FALSE(monitor.get_connection_status("empty").has_value());
}

TEST(HealthMonitorTest, AverageResponseTimeOfConnectedServers)
{
    MockServerFarm farm(two_tools());
    HealthMonitor monitor(options_for(farm));
    EXPECT_EQ(monitor.get_average_response_time(), milliseconds(0));

    monitor.start_monitoring("a", mock_descriptor("a"));
    monitor.start_monitoring("b", mock_descriptor("b"));
    monitor.ping_server("a");
    monitor.ping_server("b");

    EXPECT_GE(monitor.get_average_response_time().count(), 0);
    EXPECT_LT(monitor.get_average_response_time(), milliseconds(100));
    EXPECT_EQ(monitor.get_all_connection_statuses().size(), 2u);
}
