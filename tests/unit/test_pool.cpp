#include "../fixtures/mock_transport.hpp"
#include "../test_utils.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <mcpmgr/errors.hpp>
#include <mcpmgr/pool.hpp>
#include <thread>
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

PoolOptions options_for(MockServerFarm& farm)
{
    PoolOptions options;
    options.max_connections = 3;
    options.min_connections = 1;
    options.max_retries = 1;
    options.retry_initial_delay = milliseconds(10);
    options.client_factory = farm.factory();
    options.client_options.connect_timeout = milliseconds(1000);
    options.client_options.request_timeout = milliseconds(100);
    options.client_options.shutdown_grace = milliseconds(100);
    options.client_options.auto_reconnect = false;
    options.client_options.log_callback = quiet_log();
    options.log_callback = quiet_log();
    return options;
}

ServerPoolStats stats_for(const ConnectionPool& pool, const std::string& name)
{
    auto stats = pool.statistics();
    auto it = stats.pools_by_server.find(name);
    if (it == stats.pools_by_server.end())
        return ServerPoolStats{};
    return it->second;
}
} // namespace

TEST(ConnectionPoolTest, ReusesReleasedSession)
{
    MockServerFarm farm(two_tools());
    ConnectionPool pool(options_for(farm));

    auto first = pool.get_client("srv", mock_descriptor("srv"));
    ASSERT_TRUE(first);
    EXPECT_TRUE(first->is_connected());
    EXPECT_EQ(stats_for(pool, "srv").active, 1u);

    pool.release_client("srv", first);
    EXPECT_EQ(stats_for(pool, "srv").idle, 1u);

    auto second = pool.get_client("srv", mock_descriptor("srv"));
    EXPECT_EQ(second, first);
    EXPECT_EQ(farm.created("srv"), 1u);
}

TEST(ConnectionPoolTest, SingleSlotAllowsExactlyOneConcurrentLease)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.max_connections = 1;
    options.min_connections = 0;
    ConnectionPool pool(options);

    auto acquire = [&]() -> std::shared_ptr<ProtocolClient>
    {
        try
        {
            return pool.get_client("srv", mock_descriptor("srv"));
        }
        catch (const PoolExhausted& e)
        {
            EXPECT_EQ(e.server_name(), "srv");
            return nullptr;
        }
    };

    auto a = std::async(std::launch::async, acquire);
    auto b = std::async(std::launch::async, acquire);
    auto client_a = a.get();
    auto client_b = b.get();

    EXPECT_NE(client_a == nullptr, client_b == nullptr);
    EXPECT_EQ(farm.created("srv"), 1u);
    EXPECT_EQ(stats_for(pool, "srv").total, 1u);
}

TEST(ConnectionPoolTest, ExhaustedWhileEverySessionIsInUse)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.max_connections = 2;
    ConnectionPool pool(options);

    auto a = pool.get_client("srv", mock_descriptor("srv"));
    auto b = pool.get_client("srv", mock_descriptor("srv"));
    EXPECT_NE(a, b);
    EXPECT_THROW(pool.get_client("srv", mock_descriptor("srv")), PoolExhausted);

    // Other servers are unaffected
    EXPECT_NO_THROW(pool.get_client("other", mock_descriptor("other")));
}

TEST(ConnectionPoolTest, ReclaimsDeadIdleSessionAtCapacity)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.max_connections = 1;
    options.min_connections = 1;
    ConnectionPool pool(options);

    auto first = pool.get_client("srv", mock_descriptor("srv"));
    pool.release_client("srv", first);

    farm.servers("srv").front()->crash(1);
    ASSERT_TRUE(wait_until([&] { return !first->is_connected(); }));

    auto second = pool.get_client("srv", mock_descriptor("srv"));
    EXPECT_NE(second, first);
    EXPECT_TRUE(second->is_connected());
    EXPECT_EQ(farm.created("srv"), 2u);
    EXPECT_EQ(stats_for(pool, "srv").total, 1u);
}

TEST(ConnectionPoolTest, NeverExceedsMaxUnderContention)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.max_connections = 3;
    options.min_connections = 3;
    ConnectionPool pool(options);

    std::atomic<int> in_use{0};
    std::atomic<int> peak{0};
    std::atomic<int> exhausted{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t)
    {
        workers.emplace_back(
            [&]
            {
                for (int i = 0; i < 20; ++i)
                {
                    std::shared_ptr<ProtocolClient> client;
                    try
                    {
                        client = pool.get_client("srv", mock_descriptor("srv"));
                    }
                    catch (const PoolExhausted&)
                    {
                        ++exhausted;
                        continue;
                    }

                    int now_in_use = ++in_use;
                    int previous = peak.load();
                    while (now_in_use > previous && !peak.compare_exchange_weak(previous, now_in_use))
                    {
                    }
                    std::this_thread::sleep_for(milliseconds(1));
                    --in_use;
                    pool.release_client("srv", client);
                }
            });
    }
    for (auto& worker : workers)
        worker.join();

    EXPECT_LE(peak.load(), 3);
    EXPECT_LE(farm.created("srv"), 3u);
    EXPECT_LE(stats_for(pool, "srv").total, 3u);
    EXPECT_EQ(stats_for(pool, "srv").active, 0u);
}

TEST(ConnectionPoolTest, ReleaseTrimsIdleSessionsAboveMin)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.max_connections = 5;
    options.min_connections = 1;
    ConnectionPool pool(options);

    auto a = pool.get_client("srv", mock_descriptor("srv"));
    auto b = pool.get_client("srv", mock_descriptor("srv"));
    auto c = pool.get_client("srv", mock_descriptor("srv"));
    EXPECT_EQ(stats_for(pool, "srv").total, 3u);

    pool.release_client("srv", a);
    pool.release_client("srv", b);
    pool.release_client("srv", c);

    auto stats = stats_for(pool, "srv");
    EXPECT_EQ(stats.total, 1u);
    EXPECT_EQ(stats.idle, 1u);
    // The most recently released session is the one kept
    EXPECT_TRUE(c->is_connected());
    EXPECT_FALSE(a->is_connected());
    EXPECT_FALSE(b->is_connected());
}

TEST(ConnectionPoolTest, FailedCreationLeavesNoEntry)
{
    MockServerFarm farm(two_tools());
    MockScript dies;
    dies.exit_on_connect = 1;
    farm.set_script("dies", dies);
    auto options = options_for(farm);
    options.max_retries = 3;
    ConnectionPool pool(options);

    EXPECT_THROW(pool.get_client("dies", mock_descriptor("dies")), HandshakeError);
    EXPECT_EQ(farm.created("dies"), 3u);
    EXPECT_EQ(stats_for(pool, "dies").total, 0u);
    EXPECT_EQ(pool.statistics().total_connections, 0u);
}

TEST(ConnectionPoolTest, HealthChecksEvictRepeatedFailures)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.max_health_failures = 2;
    ConnectionPool pool(options);

    auto client = pool.get_client("srv", mock_descriptor("srv"));
    pool.release_client("srv", client);
    auto server = farm.servers("srv").front();

    server->update_script([](MockScript& s) { s.ignored_methods.insert("tools/list"); });
    pool.run_health_checks();
    EXPECT_EQ(stats_for(pool, "srv").total, 1u);
    EXPECT_EQ(stats_for(pool, "srv").healthy, 0u);

    // A success in between resets the failure count
    server->update_script([](MockScript& s) { s.ignored_methods.clear(); });
    pool.run_health_checks();
    EXPECT_EQ(stats_for(pool, "srv").healthy, 1u);

    server->update_script([](MockScript& s) { s.ignored_methods.insert("tools/list"); });
    pool.run_health_checks();
    EXPECT_EQ(stats_for(pool, "srv").total, 1u);
    pool.run_health_checks();
    EXPECT_EQ(stats_for(pool, "srv").total, 0u);
    EXPECT_FALSE(client->is_connected());
}

TEST(ConnectionPoolTest, HealthChecksSkipLeasedSessions)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.max_health_failures = 1;
    ConnectionPool pool(options);

    auto client = pool.get_client("srv", mock_descriptor("srv"));
    farm.servers("srv").front()->update_script(
        [](MockScript& s) { s.ignored_methods.insert("tools/list"); });

    pool.run_health_checks();
    EXPECT_EQ(stats_for(pool, "srv").total, 1u);
    EXPECT_EQ(stats_for(pool, "srv").active, 1u);
    EXPECT_TRUE(client->is_connected());
}

TEST(ConnectionPoolTest, CleanupEvictsIdleSessionsDownToMin)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.idle_timeout = milliseconds(20);
    options.min_connections = 1;
    ConnectionPool pool(options);

    auto kept = pool.get_client("keep", mock_descriptor("keep"));
    pool.release_client("keep", kept);
    auto leased = pool.get_client("busy", mock_descriptor("busy"));

    std::this_thread::sleep_for(milliseconds(40));
    pool.run_cleanup();

    // min_connections protects the last idle session
    EXPECT_EQ(stats_for(pool, "keep").total, 1u);
    EXPECT_TRUE(kept->is_connected());
    // Leased sessions are never cleaned up
    EXPECT_EQ(stats_for(pool, "busy").total, 1u);
    EXPECT_TRUE(leased->is_connected());
}

TEST(ConnectionPoolTest, CleanupDropsEmptyServerPools)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.idle_timeout = milliseconds(20);
    options.min_connections = 0;
    ConnectionPool pool(options);

    auto client = pool.get_client("srv", mock_descriptor("srv"));
    pool.release_client("srv", client);
    EXPECT_EQ(pool.statistics().pools_by_server.count("srv"), 1u);

    std::this_thread::sleep_for(milliseconds(40));
    pool.run_cleanup();

    EXPECT_EQ(pool.statistics().pools_by_server.count("srv"), 0u);
    EXPECT_FALSE(client->is_connected());

    // The server can be pooled again afterwards
    auto again = pool.get_client("srv", mock_descriptor("srv"));
    EXPECT_TRUE(again->is_connected());
}

TEST(ConnectionPoolTest, PrewarmCreatesMinConnections)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.min_connections = 2;
    ConnectionPool pool(options);

    pool.prewarm("srv", mock_descriptor("srv"));

    auto stats = stats_for(pool, "srv");
    EXPECT_EQ(stats.total, 2u);
    EXPECT_EQ(stats.idle, 2u);
    EXPECT_EQ(stats.healthy, 2u);
}

TEST(ConnectionPoolTest, PrewarmReportsFailures)
{
    MockServerFarm farm(two_tools());
    MockScript broken;
    broken.fail_spawn = true;
    farm.set_script("bad", broken);
    ConnectionPool pool(options_for(farm));

    EXPECT_THROW(pool.prewarm("bad", mock_descriptor("bad"), 2), HandshakeError);
    EXPECT_EQ(stats_for(pool, "bad").total, 0u);
}

TEST(ConnectionPoolTest, StatisticsAcrossServers)
{
    MockServerFarm farm(two_tools());
    ConnectionPool pool(options_for(farm));

    auto a1 = pool.get_client("a", mock_descriptor("a"));
    auto a2 = pool.get_client("a", mock_descriptor("a"));
    auto b1 = pool.get_client("b", mock_descriptor("b"));
    pool.release_client("a", a1);

    auto stats = pool.statistics();
    EXPECT_EQ(stats.total_connections, 3u);
    EXPECT_EQ(stats.active_connections, 2u);
    EXPECT_EQ(stats.idle_connections, 1u);
    EXPECT_EQ(stats.pools_by_server["a"].total, 2u);
    EXPECT_EQ(stats.pools_by_server["a"].idle, 1u);
    EXPECT_EQ(stats.pools_by_server["b"].active, 1u);
}

TEST(ConnectionPoolTest, ReleaseOfForeignSessionIsIgnored)
{
    MockServerFarm farm(two_tools());
    ConnectionPool pool(options_for(farm));
    auto owned = pool.get_client("srv", mock_descriptor("srv"));

    auto stranger = make_mock_client(std::make_shared<MockServer>(two_tools()),
                                     mock_descriptor("srv"));
    EXPECT_NO_THROW(pool.release_client("srv", stranger));
    EXPECT_NO_THROW(pool.release_client("unknown", owned));
    EXPECT_EQ(stats_for(pool, "srv").active, 1u);
}

TEST(ConnectionPoolTest, ShutdownTearsDownEverySession)
{
    MockServerFarm farm(two_tools());
    ConnectionPool pool(options_for(farm));
    pool.start();

    auto leased = pool.get_client("a", mock_descriptor("a"));
    auto idle = pool.get_client("b", mock_descriptor("b"));
    pool.release_client("b", idle);

    pool.shutdown();

    EXPECT_FALSE(leased->is_connected());
    EXPECT_FALSE(idle->is_connected());
    EXPECT_EQ(pool.statistics().total_connections, 0u);
    EXPECT_THROW(pool.get_client("a", mock_descriptor("a")), McpError);
    EXPECT_THROW(pool.start(), McpError);
    EXPECT_NO_THROW(pool.shutdown());
}

TEST(ConnectionPoolTest, BackgroundTasksRunAfterStart)
{
    MockServerFarm farm(two_tools());
    auto options = options_for(farm);
    options.min_connections = 0;
    options.idle_timeout = milliseconds(10);
    options.cleanup_interval = milliseconds(20);
    options.health_check_interval = milliseconds(20);
    ConnectionPool pool(options);

    auto client = pool.get_client("srv", mock_descriptor("srv"));
    pool.release_client("srv", client);

    // Nothing happens before start()
    std::this_thread::sleep_for(milliseconds(60));
    EXPECT_EQ(stats_for(pool, "srv").total, 1u);

    pool.start();
    EXPECT_TRUE(wait_until([&] { return pool.statistics().total_connections == 0; }));
}
