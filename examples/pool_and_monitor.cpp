/**
 * @file pool_and_monitor.cpp
 * @brief Pooled sessions and health monitoring for a set of servers
 *
 * Demonstrates:
 * - Borrowing and returning sessions from a ConnectionPool
 * - Watching liveness with a HealthMonitor
 * - Handling PoolExhausted and HandshakeError
 *
 * Usage: mcpmgr-pool-demo command [args...]
 */

#include <iostream>
#include <mcpmgr/mcpmgr.hpp>
#include <string>
#include <thread>

using namespace mcpmgr;

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " command [args...]\n";
        return 2;
    }

    ServerDescriptor server;
    server.name = "demo";
    server.command = argv[1];
    for (int i = 2; i < argc; ++i)
        server.args.push_back(argv[i]);

    // Pool ---------------------------------------------------------------

    auto pool_options = pool_options_from_env();
    pool_options.max_connections = 2;
    pool_options.min_connections = 1;
    ConnectionPool pool(pool_options);
    pool.start();

    try
    {
        pool.prewarm(server.name, server);

        auto first = pool.get_client(server.name, server);
        auto second = pool.get_client(server.name, server);
        std::cout << "Leased two sessions (pids " << first->get_pid() << ", "
                  << second->get_pid() << ")\n";

        try
        {
            pool.get_client(server.name, server);
        }
        catch (const PoolExhausted& e)
        {
            std::cout << "Third lease refused: " << e.what() << "\n";
        }

        std::cout << "Tools: " << first->get_tools().size() << "\n";

        pool.release_client(server.name, first);
        pool.release_client(server.name, second);
        std::cout << pool.statistics().to_json().dump(2) << "\n";
    }
    catch (const HandshakeError& e)
    {
        std::cerr << "Server failed to start: " << e.what() << "\n";
        pool.shutdown();
        return 1;
    }
    catch (const McpError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        pool.shutdown();
        return 1;
    }

    pool.shutdown();

    // Monitor ------------------------------------------------------------

    auto monitor_options = monitor_options_from_env();
    monitor_options.ping_interval = std::chrono::seconds(1);
    HealthMonitor monitor(monitor_options);

    monitor.status_changes().connect(
        [](const ConnectionStatus& status)
        {
            std::cout << "[monitor] " << status.server_name << " -> " << to_string(status.status)
                      << "\n";
        });
    monitor.events().connect(
        [](const MonitorEvent& event)
        {
            if (event.type == MonitorEventType::Ping && event.response_time)
                std::cout << "[monitor] ping " << event.response_time->count() << "ms\n";
        });

    monitor.start_monitoring(server.name, server);
    std::this_thread::sleep_for(std::chrono::seconds(3));

    std::cout << "Average response time: " << monitor.get_average_response_time().count()
              << "ms\n";
    monitor.stop_all();
    return 0;
}
