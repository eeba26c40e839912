/**
 * mcpmgr_inspect.cpp - Launch one MCP server and print its capabilities
 *
 * Usage:
 *   mcpmgr-inspect [--json] [--name NAME] [--env KEY=VALUE]... [--cwd DIR]
 *                  [--timeout MS] [--verbose] -- command [args...]
 *
 * The server is started over stdio, the MCP handshake is performed and the
 * tool, resource and prompt lists are printed. Timeouts and reconnect
 * limits can also be tuned through the MCPMGR_* environment variables.
 *
 * Exit status: 0 on success, 1 when the inspection failed, 2 on bad usage.
 */

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mcpmgr/mcpmgr.hpp>
#include <string>

using namespace mcpmgr;

namespace
{

void print_usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0
              << " [--json] [--name NAME] [--env KEY=VALUE]... [--cwd DIR]"
                 " [--timeout MS] [--verbose] -- command [args...]\n";
}

void print_snapshot(const CapabilitySnapshot& snapshot)
{
    if (snapshot.server_info)
    {
        std::cout << "Server:    " << snapshot.server_info->name << " "
                  << snapshot.server_info->version << "\n";
        std::cout << "Protocol:  " << snapshot.server_info->protocol_version << "\n";
    }
    std::cout << "Tokens:    ~" << snapshot.token_estimate << "\n\n";

    std::cout << "Tools (" << snapshot.tool_count.value_or(0) << ")\n";
    for (const auto& tool : snapshot.tools)
    {
        std::cout << "  " << tool.name;
        if (!tool.description.empty())
            std::cout << " - " << tool.description;
        std::cout << "\n";
    }

    std::cout << "\nResources (" << snapshot.resource_count.value_or(0) << ")\n";
    for (const auto& resource : snapshot.resources)
        std::cout << "  " << resource.uri << " (" << resource.name << ")\n";

    std::cout << "\nPrompts";
    if (!snapshot.prompts_supported)
    {
        std::cout << ": not supported\n";
        return;
    }
    std::cout << " (" << snapshot.prompt_count.value_or(0) << ")\n";
    for (const auto& prompt : snapshot.prompts)
    {
        std::cout << "  " << prompt.name;
        if (prompt.description)
            std::cout << " - " << *prompt.description;
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char* argv[])
{
    bool as_json = false;
    bool verbose = false;
    ServerDescriptor descriptor;
    std::string name;
    InspectorOptions options;
    options.client_options = client_options_from_env();

    int i = 1;
    for (; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--")
        {
            ++i;
            break;
        }
        if (arg == "--json")
        {
            as_json = true;
        }
        else if (arg == "--verbose")
        {
            verbose = true;
        }
        else if ((arg == "--name" || arg == "--cwd" || arg == "--env" || arg == "--timeout") &&
                 i + 1 < argc)
        {
            std::string value = argv[++i];
            if (arg == "--name")
            {
                name = value;
            }
            else if (arg == "--cwd")
            {
                descriptor.cwd = value;
            }
            else if (arg == "--env")
            {
                auto eq = value.find('=');
                if (eq == std::string::npos || eq == 0)
                {
                    std::cerr << "Invalid --env value: " << value << "\n";
                    return 2;
                }
                descriptor.env[value.substr(0, eq)] = value.substr(eq + 1);
            }
            else
            {
                try
                {
                    std::chrono::milliseconds timeout(std::stol(value));
                    options.client_options.connect_timeout = timeout;
                    options.client_options.request_timeout = timeout;
                }
                catch (const std::exception&)
                {
                    std::cerr << "Invalid --timeout value: " << value << "\n";
                    return 2;
                }
            }
        }
        else
        {
            print_usage(argv[0]);
            return 2;
        }
    }

    if (i >= argc)
    {
        print_usage(argv[0]);
        return 2;
    }

    descriptor.command = argv[i++];
    for (; i < argc; ++i)
        descriptor.args.push_back(argv[i]);
    descriptor.name = name.empty() ? descriptor.command : name;

    // One-shot inspection: never respawn a crashed server
    options.client_options.auto_reconnect = false;
    options.client_options.stderr_callback = [verbose](const std::string& line)
    {
        if (verbose)
            std::cerr << "[server] " << line << "\n";
    };
    if (verbose)
    {
        options.log_callback = [](LogLevel level, const std::string& message)
        { std::cerr << "[" << to_string(level) << "] " << message << "\n"; };
        options.client_options.log_callback = options.log_callback;
    }

    CapabilityInspector inspector(options);
    auto snapshot = inspector.inspect(descriptor.name, descriptor);
    inspector.disconnect_all();

    if (as_json)
    {
        std::cout << snapshot.to_json().dump(2) << std::endl;
        return snapshot.ok() ? 0 : 1;
    }

    if (!snapshot.ok())
    {
        std::cerr << "Inspection of " << descriptor.name << " failed: " << *snapshot.error << "\n";
        return 1;
    }

    print_snapshot(snapshot);
    return 0;
}
