// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file devbridge_cli.cpp
/// @brief Start a bridge, perform one backend call, print the response
///
/// Usage:
///   devbridge_cli [--python PATH] [--module NAME] [--cwd DIR]
///                 [--host H] [--port P] [--log-level L] <method> [params-json]
///
/// Without --host/--port the backend is spawned as "<python> -u -m <module>".
/// With either of them the CLI connects to a running backend service instead.

#include <devbridge/devbridge.hpp>
#include <iostream>
#include <optional>
#include <string>

namespace
{

void print_usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0
              << " [--python PATH] [--module NAME] [--cwd DIR] [--host H] [--port P]"
                 " [--log-level L] <method> [params-json]\n";
}

} // namespace

int main(int argc, char* argv[])
{
    devbridge::SubprocessMode subprocess;
    std::optional<std::string> host;
    std::optional<std::string> port;
    std::string method;
    devbridge::json params;

    try
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            auto value = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw std::invalid_argument("Missing value for " + arg);
                return argv[++i];
            };

            if (arg == "--python")
                subprocess.python_path = value();
            else if (arg == "--module")
                subprocess.module = value();
            else if (arg == "--cwd")
                subprocess.working_dir = value();
            else if (arg == "--host")
                host = value();
            else if (arg == "--port")
                port = value();
            else if (arg == "--log-level")
                devbridge::set_log_level(value());
            else if (arg == "-h" || arg == "--help")
            {
                print_usage(argv[0]);
                return 0;
            }
            else if (method.empty())
                method = arg;
            else if (params.is_null())
                params = devbridge::json::parse(arg);
            else
                throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    if (method.empty())
    {
        print_usage(argv[0]);
        return 2;
    }

    try
    {
        devbridge::TransportMode mode = subprocess;
        if (host || port)
            mode = devbridge::parse_endpoint(host.value_or(devbridge::kDefaultHost) + ":" +
                                             port.value_or(std::to_string(devbridge::kDefaultPort)));

        devbridge::BridgeManager bridge(mode);

        try
        {
            bridge.start();
        }
        catch (const devbridge::StartFailedError& e)
        {
            std::cout << devbridge::json(devbridge::CommandResponse::err(e.what())).dump(2) << "\n";
            return 1;
        }

        auto response = devbridge::forward_call(bridge, method, params);
        std::cout << devbridge::json(response).dump(2) << "\n";

        devbridge::stop_bridge(bridge);
        return response.success ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
