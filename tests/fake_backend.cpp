// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file fake_backend.cpp
/// @brief Stand-in backend used by the subprocess tests
///
/// Launched the way the bridge launches its interpreter:
///
///   devbridge_fake_backend -u -m <scenario>
///
/// Scenarios:
///   echo          serve the test methods below
///   silent        read requests, never answer
///   garbage       answer every request with a line that is not JSON
///   exit          exit with code 3 before reading anything
///   stderr_flood  write 1 MiB to stderr, then behave like echo
///   ignore_term   ignore SIGTERM, then behave like echo
///
/// Methods served by echo:
///   system.ping   {"pong": true, "version": ...}
///   test.echo     params
///   test.error    error {code: params.code, message: params.message, data: params.data}
///   test.exit     exit(params.code) without answering
///   test.hang     never answer
///   test.noise    answer with a line that is not JSON
///   test.wrong_id answer with id + 1000
///   test.both     answer with both result and error
///   test.split    answer in several chunks with pauses between them
///   test.pair     answer with two lines in a single write
///   test.large    {"data": "x" * params.size}
///   test.cwd      current working directory
///   test.env      value of environment variable params.name (null if unset)
///   test.stderr   write params.lines lines to stderr, then answer {"written": n}
///   test.detach   fork a child that keeps stdout open for params.seconds,
///                 then answer {"pid": child}
///   anything else error -32601 "Method not found"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace
{

const char* kVersion = "fake-backend-1.0";

void send_line(const std::string& line)
{
    std::cout << line << "\n" << std::flush;
}

void send_result(const json& id, const json& result)
{
    send_line(json{{"jsonrpc", "2.0"}, {"result", result}, {"id", id}}.dump());
}

void send_error(const json& id, int code, const std::string& message, const json& data = nullptr)
{
    json error = {{"code", code}, {"message", message}};
    if (!data.is_null())
        error["data"] = data;
    send_line(json{{"jsonrpc", "2.0"}, {"error", error}, {"id", id}}.dump());
}

void hang_forever()
{
    while (true)
        std::this_thread::sleep_for(std::chrono::seconds(1));
}

void handle(const json& request)
{
    const json id = request.value("id", json());
    const std::string method = request.value("method", "");
    const json params = request.value("params", json());
    const json args = params.is_object() ? params : json::object();

    if (method == "system.ping")
    {
        send_result(id, {{"pong", true}, {"version", kVersion}});
    }
    else if (method == "test.echo")
    {
        send_result(id, params);
    }
    else if (method == "test.error")
    {
        send_error(
            id,
            args.value("code", -32001),
            args.value("message", std::string("Project error")),
            args.value("data", json())
        );
    }
    else if (method == "test.exit")
    {
        std::exit(args.value("code", 0));
    }
    else if (method == "test.hang")
    {
        hang_forever();
    }
    else if (method == "test.noise")
    {
        send_line("this is not json");
    }
    else if (method == "test.wrong_id")
    {
        send_result(id.get<uint64_t>() + 1000, "wrong");
    }
    else if (method == "test.both")
    {
        send_line(json{{"jsonrpc", "2.0"},
                       {"result", 1},
                       {"error", {{"code", -32000}, {"message", "both"}}},
                       {"id", id}}
                      .dump());
    }
    else if (method == "test.split")
    {
        std::string line = json{{"jsonrpc", "2.0"}, {"result", "split"}, {"id", id}}.dump() + "\n";
        size_t third = line.size() / 3;
        for (size_t pos = 0; pos < line.size(); pos += third)
        {
            std::cout << line.substr(pos, third) << std::flush;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    else if (method == "test.pair")
    {
        // The second line answers the next request id
        std::string first = json{{"jsonrpc", "2.0"}, {"result", "first"}, {"id", id}}.dump();
        std::string second =
            json{{"jsonrpc", "2.0"}, {"result", "second"}, {"id", id.get<uint64_t>() + 1}}.dump();
        std::cout << first << "\n" << second << "\n" << std::flush;
    }
    else if (method == "test.large")
    {
        size_t size = args.value("size", 0);
        send_result(id, {{"data", std::string(size, 'x')}});
    }
    else if (method == "test.cwd")
    {
        char buffer[4096];
        if (getcwd(buffer, sizeof(buffer)) == nullptr)
            send_error(id, -32007, "getcwd failed");
        else
            send_result(id, std::string(buffer));
    }
    else if (method == "test.env")
    {
        const char* value = std::getenv(args.value("name", std::string()).c_str());
        send_result(id, value ? json(value) : json(nullptr));
    }
    else if (method == "test.stderr")
    {
        int lines = args.value("lines", 1);
        for (int i = 0; i < lines; i++)
            std::cerr << "backend log line " << i << "\n";
        std::cerr << std::flush;
        send_result(id, {{"written", lines}});
    }
    else if (method == "test.detach")
    {
        int seconds = args.value("seconds", 30);
        std::cout << std::flush;
        pid_t child = fork();
        if (child < 0)
        {
            send_error(id, -32007, "fork failed");
        }
        else if (child == 0)
        {
            // Inherited stdout stays open until this process exits
            ::sleep(static_cast<unsigned>(seconds));
            _exit(0);
        }
        else
        {
            send_result(id, {{"pid", child}});
        }
    }
    else
    {
        send_error(id, -32601, "Method not found: " + method);
    }
}

int serve(bool garbage, bool silent)
{
    std::cerr << "fake backend ready (pid " << getpid() << ")\n" << std::flush;

    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;
        if (silent)
            continue;
        if (garbage)
        {
            send_line("<html>not a json-rpc backend</html>");
            continue;
        }

        json request;
        try
        {
            request = json::parse(line);
        }
        catch (const json::parse_error& e)
        {
            send_error(nullptr, -32700, std::string("Parse error: ") + e.what());
            continue;
        }
        handle(request);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    if (argc != 4 || std::string(argv[1]) != "-u" || std::string(argv[2]) != "-m")
    {
        std::cerr << "usage: " << argv[0] << " -u -m <scenario>\n";
        return 64;
    }

    const std::string scenario = argv[3];

    if (scenario == "echo")
        return serve(false, false);
    if (scenario == "silent")
        return serve(false, true);
    if (scenario == "garbage")
        return serve(true, false);
    if (scenario == "exit")
        return 3;
    if (scenario == "stderr_flood")
    {
        std::string chunk(1023, 'e');
        for (int i = 0; i < 1024; i++)
            std::cerr << chunk << "\n";
        std::cerr << std::flush;
        return serve(false, false);
    }
    if (scenario == "ignore_term")
    {
        std::signal(SIGTERM, SIG_IGN);
        return serve(false, false);
    }

    std::cerr << "unknown scenario: " << scenario << "\n";
    return 65;
}
