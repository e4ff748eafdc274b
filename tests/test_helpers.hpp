// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file test_helpers.hpp
/// @brief Shared helpers for tests that launch the fake backend

#include <devbridge/process.hpp>
#include <devbridge/types.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>

#ifndef DEVBRIDGE_FAKE_BACKEND
#error "DEVBRIDGE_FAKE_BACKEND must name the fake backend executable"
#endif

namespace devbridge::test
{

/// Path of the devbridge_fake_backend executable
inline std::string fake_backend_path()
{
    return DEVBRIDGE_FAKE_BACKEND;
}

/// Subprocess mode that launches the fake backend running @p scenario
///
/// The fake backend stands in for the interpreter: it is started as
/// "<exe> -u -m <scenario>", exactly like "python -u -m bridge.main".
inline SubprocessMode fake_backend_mode(const std::string& scenario = "echo")
{
    SubprocessMode mode;
    mode.python_path = fake_backend_path();
    mode.module = scenario;
    return mode;
}

/// Spawn the fake backend directly
inline void spawn_fake_backend(Process& proc, const std::string& scenario = "echo")
{
    ProcessOptions options;
    options.redirect_stderr = true;
    proc.spawn(fake_backend_path(), {"-u", "-m", scenario}, options);
}

/// True while a process with this pid exists (zombie included)
inline bool pid_exists(int pid)
{
    return ::kill(pid, 0) == 0 || errno != ESRCH;
}

/// Poll until the process is gone or the timeout elapses
inline bool wait_for_pid_exit(int pid, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (pid_exists(pid))
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

} // namespace devbridge::test
