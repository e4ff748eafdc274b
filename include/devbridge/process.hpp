// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file process.hpp
/// @brief POSIX child process management for the subprocess backend

#include <chrono>
#include <devbridge/errors.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace devbridge
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

// =============================================================================
// ReadPipe - Read from subprocess stdout/stderr
// =============================================================================

/// Pipe for reading output from a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    // Move-only
    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    /// @throws ProcessError on read failure
    size_t read(char* buffer, size_t size);

    /// Wait until data (or EOF) is readable
    /// @param timeout_ms Timeout in milliseconds (0 = non-blocking check, -1 = wait forever)
    /// @return true if a read will not block
    bool has_data(int timeout_ms = 0);

    /// Close the pipe
    void close();

    /// Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// =============================================================================
// WritePipe - Write to subprocess stdin
// =============================================================================

/// Pipe for writing input to a subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    // Move-only
    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    /// Write all of data to the pipe
    ///
    /// A reader that has gone away yields ProcessError, never SIGPIPE.
    /// @return Number of bytes written
    /// @throws ProcessError on write failure
    size_t write(const char* data, size_t size);

    /// Write string to the pipe
    size_t write(const std::string& data);

    /// Close the pipe
    void close();

    /// Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// =============================================================================
// ProcessOptions - Configuration for process spawning
// =============================================================================

/// Options for spawning a subprocess
struct ProcessOptions
{
    /// Working directory for the subprocess (empty = inherit from parent)
    std::string working_directory;

    /// Environment variables to set on top of the inherited environment
    std::map<std::string, std::string> environment;

    /// Whether to redirect stdin (pipe to subprocess)
    bool redirect_stdin = true;

    /// Whether to redirect stdout (pipe from subprocess)
    bool redirect_stdout = true;

    /// Whether to redirect stderr (pipe from subprocess)
    bool redirect_stderr = false;
};

// =============================================================================
// Process - POSIX subprocess management
// =============================================================================

/// Child process with optionally piped stdio
///
/// Example usage:
/// @code
/// Process proc;
/// proc.spawn("python3", {"-u", "-m", "bridge.main"});
///
/// proc.stdin_pipe().write("{...}\n");
///
/// proc.terminate();
/// int exit_code = proc.wait();
/// @endcode
///
/// The destructor terminates and reaps a child that is still running.
class Process
{
  public:
    Process();
    ~Process();

    // Move-only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    /// Spawn a new process
    /// @param executable Path to executable (searched in PATH if it has no '/')
    /// @param args Command line arguments (not including executable)
    /// @param options Process configuration
    /// @throws ProcessError if spawn fails, including a failed exec or chdir
    void spawn(
        const std::string& executable,
        const std::vector<std::string>& args,
        const ProcessOptions& options = {}
    );

    /// Get stdin pipe (only valid if redirect_stdin was true)
    /// @throws ProcessError if stdin was not redirected
    WritePipe& stdin_pipe();

    /// Get stdout pipe (only valid if redirect_stdout was true)
    /// @throws ProcessError if stdout was not redirected
    ReadPipe& stdout_pipe();

    /// Get stderr pipe (only valid if redirect_stderr was true)
    /// @throws ProcessError if stderr was not redirected
    ReadPipe& stderr_pipe();

    /// Check if process is still running (not yet reaped)
    bool is_running() const;

    /// Non-blocking wait for process termination
    /// @return Exit code if process has terminated, std::nullopt if still running
    std::optional<int> try_wait();

    /// Blocking wait for process termination
    /// @return Exit code (128 + signal number if killed by a signal)
    int wait();

    /// Wait for termination with a bound
    /// @return Exit code, or std::nullopt if the process is still running
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    /// SIGTERM, then SIGKILL if the process outlives the grace period; always reaps
    /// @return Exit code
    int shutdown(std::chrono::milliseconds grace);

    /// Request graceful termination (SIGTERM)
    void terminate();

    /// Forcefully kill the process (SIGKILL)
    void kill();

    /// Get process ID
    /// @return Process ID, or 0 if not spawned
    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// Find an executable in the system PATH
/// @param name Executable name or path
/// @return Full path to executable, or std::nullopt if not found
std::optional<std::string> find_executable(const std::string& name);

} // namespace devbridge
