// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

// POSIX implementation of subprocess process management
// For Linux and macOS

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <devbridge/logging.hpp>
#include <devbridge/process.hpp>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

// Global environ pointer for environment manipulation (needed for macOS)
extern "C" char** environ;

namespace devbridge
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// =============================================================================
// Helper functions
// =============================================================================

namespace
{

std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

/// Create a pipe whose ends are both close-on-exec
void make_pipe(int fds[2], const char* what)
{
    if (::pipe(fds) != 0)
        throw ProcessError(std::string("Failed to create ") + what + " pipe: " + get_errno_message());
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
}

void close_pipe(int fds[2])
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

int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

/// Blocks SIGPIPE on the calling thread for the guard's lifetime
///
/// A write to a pipe with no reader then fails with EPIPE instead of killing
/// the host process. A SIGPIPE raised while blocked is consumed on exit.
class SigpipeGuard
{
  public:
    SigpipeGuard()
    {
        sigemptyset(&sigpipe_);
        sigaddset(&sigpipe_, SIGPIPE);

        sigset_t pending;
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        blocked_ = pthread_sigmask(SIG_BLOCK, &sigpipe_, &old_mask_) == 0;
    }

    ~SigpipeGuard()
    {
        if (!blocked_)
            return;

        if (!was_pending_)
        {
            sigset_t pending;
            sigpending(&pending);
            if (sigismember(&pending, SIGPIPE) == 1)
            {
                int sig = 0;
                sigwait(&sigpipe_, &sig);
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

  private:
    sigset_t sigpipe_;
    sigset_t old_mask_;
    bool was_pending_ = false;
    bool blocked_ = false;
};

} // namespace

// =============================================================================
// ReadPipe implementation
// =============================================================================

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
        throw ProcessError("Pipe is not open");

    while (true)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno != EINTR)
            throw ProcessError("Read failed: " + get_errno_message());
    }
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    struct pollfd pfd{};
    pfd.fd = handle_->fd;
    pfd.events = POLLIN;

    while (true)
    {
        int result = ::poll(&pfd, 1, timeout_ms);
        if (result < 0)
        {
            if (errno == EINTR)
                continue;
            throw ProcessError("poll failed: " + get_errno_message());
        }
        // POLLHUP means EOF is readable
        return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
    }
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

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    SigpipeGuard guard;

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    return total_written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
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

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    // Close pipes first so a well-behaved child sees EOF
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();
    if (stderr_)
        stderr_->close();

    if (is_running())
    {
        try
        {
            shutdown(std::chrono::milliseconds(2000));
        }
        catch (const std::exception& e)
        {
            logger()->warn("Failed to reap process {}: {}", pid(), e.what());
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(
    const std::string& executable,
    const std::vector<std::string>& args,
    const ProcessOptions& options
)
{
    if (is_running())
        throw ProcessError("Process already spawned");

    // Resolve before fork so the child only calls async-signal-safe functions
    auto resolved = find_executable(executable);
    if (!resolved)
        throw ProcessError("Failed to execute '" + executable + "': " + get_errno_message(ENOENT));

    std::vector<std::string> argv_storage;
    argv_storage.push_back(executable);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& arg : argv_storage)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Inherited environment with overrides applied
    std::vector<std::string> env_storage;
    for (char** env = environ; env && *env; ++env)
    {
        std::string entry(*env);
        auto key = entry.substr(0, entry.find('='));
        if (options.environment.count(key) == 0)
            env_storage.push_back(std::move(entry));
    }
    for (const auto& [key, value] : options.environment)
        env_storage.push_back(key + "=" + value);

    std::vector<char*> envp;
    for (auto& entry : env_storage)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};

    auto close_all = [&]
    {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(error_pipe);
    };

    try
    {
        if (options.redirect_stdin)
            make_pipe(stdin_pipe, "stdin");
        if (options.redirect_stdout)
            make_pipe(stdout_pipe, "stdout");
        if (options.redirect_stderr)
            make_pipe(stderr_pipe, "stderr");
        // Detects exec failures; close-on-exec closes it on a successful exec
        make_pipe(error_pipe, "error");
    }
    catch (const ProcessError&)
    {
        close_all();
        throw;
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        close_all();
        throw ProcessError("Failed to fork process: " + get_errno_message(err));
    }

    if (pid == 0)
    {
        // Child process
        auto fail = [&](int err)
        {
            (void)::write(error_pipe[1], &err, sizeof(err));
            _exit(127);
        };

        // The host may ignore SIGPIPE; the backend gets default behavior
        ::signal(SIGPIPE, SIG_DFL);

        if (options.redirect_stdin && dup2(stdin_pipe[0], STDIN_FILENO) < 0)
            fail(errno);
        if (options.redirect_stdout && dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
            fail(errno);
        if (options.redirect_stderr && dup2(stderr_pipe[1], STDERR_FILENO) < 0)
            fail(errno);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            fail(errno);

        execve(resolved->c_str(), argv.data(), envp.data());
        fail(errno);
    }

    // Parent process
    ::close(error_pipe[1]);
    error_pipe[1] = -1;

    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0); // Reap zombie child
        close_all();
        throw ProcessError("Failed to execute '" + executable + "': " + get_errno_message(child_errno));
    }
    close_pipe(error_pipe);

    // Keep the parent's ends, close the child's
    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]);
        stdin_->handle_->fd = stdin_pipe[1];
    }
    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_->handle_->fd = stdout_pipe[0];
    }
    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]);
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_ || !stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

bool Process::is_running() const
{
    return handle_ && handle_->pid > 0 && handle_->running;
}

std::optional<int> Process::try_wait()
{
    if (!is_running())
        return handle_ ? handle_->exit_code : -1;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;

    throw ProcessError("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!is_running())
        return handle_ ? handle_->exit_code : -1;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw ProcessError("waitpid failed: " + get_errno_message());
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto code = try_wait())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int Process::shutdown(std::chrono::milliseconds grace)
{
    if (!is_running())
        return handle_ ? handle_->exit_code : -1;

    terminate();
    if (auto code = wait_for(grace))
        return *code;

    logger()->warn("Process {} did not exit after SIGTERM, killing", handle_->pid);
    kill();
    return wait();
}

void Process::terminate()
{
    if (is_running())
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (is_running())
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// =============================================================================
// Utility functions
// =============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    auto is_executable = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    // A name with a path separator is used as-is
    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::path(name).is_absolute() ? name : fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
    {
        // No PATH set - try current directory
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path test_path = fs::path(dir) / name;
            if (is_executable(test_path))
                return test_path.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace devbridge
