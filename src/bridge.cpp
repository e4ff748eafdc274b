// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <atomic>
#include <devbridge/bridge.hpp>
#include <devbridge/logging.hpp>
#include <thread>
#include <vector>

namespace devbridge
{

// Everything one start() establishes and one stop() releases
struct BridgeManager::Connection
{
    std::unique_ptr<Process> process;
    std::shared_ptr<IRpcClient> client;

    // Forwards backend stderr into the log so the pipe never fills up
    std::thread stderr_drain;
    std::atomic<bool> drain_stop{false};
};

namespace
{

void drain_stderr(ReadPipe& pipe, int pid, const std::atomic<bool>& stop)
{
    std::string pending;
    std::vector<char> buffer(4096);
    try
    {
        while (!stop)
        {
            if (!pipe.has_data(100))
                continue;

            size_t n = pipe.read(buffer.data(), buffer.size());
            if (n == 0)
                break;
            pending.append(buffer.data(), n);

            size_t pos;
            while ((pos = pending.find('\n')) != std::string::npos)
            {
                std::string line = pending.substr(0, pos);
                pending.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                logger()->debug("backend[{}] stderr: {}", pid, line);
            }
        }
    }
    catch (const ProcessError& e)
    {
        logger()->debug("backend[{}] stderr closed: {}", pid, e.what());
    }
    if (!pending.empty())
        logger()->debug("backend[{}] stderr: {}", pid, pending);
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

BridgeManager::BridgeManager(TransportMode mode, Timeouts timeouts)
    : mode_(std::move(mode)), timeouts_(timeouts)
{
}

BridgeManager::~BridgeManager()
{
    stop();
}

// =============================================================================
// Configuration
// =============================================================================

void BridgeManager::require_configurable(const char* what) const
{
    if (state_ != ConnectionState::Stopped)
    {
        throw UsageError(
            std::string("Cannot change ") + what + " while the bridge is " + to_string(state_) +
            "; stop it first"
        );
    }
}

void BridgeManager::set_mode(TransportMode mode)
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    require_configurable("transport mode");
    mode_ = std::move(mode);
}

void BridgeManager::set_python_path(const std::string& python_path)
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    require_configurable("python path");

    SubprocessMode subprocess;
    if (auto* current = std::get_if<SubprocessMode>(&mode_))
        subprocess = *current;
    subprocess.python_path = python_path;
    mode_ = std::move(subprocess);
}

void BridgeManager::set_endpoint(const std::string& host, uint16_t port)
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    require_configurable("endpoint");
    mode_ = NetworkMode{host, port};
}

void BridgeManager::set_timeouts(Timeouts timeouts)
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    require_configurable("timeouts");
    timeouts_ = timeouts;
}

TransportMode BridgeManager::mode() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return mode_;
}

Timeouts BridgeManager::timeouts() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return timeouts_;
}

// =============================================================================
// Connection Management
// =============================================================================

void BridgeManager::start()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    TransportMode mode;
    Timeouts timeouts;
    std::unique_ptr<Connection> leftover;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::Running)
            return;

        state_ = ConnectionState::Starting;
        mode = mode_;
        timeouts = timeouts_;
        leftover = std::move(connection_);
    }

    // A channel that failed mid-call is still held until the next start or stop
    if (leftover)
        teardown(*leftover);

    auto connection = std::make_unique<Connection>();
    const char* stage = "Failed to connect";
    try
    {
        if (auto* subprocess = std::get_if<SubprocessMode>(&mode))
        {
            stage = "Failed to spawn process";
            open_subprocess(*connection, *subprocess, timeouts);
        }
        else
        {
            open_network(*connection, std::get<NetworkMode>(mode), timeouts);
        }

        stage = "Ping failed";
        json pong = connection->client->ping();
        logger()->info("Bridge connected, ping response: {}", pong.dump());
    }
    catch (const std::exception& e)
    {
        logger()->error("Bridge start failed: {}: {}", stage, e.what());
        auto cause = std::current_exception();
        teardown(*connection);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = ConnectionState::Error;
        }
        throw StartFailedError(std::string(stage) + ": " + e.what(), cause);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    connection_ = std::move(connection);
    state_ = ConnectionState::Running;
}

void BridgeManager::open_subprocess(
    Connection& connection, const SubprocessMode& mode, const Timeouts& timeouts
)
{
    std::string python = mode.python_path.value_or(kDefaultPython);
    std::vector<std::string> args = {"-u", "-m", mode.module};

    ProcessOptions options;
    options.redirect_stdin = true;
    options.redirect_stdout = true;
    options.redirect_stderr = true;
    options.environment = mode.environment;
    if (mode.working_dir.has_value())
        options.working_directory = *mode.working_dir;

    logger()->info("Starting bridge with python: {}", python);
    logger()->info("Bridge module: {}", mode.module);
    if (!options.working_directory.empty())
        logger()->info("Working directory: {}", options.working_directory);

    connection.process = std::make_unique<Process>();
    connection.process->spawn(python, args, options);

    const int pid = connection.process->pid();
    logger()->info("Bridge process started with pid {}", pid);

    ReadPipe& stderr_pipe = connection.process->stderr_pipe();
    const std::atomic<bool>& drain_stop = connection.drain_stop;
    connection.stderr_drain = std::thread([&stderr_pipe, &drain_stop, pid]()
                                          { drain_stderr(stderr_pipe, pid, drain_stop); });

    auto client = std::make_shared<StdioRpcClient>(timeouts.read);
    client->connect(connection.process->stdin_pipe(), connection.process->stdout_pipe());
    connection.client = std::move(client);
}

void BridgeManager::open_network(
    Connection& connection, const NetworkMode& mode, const Timeouts& timeouts
)
{
    auto client = std::make_shared<TcpRpcClient>(timeouts);
    client->connect(mode.host, mode.port);
    connection.client = std::move(client);
}

void BridgeManager::teardown(Connection& connection)
{
    // Disconnect FIRST - shutting the socket down wakes a blocked TCP read
    if (connection.client)
        connection.client->disconnect();

    // Then terminate the process - its exit closes stdout and unblocks pipe reads
    if (connection.process && connection.process->pid() != 0)
    {
        try
        {
            int code = connection.process->shutdown(kStopGracePeriod);
            logger()->info("Bridge process {} exited with code {}", connection.process->pid(), code);
        }
        catch (const ProcessError& e)
        {
            logger()->warn("Failed to stop bridge process: {}", e.what());
        }
    }

    // Wait out any in-flight call before the handles it uses go away
    {
        std::lock_guard<std::mutex> lock(call_mutex_);
    }

    connection.drain_stop = true;
    if (connection.stderr_drain.joinable())
        connection.stderr_drain.join();

    connection.client.reset();
    connection.process.reset();
}

void BridgeManager::stop()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    std::unique_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        connection = std::move(connection_);
        state_ = ConnectionState::Stopped;
    }

    if (!connection)
        return;

    teardown(*connection);
    logger()->info("Bridge stopped");
}

ConnectionState BridgeManager::state() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<int> BridgeManager::backend_pid() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!connection_ || !connection_->process)
        return std::nullopt;
    return connection_->process->pid();
}

// =============================================================================
// Backend Calls
// =============================================================================

json BridgeManager::call(const std::string& method, const json& params)
{
    std::lock_guard<std::mutex> call_lock(call_mutex_);

    std::shared_ptr<IRpcClient> client;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ConnectionState::Running || !connection_)
            throw NotRunningError();
        client = connection_->client;
    }

    try
    {
        return client->call(method, params);
    }
    catch (const Error& e)
    {
        if (is_channel_fatal(e.kind()) || e.kind() == ErrorKind::NotConnected)
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            // Leave the state alone if stop() or start() already replaced this channel
            if (state_ == ConnectionState::Running && connection_ && connection_->client == client)
            {
                logger()->error("Bridge channel failed during {}: {}", method, e.what());
                state_ = ConnectionState::Error;
            }
        }
        throw;
    }
}

std::future<json> BridgeManager::call_async(std::string method, json params)
{
    return std::async(
        std::launch::async,
        [this, method = std::move(method), params = std::move(params)]()
        { return call(method, params); }
    );
}

} // namespace devbridge
