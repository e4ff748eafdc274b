// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file bridge.hpp
/// @brief BridgeManager, the supervisor of the RPC channel to the backend

#include <chrono>
#include <devbridge/errors.hpp>
#include <devbridge/rpc_client.hpp>
#include <devbridge/types.hpp>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace devbridge
{

/// Supervises a single RPC channel to the backend
///
/// The manager selects a transport from its configured mode, owns that
/// transport between start() and stop(), and exposes one blocking call()
/// surface regardless of which transport is active.
///
/// Example usage:
/// @code
/// SubprocessMode mode;
/// mode.python_path = "/usr/bin/python3";
///
/// BridgeManager bridge(mode);
/// bridge.start();
///
/// json status = bridge.call("config.get_global");
///
/// bridge.stop();
/// @endcode
///
/// State machine: Stopped -> Starting -> Running, with Error on any channel
/// failure and stop() returning to Stopped from anywhere. Configuration may
/// only change while the bridge is Stopped.
class BridgeManager
{
  public:
    /// Grace period between SIGTERM and SIGKILL when stopping a backend process
    static constexpr std::chrono::milliseconds kStopGracePeriod{2000};

    explicit BridgeManager(TransportMode mode = SubprocessMode{}, Timeouts timeouts = {});

    /// Destructor - stops the bridge, terminating any backend process
    ~BridgeManager();

    // Non-copyable, non-movable (owns unique resources)
    BridgeManager(const BridgeManager&) = delete;
    BridgeManager& operator=(const BridgeManager&) = delete;
    BridgeManager(BridgeManager&&) = delete;
    BridgeManager& operator=(BridgeManager&&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Select the transport mode
    /// @throws UsageError unless the bridge is Stopped
    void set_mode(TransportMode mode);

    /// Set the interpreter for subprocess mode (switches to subprocess mode)
    /// @throws UsageError unless the bridge is Stopped
    void set_python_path(const std::string& python_path);

    /// Set the service endpoint for network mode (switches to network mode)
    /// @throws UsageError unless the bridge is Stopped
    void set_endpoint(const std::string& host, uint16_t port = kDefaultPort);

    /// @throws UsageError unless the bridge is Stopped
    void set_timeouts(Timeouts timeouts);

    TransportMode mode() const;
    Timeouts timeouts() const;

    // =========================================================================
    // Connection Management
    // =========================================================================

    /// Open the channel and verify the backend answers "system.ping"
    ///
    /// No-op if already Running. On failure everything established so far is
    /// torn down and the bridge is left in Error.
    /// @throws StartFailedError wrapping the underlying cause
    void start();

    /// Tear the channel down and return to Stopped
    ///
    /// Terminates the backend process (SIGTERM, then SIGKILL after
    /// kStopGracePeriod) or closes the socket. Idempotent; never throws.
    void stop();

    /// Get the current connection state
    ConnectionState state() const;

    /// PID of the backend process while one is owned (subprocess mode)
    std::optional<int> backend_pid() const;

    // =========================================================================
    // Backend Calls
    // =========================================================================

    /// Call a backend method
    ///
    /// Calls are serialized: at most one is in flight per manager. A channel
    /// failure moves the bridge to Error before the exception propagates; a
    /// JsonRpcError from the backend leaves it Running. There is no retry and
    /// no reconnect.
    /// @throws NotRunningError if the bridge is not Running (no I/O is attempted)
    json call(const std::string& method, const json& params = nullptr);

    /// Run call() on a worker thread
    /// @return Future that resolves to the result or rethrows the call's error
    std::future<json> call_async(std::string method, json params = nullptr);

  private:
    struct Connection;

    /// Spawn the backend process and connect the stdio client
    void open_subprocess(Connection& connection, const SubprocessMode& mode, const Timeouts& timeouts);

    /// Connect the TCP client
    void open_network(Connection& connection, const NetworkMode& mode, const Timeouts& timeouts);

    /// Release everything a connection holds; waits for an in-flight call to return
    void teardown(Connection& connection);

    /// @throws UsageError unless the bridge is Stopped (caller holds state_mutex_)
    void require_configurable(const char* what) const;

    // Serializes start(), stop() and configuration changes
    std::mutex lifecycle_mutex_;

    // Serializes call()
    std::mutex call_mutex_;

    // Guards everything below
    mutable std::mutex state_mutex_;
    ConnectionState state_ = ConnectionState::Stopped;
    TransportMode mode_;
    Timeouts timeouts_;
    std::unique_ptr<Connection> connection_;
};

} // namespace devbridge
