// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace devbridge
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

// =============================================================================
// Protocol Constants
// =============================================================================

/// Value of the "jsonrpc" member on every request
inline constexpr const char* kProtocolVersion = "2.0";

/// Method used for the liveness check on start
inline constexpr const char* kPingMethod = "system.ping";

/// Port the backend service listens on when none is configured
inline constexpr uint16_t kDefaultPort = 9876;

/// Host used for network mode when none is configured
inline constexpr const char* kDefaultHost = "127.0.0.1";

/// Python module launched in subprocess mode
inline constexpr const char* kDefaultBridgeModule = "bridge.main";

/// Interpreter used when no python path is configured
inline constexpr const char* kDefaultPython = "python3";

// =============================================================================
// Enums
// =============================================================================

/// Connection state of the bridge
enum class ConnectionState
{
    Stopped,
    Starting,
    Running,
    Error
};

// JSON enum serialization
NLOHMANN_JSON_SERIALIZE_ENUM(
    ConnectionState,
    {
        {ConnectionState::Stopped, "stopped"},
        {ConnectionState::Starting, "starting"},
        {ConnectionState::Running, "running"},
        {ConnectionState::Error, "error"},
    }
)

/// Display name of a state, e.g. "Running"
inline const char* to_string(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Stopped:
        return "Stopped";
    case ConnectionState::Starting:
        return "Starting";
    case ConnectionState::Running:
        return "Running";
    case ConnectionState::Error:
        return "Error";
    }
    return "Unknown";
}

// =============================================================================
// Transport Mode
// =============================================================================

/// Spawn the backend as a child process and talk over its stdin/stdout
struct SubprocessMode
{
    /// Interpreter to launch (empty = python3 from PATH)
    std::optional<std::string> python_path;

    /// Working directory for the backend (empty = inherit)
    std::optional<std::string> working_dir;

    /// Module passed to "-m"
    std::string module = kDefaultBridgeModule;

    /// Extra environment variables for the backend
    std::map<std::string, std::string> environment;
};

/// Connect to a backend service over TCP
struct NetworkMode
{
    std::string host = kDefaultHost;
    uint16_t port = kDefaultPort;
};

/// Transport selection, fixed between start() and stop()
using TransportMode = std::variant<SubprocessMode, NetworkMode>;

inline bool is_subprocess(const TransportMode& mode)
{
    return std::holds_alternative<SubprocessMode>(mode);
}

// =============================================================================
// Timeouts
// =============================================================================

/// I/O bounds for the transports (zero = unbounded)
struct Timeouts
{
    std::chrono::milliseconds connect{10000};
    std::chrono::milliseconds read{60000};
    std::chrono::milliseconds write{10000};
};

} // namespace devbridge
