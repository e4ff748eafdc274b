// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file config.hpp
/// @brief Backend configuration catalog and endpoint parsing

#include <cstdint>
#include <devbridge/types.hpp>
#include <optional>
#include <string>

namespace devbridge
{

// =============================================================================
// Backend Type
// =============================================================================

/// How the backend is hosted
enum class BackendType
{
    /// Local Python installation, launched as a subprocess
    LocalPython,
    /// Docker container exposing the TCP service
    Docker,
    /// WSL2 distribution exposing the TCP service
    Wsl2,
    /// Remote backend service
    Remote
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    BackendType,
    {
        {BackendType::LocalPython, "local_python"},
        {BackendType::Docker, "docker"},
        {BackendType::Wsl2, "wsl2"},
        {BackendType::Remote, "remote"},
    }
)

/// Container name used by BackendConfig::docker() when none is given
inline constexpr const char* kDefaultContainerName = "devflow-backend";

/// Distribution used by BackendConfig::wsl2() when none is given
inline constexpr const char* kDefaultWslDistro = "Ubuntu";

// =============================================================================
// Backend Config
// =============================================================================

/// Configuration for one backend
struct BackendConfig
{
    BackendType backend_type = BackendType::LocalPython;

    /// Interpreter (LocalPython)
    std::optional<std::string> python_path;

    /// Container name (Docker)
    std::optional<std::string> container_name;

    /// Distribution name (Wsl2)
    std::optional<std::string> wsl_distro;

    /// Service host (Docker, Wsl2, Remote)
    std::optional<std::string> remote_host;

    /// Service port (Docker, Wsl2, Remote)
    std::optional<uint16_t> remote_port;

    /// Start the backend when the application launches
    bool auto_start = false;

    static BackendConfig local_python(std::optional<std::string> python_path = std::nullopt);
    static BackendConfig docker(std::optional<std::string> container_name = std::nullopt);
    static BackendConfig wsl2(std::optional<std::string> distro = std::nullopt);
    static BackendConfig remote(const std::string& host, uint16_t port);

    /// Service host, defaulting to 127.0.0.1
    std::string tcp_host() const
    {
        return remote_host.value_or(kDefaultHost);
    }

    /// Service port, defaulting to 9876
    uint16_t tcp_port() const
    {
        return remote_port.value_or(kDefaultPort);
    }

    /// Transport the bridge uses for this backend
    ///
    /// LocalPython maps to a subprocess; every other type reaches an already
    /// running service over TCP.
    TransportMode to_transport_mode() const;

    /// Same as to_transport_mode(), layered over an existing mode
    ///
    /// For LocalPython the module, working directory and environment of a
    /// current subprocess mode carry over, and so does its interpreter unless
    /// this config names one.
    TransportMode to_transport_mode(const TransportMode& current) const;
};

namespace detail
{

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out)
{
    auto it = j.find(key);
    if (it != j.end() && !it->is_null())
        out = it->get<T>();
    else
        out.reset();
}

template <typename T>
void write_optional(json& j, const char* key, const std::optional<T>& value)
{
    if (value)
        j[key] = *value;
    else
        j[key] = nullptr;
}

} // namespace detail

inline void to_json(json& j, const BackendConfig& c)
{
    j = json{{"backend_type", c.backend_type}, {"auto_start", c.auto_start}};
    detail::write_optional(j, "python_path", c.python_path);
    detail::write_optional(j, "container_name", c.container_name);
    detail::write_optional(j, "wsl_distro", c.wsl_distro);
    detail::write_optional(j, "remote_host", c.remote_host);
    detail::write_optional(j, "remote_port", c.remote_port);
}

inline void from_json(const json& j, BackendConfig& c)
{
    j.at("backend_type").get_to(c.backend_type);
    if (j.contains("auto_start"))
        j.at("auto_start").get_to(c.auto_start);
    detail::read_optional(j, "python_path", c.python_path);
    detail::read_optional(j, "container_name", c.container_name);
    detail::read_optional(j, "wsl_distro", c.wsl_distro);
    detail::read_optional(j, "remote_host", c.remote_host);
    detail::read_optional(j, "remote_port", c.remote_port);
}

// =============================================================================
// Project Backend Config
// =============================================================================

/// Per-project override of the global backend configuration
struct ProjectBackendConfig
{
    std::optional<BackendType> backend_type;
    std::optional<std::string> container_name;
    std::optional<std::string> wsl_distro;
    std::optional<std::string> host;
    std::optional<uint16_t> port;

    /// Apply every field that is set on top of the global configuration
    BackendConfig merge_with(const BackendConfig& global) const;
};

inline void to_json(json& j, const ProjectBackendConfig& c)
{
    j = json::object();
    detail::write_optional(j, "type", c.backend_type);
    detail::write_optional(j, "container_name", c.container_name);
    detail::write_optional(j, "wsl_distro", c.wsl_distro);
    detail::write_optional(j, "host", c.host);
    detail::write_optional(j, "port", c.port);
}

inline void from_json(const json& j, ProjectBackendConfig& c)
{
    detail::read_optional(j, "type", c.backend_type);
    detail::read_optional(j, "container_name", c.container_name);
    detail::read_optional(j, "wsl_distro", c.wsl_distro);
    detail::read_optional(j, "host", c.host);
    detail::read_optional(j, "port", c.port);
}

// =============================================================================
// Endpoint Parsing
// =============================================================================

/// Parse a backend service endpoint
///
/// Accepts "9876", "localhost", "localhost:9876" and "tcp://localhost:9876".
/// The host defaults to 127.0.0.1 and the port to 9876.
/// @throws std::invalid_argument if the text is not an endpoint
NetworkMode parse_endpoint(const std::string& endpoint);

} // namespace devbridge
