// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <devbridge/config.hpp>
#include <regex>
#include <stdexcept>

namespace devbridge
{

// =============================================================================
// BackendConfig
// =============================================================================

BackendConfig BackendConfig::local_python(std::optional<std::string> python_path)
{
    BackendConfig config;
    config.backend_type = BackendType::LocalPython;
    config.python_path = std::move(python_path);
    config.auto_start = true;
    return config;
}

BackendConfig BackendConfig::docker(std::optional<std::string> container_name)
{
    BackendConfig config;
    config.backend_type = BackendType::Docker;
    config.container_name = container_name.value_or(kDefaultContainerName);
    config.remote_host = kDefaultHost;
    config.remote_port = kDefaultPort;
    config.auto_start = true;
    return config;
}

BackendConfig BackendConfig::wsl2(std::optional<std::string> distro)
{
    BackendConfig config;
    config.backend_type = BackendType::Wsl2;
    config.wsl_distro = distro.value_or(kDefaultWslDistro);
    config.remote_host = kDefaultHost;
    config.remote_port = kDefaultPort;
    config.auto_start = true;
    return config;
}

BackendConfig BackendConfig::remote(const std::string& host, uint16_t port)
{
    BackendConfig config;
    config.backend_type = BackendType::Remote;
    config.remote_host = host;
    config.remote_port = port;
    config.auto_start = false;
    return config;
}

TransportMode BackendConfig::to_transport_mode() const
{
    if (backend_type == BackendType::LocalPython)
    {
        SubprocessMode mode;
        mode.python_path = python_path;
        return mode;
    }
    return NetworkMode{tcp_host(), tcp_port()};
}

TransportMode BackendConfig::to_transport_mode(const TransportMode& current) const
{
    if (backend_type != BackendType::LocalPython)
        return to_transport_mode();

    SubprocessMode mode;
    if (auto* subprocess = std::get_if<SubprocessMode>(&current))
        mode = *subprocess;
    if (python_path.has_value())
        mode.python_path = python_path;
    return mode;
}

// =============================================================================
// ProjectBackendConfig
// =============================================================================

BackendConfig ProjectBackendConfig::merge_with(const BackendConfig& global) const
{
    BackendConfig result = global;

    if (backend_type)
        result.backend_type = *backend_type;
    if (container_name)
        result.container_name = container_name;
    if (wsl_distro)
        result.wsl_distro = wsl_distro;
    if (host)
        result.remote_host = host;
    if (port)
        result.remote_port = port;

    return result;
}

// =============================================================================
// Endpoint Parsing
// =============================================================================

namespace
{

uint16_t parse_port(const std::string& text, const std::string& endpoint)
{
    unsigned long port = 0;
    try
    {
        port = std::stoul(text);
    }
    catch (const std::exception&)
    {
        throw std::invalid_argument("Invalid endpoint port: " + endpoint);
    }
    if (port == 0 || port > 65535)
        throw std::invalid_argument("Endpoint port out of range: " + endpoint);
    return static_cast<uint16_t>(port);
}

} // namespace

NetworkMode parse_endpoint(const std::string& endpoint)
{
    NetworkMode mode;

    // Just a port number
    static const std::regex port_only(R"(\d+)");
    if (std::regex_match(endpoint, port_only))
    {
        mode.port = parse_port(endpoint, endpoint);
        return mode;
    }

    // [tcp://]host[:port]
    static const std::regex host_port(R"((?:tcp://)?([^:/\s]+)(?::(\d+))?)");
    std::smatch match;
    if (!std::regex_match(endpoint, match, host_port))
        throw std::invalid_argument("Invalid endpoint: " + endpoint);

    mode.host = match[1].str();
    if (match[2].matched)
        mode.port = parse_port(match[2].str(), endpoint);
    return mode;
}

} // namespace devbridge
