// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file commands.hpp
/// @brief Application-facing commands that wrap BridgeManager in uniform responses

#include <devbridge/bridge.hpp>
#include <devbridge/config.hpp>
#include <optional>
#include <string>

namespace devbridge
{

/// Uniform envelope returned by every command
///
/// Serializes as {"success": bool, "data": any, "error": string|null}.
struct CommandResponse
{
    bool success = false;
    json data;
    std::optional<std::string> error;

    static CommandResponse ok(json data = nullptr)
    {
        return CommandResponse{true, std::move(data), std::nullopt};
    }

    static CommandResponse err(std::string message)
    {
        return CommandResponse{false, nullptr, std::move(message)};
    }
};

inline void to_json(json& j, const CommandResponse& r)
{
    j = json{{"success", r.success}, {"data", r.data}};
    if (r.error)
        j["error"] = *r.error;
    else
        j["error"] = nullptr;
}

inline void from_json(const json& j, CommandResponse& r)
{
    j.at("success").get_to(r.success);
    r.data = j.value("data", json());
    if (j.contains("error") && !j.at("error").is_null())
        r.error = j.at("error").get<std::string>();
    else
        r.error.reset();
}

/// Call a backend method; failures become "Bridge error: <message>"
CommandResponse forward_call(BridgeManager& bridge, const std::string& method, const json& params = nullptr);

/// Current state name, e.g. "Running"
CommandResponse bridge_status(BridgeManager& bridge);

/// Start the bridge as a subprocess running @p module
/// @param working_dir Working directory for the backend (empty = inherit)
CommandResponse start_bridge(
    BridgeManager& bridge,
    const std::string& module = kDefaultBridgeModule,
    const std::optional<std::string>& working_dir = std::nullopt
);

/// Configure the bridge from a backend configuration and start it
CommandResponse start_bridge_with_config(BridgeManager& bridge, const BackendConfig& config);

/// Stop the bridge (always succeeds)
CommandResponse stop_bridge(BridgeManager& bridge);

} // namespace devbridge
