// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <devbridge/commands.hpp>
#include <devbridge/logging.hpp>

namespace devbridge
{

CommandResponse forward_call(BridgeManager& bridge, const std::string& method, const json& params)
{
    try
    {
        return CommandResponse::ok(bridge.call(method, params));
    }
    catch (const Error& e)
    {
        return CommandResponse::err(std::string("Bridge error: ") + e.what());
    }
}

CommandResponse bridge_status(BridgeManager& bridge)
{
    return CommandResponse::ok(to_string(bridge.state()));
}

CommandResponse start_bridge(
    BridgeManager& bridge, const std::string& module, const std::optional<std::string>& working_dir
)
{
    try
    {
        SubprocessMode mode;
        TransportMode current = bridge.mode();
        if (auto* subprocess = std::get_if<SubprocessMode>(&current))
            mode = *subprocess;
        mode.module = module;
        mode.working_dir = working_dir;

        if (bridge.state() != ConnectionState::Running)
        {
            // Releases whatever a failed connection left behind
            bridge.stop();
            bridge.set_mode(std::move(mode));
        }
        bridge.start();
        return CommandResponse::ok();
    }
    catch (const Error& e)
    {
        return CommandResponse::err(e.what());
    }
}

CommandResponse start_bridge_with_config(BridgeManager& bridge, const BackendConfig& config)
{
    logger()->info("Starting bridge with config: {}", json(config.backend_type).get<std::string>());

    try
    {
        if (bridge.state() != ConnectionState::Running)
        {
            TransportMode mode = config.to_transport_mode(bridge.mode());
            bridge.stop();
            bridge.set_mode(std::move(mode));
        }
        bridge.start();
        return CommandResponse::ok();
    }
    catch (const Error& e)
    {
        return CommandResponse::err(e.what());
    }
}

CommandResponse stop_bridge(BridgeManager& bridge)
{
    bridge.stop();
    return CommandResponse::ok();
}

} // namespace devbridge
