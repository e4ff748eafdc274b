// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <devbridge/commands.hpp>
#include <gtest/gtest.h>

#include "fake_tcp_backend.hpp"
#include "test_helpers.hpp"

using namespace devbridge;
using devbridge::test::fake_backend_mode;
using devbridge::test::FakeTcpBackend;

// =============================================================================
// CommandResponse Tests
// =============================================================================

TEST(CommandResponseTest, OkSerialization)
{
    json j = CommandResponse::ok({{"projects", json::array()}});

    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["data"]["projects"], json::array());
    EXPECT_TRUE(j["error"].is_null());
}

TEST(CommandResponseTest, ErrSerialization)
{
    json j = CommandResponse::err("Bridge error: Bridge not running");

    EXPECT_EQ(j["success"], false);
    EXPECT_TRUE(j["data"].is_null());
    EXPECT_EQ(j["error"], "Bridge error: Bridge not running");
}

TEST(CommandResponseTest, Deserialization)
{
    json j = {{"success", false}, {"data", nullptr}, {"error", "boom"}};
    auto response = j.get<CommandResponse>();

    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, "boom");
}

// =============================================================================
// Command Tests
// =============================================================================

TEST(CommandsTest, ForwardCallWhenStopped)
{
    BridgeManager bridge;
    auto response = forward_call(bridge, "projects.list");

    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, "Bridge error: Bridge not running");
}

TEST(CommandsTest, StatusNames)
{
    BridgeManager bridge(fake_backend_mode());
    EXPECT_EQ(bridge_status(bridge).data, "Stopped");

    bridge.start();
    EXPECT_EQ(bridge_status(bridge).data, "Running");

    bridge.stop();
    EXPECT_EQ(bridge_status(bridge).data, "Stopped");
}

TEST(CommandsTest, ForwardCallSuccess)
{
    BridgeManager bridge(fake_backend_mode());
    bridge.start();

    auto response = forward_call(bridge, "test.echo", {{"id", "p1"}});
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.data["id"], "p1");
    EXPECT_FALSE(response.error.has_value());
}

TEST(CommandsTest, ForwardCallBackendError)
{
    BridgeManager bridge(fake_backend_mode());
    bridge.start();

    auto response =
        forward_call(bridge, "test.error", {{"code", -32001}, {"message", "Project not found"}});
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, "Bridge error: RPC error -32001: Project not found");
    EXPECT_EQ(bridge_status(bridge).data, "Running");
}

TEST(CommandsTest, StartBridgeWithModuleAndWorkingDir)
{
    BridgeManager bridge(fake_backend_mode());

    auto response = start_bridge(bridge, "echo", std::string("/"));
    ASSERT_TRUE(response.success) << response.error.value_or("");

    EXPECT_EQ(forward_call(bridge, "test.cwd").data, "/");
    EXPECT_TRUE(stop_bridge(bridge).success);
    EXPECT_EQ(bridge.state(), ConnectionState::Stopped);
}

TEST(CommandsTest, StartBridgeFailure)
{
    BridgeManager bridge(fake_backend_mode());

    auto response = start_bridge(bridge, "exit");
    EXPECT_FALSE(response.success);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->rfind("Failed to start bridge: ", 0), 0u);
    EXPECT_EQ(bridge_status(bridge).data, "Error");
}

TEST(CommandsTest, StartBridgeWithRemoteConfig)
{
    FakeTcpBackend server;
    BridgeManager bridge;

    auto response = start_bridge_with_config(bridge, BackendConfig::remote("127.0.0.1", server.port()));
    ASSERT_TRUE(response.success) << response.error.value_or("");

    EXPECT_FALSE(is_subprocess(bridge.mode()));
    EXPECT_EQ(forward_call(bridge, "test.echo", 5).data, 5);
}

TEST(CommandsTest, StartBridgeWithLocalPythonConfig)
{
    BridgeManager bridge;

    // The fake backend stands in for the interpreter; its module defaults to
    // bridge.main, which it does not know, so the start fails cleanly
    auto response = start_bridge_with_config(bridge, BackendConfig::local_python(test::fake_backend_path()));

    EXPECT_FALSE(response.success);
    EXPECT_TRUE(is_subprocess(bridge.mode()));
    EXPECT_EQ(std::get<SubprocessMode>(bridge.mode()).python_path, test::fake_backend_path());
    EXPECT_EQ(bridge.state(), ConnectionState::Error);
}

TEST(CommandsTest, StartBridgeWithConfigKeepsInterpreter)
{
    BridgeManager bridge(fake_backend_mode());

    auto response = start_bridge_with_config(bridge, BackendConfig());
    ASSERT_TRUE(response.success) << response.error.value_or("");

    auto mode = std::get<SubprocessMode>(bridge.mode());
    EXPECT_EQ(mode.python_path, test::fake_backend_path());
    EXPECT_EQ(mode.module, "echo");
    EXPECT_EQ(forward_call(bridge, "test.echo", 1).data, 1);
}

TEST(CommandsTest, StartBridgeRecoversFromError)
{
    BridgeManager bridge(fake_backend_mode());
    bridge.start();
    EXPECT_FALSE(forward_call(bridge, "test.noise").success);
    ASSERT_EQ(bridge.state(), ConnectionState::Error);

    auto response = start_bridge(bridge, "echo");
    ASSERT_TRUE(response.success) << response.error.value_or("");
    EXPECT_EQ(bridge.state(), ConnectionState::Running);
}

TEST(CommandsTest, StartWithConfigWhileRunningIsNoop)
{
    BridgeManager bridge(fake_backend_mode());
    bridge.start();
    auto pid = bridge.backend_pid();

    auto response = start_bridge_with_config(bridge, BackendConfig::remote("127.0.0.1", 1));
    EXPECT_TRUE(response.success);
    EXPECT_EQ(bridge.backend_pid(), pid);
    EXPECT_TRUE(is_subprocess(bridge.mode()));
}

TEST(CommandsTest, StopBridgeAlwaysSucceeds)
{
    BridgeManager bridge;
    EXPECT_TRUE(stop_bridge(bridge).success);
    EXPECT_TRUE(stop_bridge(bridge).success);
}
