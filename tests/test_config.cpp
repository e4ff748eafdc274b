// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <devbridge/config.hpp>
#include <gtest/gtest.h>

using namespace devbridge;

// =============================================================================
// BackendConfig Tests
// =============================================================================

TEST(BackendConfigTest, Defaults)
{
    BackendConfig config;
    EXPECT_EQ(config.backend_type, BackendType::LocalPython);
    EXPECT_FALSE(config.python_path.has_value());
    EXPECT_FALSE(config.auto_start);
    EXPECT_EQ(config.tcp_host(), "127.0.0.1");
    EXPECT_EQ(config.tcp_port(), 9876);
}

TEST(BackendConfigTest, LocalPythonFactory)
{
    auto config = BackendConfig::local_python("/opt/venv/bin/python");
    EXPECT_EQ(config.backend_type, BackendType::LocalPython);
    EXPECT_EQ(config.python_path, "/opt/venv/bin/python");
    EXPECT_TRUE(config.auto_start);
}

TEST(BackendConfigTest, DockerFactory)
{
    auto config = BackendConfig::docker();
    EXPECT_EQ(config.backend_type, BackendType::Docker);
    EXPECT_EQ(config.container_name, "devflow-backend");
    EXPECT_EQ(config.tcp_host(), "127.0.0.1");
    EXPECT_EQ(config.tcp_port(), 9876);
    EXPECT_TRUE(config.auto_start);

    EXPECT_EQ(BackendConfig::docker("custom").container_name, "custom");
}

TEST(BackendConfigTest, Wsl2Factory)
{
    auto config = BackendConfig::wsl2();
    EXPECT_EQ(config.backend_type, BackendType::Wsl2);
    EXPECT_EQ(config.wsl_distro, "Ubuntu");
    EXPECT_EQ(config.tcp_port(), 9876);

    EXPECT_EQ(BackendConfig::wsl2("Debian").wsl_distro, "Debian");
}

TEST(BackendConfigTest, RemoteFactory)
{
    auto config = BackendConfig::remote("192.168.1.100", 8080);
    EXPECT_EQ(config.backend_type, BackendType::Remote);
    EXPECT_EQ(config.tcp_host(), "192.168.1.100");
    EXPECT_EQ(config.tcp_port(), 8080);
    EXPECT_FALSE(config.auto_start);
}

TEST(BackendConfigTest, LocalPythonMapsToSubprocess)
{
    auto mode = BackendConfig::local_python("/usr/bin/python3").to_transport_mode();
    ASSERT_TRUE(is_subprocess(mode));

    const auto& subprocess = std::get<SubprocessMode>(mode);
    EXPECT_EQ(subprocess.python_path, "/usr/bin/python3");
    EXPECT_EQ(subprocess.module, "bridge.main");
}

TEST(BackendConfigTest, LocalPythonKeepsCurrentInterpreter)
{
    SubprocessMode current;
    current.python_path = "/opt/venv/bin/python";
    current.module = "custom.main";
    current.working_dir = "/srv/project";

    BackendConfig config;
    auto mode = std::get<SubprocessMode>(config.to_transport_mode(current));
    EXPECT_EQ(mode.python_path, "/opt/venv/bin/python");
    EXPECT_EQ(mode.module, "custom.main");
    EXPECT_EQ(mode.working_dir, "/srv/project");

    // An interpreter named by the config wins
    auto named = std::get<SubprocessMode>(
        BackendConfig::local_python("/usr/bin/python3").to_transport_mode(current)
    );
    EXPECT_EQ(named.python_path, "/usr/bin/python3");
    EXPECT_EQ(named.module, "custom.main");
}

TEST(BackendConfigTest, LocalPythonOverNetworkStartsFresh)
{
    auto mode = std::get<SubprocessMode>(BackendConfig().to_transport_mode(NetworkMode{}));
    EXPECT_FALSE(mode.python_path.has_value());
    EXPECT_EQ(mode.module, kDefaultBridgeModule);
}

TEST(BackendConfigTest, NetworkTypesIgnoreCurrentMode)
{
    SubprocessMode current;
    current.python_path = "/opt/venv/bin/python";

    auto mode = std::get<NetworkMode>(BackendConfig::remote("10.0.0.2", 7000).to_transport_mode(current));
    EXPECT_EQ(mode.host, "10.0.0.2");
    EXPECT_EQ(mode.port, 7000);
}

TEST(BackendConfigTest, OtherTypesMapToNetwork)
{
    for (const auto& config :
         {BackendConfig::docker(), BackendConfig::wsl2(), BackendConfig::remote("example.org", 7000)})
    {
        auto mode = config.to_transport_mode();
        ASSERT_FALSE(is_subprocess(mode));

        const auto& network = std::get<NetworkMode>(mode);
        EXPECT_EQ(network.host, config.tcp_host());
        EXPECT_EQ(network.port, config.tcp_port());
    }
}

TEST(BackendConfigTest, JsonSerialization)
{
    auto config = BackendConfig::docker("dev");
    json j = config;

    EXPECT_EQ(j["backend_type"], "docker");
    EXPECT_EQ(j["container_name"], "dev");
    EXPECT_EQ(j["remote_port"], 9876);
    EXPECT_TRUE(j["python_path"].is_null());
    EXPECT_EQ(j["auto_start"], true);
}

TEST(BackendConfigTest, JsonDeserialization)
{
    json j = {
        {"backend_type", "remote"},
        {"remote_host", "10.0.0.5"},
        {"remote_port", 9000},
        {"python_path", nullptr},
        {"auto_start", false},
    };

    auto config = j.get<BackendConfig>();
    EXPECT_EQ(config.backend_type, BackendType::Remote);
    EXPECT_EQ(config.tcp_host(), "10.0.0.5");
    EXPECT_EQ(config.tcp_port(), 9000);
    EXPECT_FALSE(config.python_path.has_value());
    EXPECT_FALSE(config.container_name.has_value());
}

TEST(BackendConfigTest, BackendTypeNames)
{
    EXPECT_EQ(json(BackendType::LocalPython), "local_python");
    EXPECT_EQ(json(BackendType::Wsl2), "wsl2");
    EXPECT_EQ(json("docker").get<BackendType>(), BackendType::Docker);
}

// =============================================================================
// ProjectBackendConfig Tests
// =============================================================================

TEST(ProjectBackendConfigTest, EmptyOverrideKeepsGlobal)
{
    auto global = BackendConfig::docker();
    ProjectBackendConfig project;

    auto merged = project.merge_with(global);
    EXPECT_EQ(merged.backend_type, BackendType::Docker);
    EXPECT_EQ(merged.container_name, "devflow-backend");
    EXPECT_EQ(merged.tcp_port(), 9876);
}

TEST(ProjectBackendConfigTest, OverridesApplied)
{
    auto global = BackendConfig::local_python("/usr/bin/python3");

    ProjectBackendConfig project;
    project.backend_type = BackendType::Remote;
    project.host = "build.internal";
    project.port = 7777;

    auto merged = project.merge_with(global);
    EXPECT_EQ(merged.backend_type, BackendType::Remote);
    EXPECT_EQ(merged.tcp_host(), "build.internal");
    EXPECT_EQ(merged.tcp_port(), 7777);
    // Fields without an override come from the global config
    EXPECT_EQ(merged.python_path, "/usr/bin/python3");
}

TEST(ProjectBackendConfigTest, ContainerAndDistroOverrides)
{
    ProjectBackendConfig project;
    project.container_name = "project-backend";
    project.wsl_distro = "Debian";

    auto merged = project.merge_with(BackendConfig::docker());
    EXPECT_EQ(merged.container_name, "project-backend");
    EXPECT_EQ(merged.wsl_distro, "Debian");
}

TEST(ProjectBackendConfigTest, JsonUsesTypeKey)
{
    json j = {{"type", "docker"}, {"container_name", "proj"}};
    auto project = j.get<ProjectBackendConfig>();

    EXPECT_EQ(project.backend_type, BackendType::Docker);
    EXPECT_EQ(project.container_name, "proj");
    EXPECT_FALSE(project.port.has_value());

    json back = project;
    EXPECT_EQ(back["type"], "docker");
    EXPECT_TRUE(back["host"].is_null());
}

// =============================================================================
// Endpoint Parsing Tests
// =============================================================================

TEST(ParseEndpointTest, PortOnly)
{
    auto endpoint = parse_endpoint("8080");
    EXPECT_EQ(endpoint.host, "127.0.0.1");
    EXPECT_EQ(endpoint.port, 8080);
}

TEST(ParseEndpointTest, HostOnly)
{
    auto endpoint = parse_endpoint("backend.local");
    EXPECT_EQ(endpoint.host, "backend.local");
    EXPECT_EQ(endpoint.port, 9876);
}

TEST(ParseEndpointTest, HostAndPort)
{
    auto endpoint = parse_endpoint("10.1.2.3:9000");
    EXPECT_EQ(endpoint.host, "10.1.2.3");
    EXPECT_EQ(endpoint.port, 9000);
}

TEST(ParseEndpointTest, TcpScheme)
{
    auto endpoint = parse_endpoint("tcp://localhost:9877");
    EXPECT_EQ(endpoint.host, "localhost");
    EXPECT_EQ(endpoint.port, 9877);
}

TEST(ParseEndpointTest, InvalidInput)
{
    EXPECT_THROW(parse_endpoint(""), std::invalid_argument);
    EXPECT_THROW(parse_endpoint("0"), std::invalid_argument);
    EXPECT_THROW(parse_endpoint("70000"), std::invalid_argument);
    EXPECT_THROW(parse_endpoint("host:99999"), std::invalid_argument);
    EXPECT_THROW(parse_endpoint("http://host:80"), std::invalid_argument);
    EXPECT_THROW(parse_endpoint("host:port"), std::invalid_argument);
}
