//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_server_config.cpp
// Purpose: MCPHOST_* environment configuration, command-line override and env parsing helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "env/EnvVars.h"
#include "mcphost/ServerConfig.h"
#include "mcphost/version.h"

using namespace mcphost;

namespace {

const std::vector<const char*> kVars = {
    "MCPHOST_NAME", "MCPHOST_VERSION", "MCPHOST_INSTRUCTIONS", "MCPHOST_TRANSPORT", "MCPHOST_LISTEN",
    "MCPHOST_TLS_CERT", "MCPHOST_TLS_KEY", "MCPHOST_ALLOWED_ORIGINS", "MCPHOST_API_KEY",
    "MCPHOST_SESSION_TTL_S", "MCPHOST_ALLOW_CLIENT_TERMINATION", "MCPHOST_EVENT_HISTORY_S",
    "MCPHOST_EVENT_HISTORY_MAX", "MCPHOST_KEEPALIVE_S", "MCPHOST_TASK_CAPACITY", "MCPHOST_TASK_RETENTION_S",
    "MCPHOST_LOG_LEVEL", "MCPHOST_LOG_FILE"};

// Clears every MCPHOST_* variable before and after each test.
class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kVars) ::unsetenv(name);
    }
    static void set(const char* name, const char* value) { ::setenv(name, value, 1); }
};

} // namespace

TEST_F(ServerConfigTest, DefaultsWithEmptyEnvironment) {
    auto cfg = ServerConfig::FromEnvironment();
    EXPECT_EQ(cfg.name, "mcphost");
    EXPECT_TRUE(cfg.version.empty());
    EXPECT_FALSE(cfg.instructions.has_value());
    EXPECT_EQ(cfg.transport, TransportKind::Stdio);
    EXPECT_EQ(cfg.listen, "http://127.0.0.1:8080/mcp");
    EXPECT_TRUE(cfg.allowedOrigins.empty());
    EXPECT_TRUE(cfg.apiKey.empty());
    EXPECT_EQ(cfg.sessionTtl, std::chrono::seconds(3600));
    EXPECT_TRUE(cfg.allowClientTermination);
    EXPECT_EQ(cfg.eventHistoryMax, 1000u);
    EXPECT_EQ(cfg.keepAlive, std::chrono::seconds(30));
    EXPECT_EQ(cfg.logLevel, "INFO");

    auto server = cfg.ToServerOptions();
    EXPECT_EQ(server.serverInfo.name, "mcphost");
    EXPECT_EQ(server.serverInfo.version, getVersionString());
}

TEST_F(ServerConfigTest, ReadsEveryVariable) {
    set("MCPHOST_NAME", "demo");
    set("MCPHOST_VERSION", "9.9.9");
    set("MCPHOST_INSTRUCTIONS", "Use the tools");
    set("MCPHOST_TRANSPORT", "HTTP");
    set("MCPHOST_LISTEN", "http://0.0.0.0:9000/rpc");
    set("MCPHOST_ALLOWED_ORIGINS", " https://a.example.com , ,https://b.example.com");
    set("MCPHOST_SESSION_TTL_S", "120");
    set("MCPHOST_ALLOW_CLIENT_TERMINATION", "off");
    set("MCPHOST_EVENT_HISTORY_S", "30");
    set("MCPHOST_EVENT_HISTORY_MAX", "25");
    set("MCPHOST_KEEPALIVE_S", "5");
    set("MCPHOST_TASK_CAPACITY", "10");
    set("MCPHOST_TASK_RETENTION_S", "60");
    set("MCPHOST_LOG_LEVEL", "debug");
    set("MCPHOST_LOG_FILE", "/tmp/mcphost.log");

    auto cfg = ServerConfig::FromEnvironment();
    EXPECT_EQ(cfg.name, "demo");
    EXPECT_EQ(cfg.instructions.value(), "Use the tools");
    EXPECT_EQ(cfg.transport, TransportKind::Http);
    ASSERT_EQ(cfg.allowedOrigins.size(), 2u);
    EXPECT_EQ(cfg.allowedOrigins[0], "https://a.example.com");
    EXPECT_EQ(cfg.allowedOrigins[1], "https://b.example.com");
    EXPECT_EQ(cfg.sessionTtl, std::chrono::seconds(120));
    EXPECT_FALSE(cfg.allowClientTermination);
    EXPECT_EQ(cfg.taskCapacity, 10u);
    EXPECT_EQ(cfg.logFile, "/tmp/mcphost.log");

    auto server = cfg.ToServerOptions();
    EXPECT_EQ(server.serverInfo.version, "9.9.9");
    EXPECT_EQ(server.instructions.value(), "Use the tools");
    EXPECT_EQ(server.tasks.capacity, 10u);
    EXPECT_EQ(server.tasks.retention, std::chrono::seconds(60));

    auto http = cfg.ToHttpOptions();
    EXPECT_EQ(http.address, "0.0.0.0");
    EXPECT_EQ(http.port, "9000");
    EXPECT_EQ(http.endpoint, "/rpc");
    EXPECT_EQ(http.allowedOrigins.size(), 2u);
    EXPECT_EQ(http.sessionTtl, std::chrono::seconds(120));
    EXPECT_FALSE(http.allowClientTermination);
    EXPECT_EQ(http.eventHistoryDuration, std::chrono::seconds(30));
    EXPECT_EQ(http.eventHistoryMax, 25u);
    EXPECT_EQ(http.keepAliveInterval, std::chrono::seconds(5));
    EXPECT_EQ(http.authGate, nullptr);
}

TEST_F(ServerConfigTest, MalformedValuesKeepDefaults) {
    set("MCPHOST_TRANSPORT", "carrier-pigeon");
    set("MCPHOST_SESSION_TTL_S", "ten");
    set("MCPHOST_KEEPALIVE_S", "-5");
    set("MCPHOST_EVENT_HISTORY_MAX", "12abc");
    set("MCPHOST_ALLOW_CLIENT_TERMINATION", "maybe");

    auto cfg = ServerConfig::FromEnvironment();
    EXPECT_EQ(cfg.transport, TransportKind::Stdio);
    EXPECT_EQ(cfg.sessionTtl, std::chrono::seconds(3600));
    EXPECT_EQ(cfg.keepAlive, std::chrono::seconds(30));
    EXPECT_EQ(cfg.eventHistoryMax, 1000u);
    EXPECT_TRUE(cfg.allowClientTermination);
}

TEST_F(ServerConfigTest, ApiKeyInstallsBearerGate) {
    set("MCPHOST_API_KEY", "k3y");
    set("MCPHOST_LISTEN", "https://127.0.0.1:8443/mcp");
    set("MCPHOST_TLS_CERT", "cert.pem");
    set("MCPHOST_TLS_KEY", "key.pem");

    auto http = ServerConfig::FromEnvironment().ToHttpOptions();
    EXPECT_EQ(http.scheme, "https");
    EXPECT_EQ(http.certFile, "cert.pem");
    EXPECT_EQ(http.keyFile, "key.pem");
    ASSERT_NE(http.authGate, nullptr);
    EXPECT_TRUE(http.authGate->Validate("k3y"));
    EXPECT_FALSE(http.authGate->Validate("wrong"));
}

TEST(ServerConfigArguments, TransportOverride) {
    ServerConfig cfg;
    std::string error;
    const char* argv[] = {"mcphost_server", "--transport=http"};
    EXPECT_TRUE(cfg.ApplyArguments(2, argv, error));
    EXPECT_EQ(cfg.transport, TransportKind::Http);

    const char* none[] = {"mcphost_server"};
    EXPECT_TRUE(cfg.ApplyArguments(1, none, error));
    EXPECT_EQ(cfg.transport, TransportKind::Http);
}

TEST(ServerConfigArguments, RejectsUnknownInput) {
    ServerConfig cfg;
    std::string error;
    const char* badKind[] = {"mcphost_server", "--transport=smoke"};
    EXPECT_FALSE(cfg.ApplyArguments(2, badKind, error));
    EXPECT_EQ(error, "Unknown transport: smoke");

    const char* badArg[] = {"mcphost_server", "--verbose"};
    EXPECT_FALSE(cfg.ApplyArguments(2, badArg, error));
    EXPECT_EQ(error, "Unknown argument: --verbose");
    EXPECT_EQ(cfg.transport, TransportKind::Stdio);
}

TEST(ServerConfigArguments, TransportKindNames) {
    EXPECT_EQ(transportKindFromString("stdio").value(), TransportKind::Stdio);
    EXPECT_EQ(transportKindFromString("HTTPS").value(), TransportKind::Http);
    EXPECT_FALSE(transportKindFromString("").has_value());
    EXPECT_STREQ(toString(TransportKind::Http), "http");
}

//////////////////////////////////////////// EnvVars helpers ////////////////////////////////////////////

TEST(EnvVars, GetEnvOrDefault) {
    ::setenv("MCPHOST_TEST_PRESENT", "value", 1);
    ::unsetenv("MCPHOST_TEST_ABSENT");
    EXPECT_EQ(GetEnvOrDefault("MCPHOST_TEST_PRESENT", "d"), "value");
    EXPECT_EQ(GetEnvOrDefault("MCPHOST_TEST_ABSENT", "d"), "d");
    EXPECT_EQ(GetEnvOrDefault(nullptr, "d"), "d");
    EXPECT_EQ(GetEnvOrDefault("", "d"), "d");
    ::unsetenv("MCPHOST_TEST_PRESENT");
}

TEST(EnvVars, ParseEnvInt) {
    EXPECT_EQ(ParseEnvInt("42").value(), 42);
    EXPECT_EQ(ParseEnvInt(" -7 ").value(), -7);
    EXPECT_FALSE(ParseEnvInt("").has_value());
    EXPECT_FALSE(ParseEnvInt("4 2").has_value());
    EXPECT_FALSE(ParseEnvInt("3.5").has_value());
    EXPECT_FALSE(ParseEnvInt("99999999999999999999").has_value());
}

TEST(EnvVars, ParseEnvBool) {
    EXPECT_EQ(ParseEnvBool("TRUE").value(), true);
    EXPECT_EQ(ParseEnvBool(" yes ").value(), true);
    EXPECT_EQ(ParseEnvBool("0").value(), false);
    EXPECT_EQ(ParseEnvBool("Off").value(), false);
    EXPECT_FALSE(ParseEnvBool("2").has_value());
}

TEST(EnvVars, SplitEnvList) {
    auto items = SplitEnvList("a, b ,,c ");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0], "a");
    EXPECT_EQ(items[1], "b");
    EXPECT_EQ(items[2], "c");
    EXPECT_TRUE(SplitEnvList("").empty());
}
