//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_server_logging.cpp
// Purpose: logging/setLevel maps MCP levels onto the process logger
//==========================================================================================================

#include <gtest/gtest.h>

#include "logging/Logger.h"
#include "mcphost/ProtocolServer.h"
#include "support/ServerHarness.h"

using namespace mcphost;
using namespace mcphost::test;

namespace {

class ServerLoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved = Logger::getLogLevel();
        initialize(server);
    }
    void TearDown() override { Logger::setLogLevel(saved); }

    JSONValue setLevel(const std::string& level) {
        return rpc(server, R"({"jsonrpc":"2.0","id":1,"method":"logging/setLevel","params":{"level":")" + level + "\"}}");
    }

    ProtocolServer server{"log-server"};
    LogLevel saved{LogLevel::LOG_INFO_LEVEL};
};

} // namespace

TEST_F(ServerLoggingTest, SetLevelReturnsEmptyResult) {
    auto resp = setLevel("debug");
    ASSERT_TRUE(member(resp, "result").isObject());
    EXPECT_EQ(Logger::getLogLevel(), LogLevel::LOG_DEBUG_LEVEL);
}

TEST_F(ServerLoggingTest, MapsSyslogSeverities) {
    setLevel("warning");
    EXPECT_EQ(Logger::getLogLevel(), LogLevel::LOG_WARN_LEVEL);
    setLevel("notice");
    EXPECT_EQ(Logger::getLogLevel(), LogLevel::LOG_INFO_LEVEL);
    setLevel("critical");
    EXPECT_EQ(Logger::getLogLevel(), LogLevel::LOG_ERROR_LEVEL);
    setLevel("EMERGENCY");
    EXPECT_EQ(Logger::getLogLevel(), LogLevel::LOG_ERROR_LEVEL);
}

TEST_F(ServerLoggingTest, UnknownLevelFallsBackToInfo) {
    setLevel("debug");
    setLevel("chatty");
    EXPECT_EQ(Logger::getLogLevel(), LogLevel::LOG_INFO_LEVEL);
}

TEST_F(ServerLoggingTest, RequiresInitializedConnection) {
    auto resp = rpc(server, R"({"jsonrpc":"2.0","id":1,"method":"logging/setLevel","params":{"level":"debug"}})", "other");
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::InvalidRequest);
}

TEST(LoggerLevels, LevelFromStringIsCaseInsensitive) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(Logger::levelFromString("fatal"), LogLevel::LOG_FATAL_LEVEL);
    EXPECT_EQ(Logger::levelFromString("???"), LogLevel::LOG_INFO_LEVEL);
}
