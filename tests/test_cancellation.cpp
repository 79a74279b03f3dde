//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_cancellation.cpp
// Purpose: Tests for server-side cancellation propagation via notifications/cancelled
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "mcphost/ProtocolServer.h"
#include "support/ServerHarness.h"

using namespace mcphost;
using namespace mcphost::test;
using namespace std::chrono_literals;

namespace {

// Registers "wait", a cooperative tool that blocks until its stop token fires (or 5s pass).
void registerWaitTool(ProtocolServer& server, std::promise<void>& started, std::atomic<bool>& stopObserved) {
    Tool wait("wait", "Blocks until cancelled");
    server.RegisterTool(wait, makeSyncToolHandler([&started, &stopObserved](const JSONValue&, const ToolCallContext& ctx) {
        started.set_value();
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!ctx.stopToken.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        stopObserved = ctx.stopToken.stop_requested();
        return JSONValue("finished");
    }));
}

} // namespace

TEST(Cancellation, CooperativeToolStopsEarly) {
    ProtocolServer server("TestServer");
    std::promise<void> started;
    auto startedFut = started.get_future();
    std::atomic<bool> stopObserved{false};
    registerWaitTool(server, started, stopObserved);
    initialize(server);

    auto call = std::async(std::launch::async, [&]() {
        return rpc(server, R"({"jsonrpc":"2.0","id":"cancel-1","method":"tools/call","params":{"name":"wait"}})");
    });
    ASSERT_EQ(startedFut.wait_for(2s), std::future_status::ready);

    auto none = rpc(server,
                    R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":"cancel-1","reason":"user abort"}})");
    EXPECT_TRUE(none.isNull());

    ASSERT_EQ(call.wait_for(2s), std::future_status::ready);
    auto resp = call.get();
    EXPECT_TRUE(stopObserved.load());
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(resp), "Request cancelled");
    EXPECT_EQ(std::get<std::string>(member(resp, "id").value), "cancel-1");
}

TEST(Cancellation, CancelIsScopedToTheSendingConnection) {
    ProtocolServer server("TestServer");
    std::promise<void> started;
    auto startedFut = started.get_future();
    std::atomic<bool> stopObserved{false};
    registerWaitTool(server, started, stopObserved);
    initialize(server, "a");
    initialize(server, "b");

    auto call = std::async(std::launch::async, [&]() {
        return rpc(server, R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"wait"}})", "a");
    });
    ASSERT_EQ(startedFut.wait_for(2s), std::future_status::ready);

    // Same request id from another connection does not touch it
    rpc(server, R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":7}})", "b");
    EXPECT_EQ(call.wait_for(100ms), std::future_status::timeout);

    rpc(server, R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":7}})", "a");
    ASSERT_EQ(call.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(errorMessage(call.get()), "Request cancelled");
}

TEST(Cancellation, EndingConnectionStopsItsRequests) {
    ProtocolServer server("TestServer");
    std::promise<void> started;
    auto startedFut = started.get_future();
    std::atomic<bool> stopObserved{false};
    registerWaitTool(server, started, stopObserved);
    initialize(server, "gone");

    auto call = std::async(std::launch::async, [&]() {
        return rpc(server, R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"wait"}})", "gone");
    });
    ASSERT_EQ(startedFut.wait_for(2s), std::future_status::ready);
    server.EndConnection("gone");
    ASSERT_EQ(call.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(stopObserved.load());
}

TEST(Cancellation, UnknownOrMalformedCancelIsIgnored) {
    ProtocolServer server("TestServer");
    initialize(server);
    EXPECT_TRUE(rpc(server, R"({"jsonrpc":"2.0","method":"notifications/cancelled"})").isNull());
    EXPECT_TRUE(rpc(server, R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":"nope"}})").isNull());
    EXPECT_TRUE(rpc(server, R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":[1]}})").isNull());
    EXPECT_TRUE(member(rpc(server, R"({"jsonrpc":"2.0","id":1,"method":"ping"})"), "result").isObject());
}

TEST(Cancellation, CancelledNotificationNamingATaskCancelsIt) {
    ProtocolServer server("TestServer");
    std::promise<void> started;
    auto startedFut = started.get_future();
    std::atomic<bool> stopObserved{false};
    registerWaitTool(server, started, stopObserved);
    initialize(server);

    auto resp = rpc(server, R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"wait","task":{}}})");
    const std::string taskId = getString(member(member(resp, "result"), "task"), "taskId").value();
    ASSERT_EQ(startedFut.wait_for(2s), std::future_status::ready);

    rpc(server, R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":")" + taskId + "\"}}");
    auto rec = server.Tasks().Get(taskId);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->state, TaskState::Cancelled);
    for (int i = 0; i < 200 && !stopObserved; ++i) std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(stopObserved.load());
}
