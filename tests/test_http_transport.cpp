//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_transport.cpp
// Purpose: Streamable HTTP transport: sessions, header validation, SSE streams and replay
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "mcphost/HttpStreamTransport.hpp"
#include "mcphost/ProtocolServer.h"
#include "support/HttpClient.h"

using namespace mcphost;
using namespace mcphost::test;
using namespace std::chrono_literals;

namespace {

const std::string kInit =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-11-25","capabilities":{},"clientInfo":{"name":"http-test","version":"1"}}})";
const std::string kInitialized = R"({"jsonrpc":"2.0","method":"notifications/initialized"})";
const std::string kPing = R"({"jsonrpc":"2.0","id":2,"method":"ping"})";

JSONRPCNotification note(const std::string& method, int64_t n) {
    JSONValue::Object params;
    params["n"] = std::make_shared<JSONValue>(n);
    return JSONRPCNotification(method, JSONValue(std::move(params)));
}

//==========================================================================================================
// HttpTransportTest
// Purpose: Starts a transport on an ephemeral loopback port with a short keep-alive interval.
//==========================================================================================================
class HttpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        server.RegisterTool(Tool("echo", "Echo text"), makeSyncToolHandler([](const JSONValue& args) {
            return JSONValue(getString(args, "text").value_or(""));
        }));
        server.RegisterTool(Tool("raw-throw", "Throws a non-standard exception"),
                            makeSyncToolHandler([](const JSONValue&) -> JSONValue { throw 42; }));
        server.RegisterTool(Tool("progress", "Reports progress"),
                            makeSyncToolHandler([](const JSONValue&, const ToolCallContext& ctx) {
            ctx.ReportProgress(1, 2);
            return JSONValue("done");
        }));
        transport = std::make_unique<HttpStreamTransport>(server, makeOptions());
        transport->Start().get();
        port = transport->BoundPort();
        ASSERT_NE(port, 0);
    }

    void TearDown() override {
        if (transport) transport->Stop().get();
    }

    virtual HttpStreamTransport::Options makeOptions() {
        HttpStreamTransport::Options opts;
        opts.address = "127.0.0.1";
        opts.port = "0";
        opts.keepAliveInterval = 100ms;
        return opts;
    }

    // Initialize a session and return its id.
    std::string openSession() {
        auto res = httpPost(port, kInit);
        EXPECT_EQ(res.result_int(), 200);
        std::string sid = headerValue(res, "Mcp-Session-Id");
        httpPost(port, kInitialized, {{"Mcp-Session-Id", sid}});
        return sid;
    }

    ProtocolServer server{"http-server"};
    std::unique_ptr<HttpStreamTransport> transport;
    unsigned short port{0};
};

class NoTerminationTest : public HttpTransportTest {
protected:
    HttpStreamTransport::Options makeOptions() override {
        auto opts = HttpTransportTest::makeOptions();
        opts.allowClientTermination = false;
        return opts;
    }
};

class SmallBodyTest : public HttpTransportTest {
protected:
    HttpStreamTransport::Options makeOptions() override {
        auto opts = HttpTransportTest::makeOptions();
        opts.maxBodyBytes = 64;
        return opts;
    }
};

class ShortTtlTest : public HttpTransportTest {
protected:
    HttpStreamTransport::Options makeOptions() override {
        auto opts = HttpTransportTest::makeOptions();
        opts.sessionTtl = 100ms;
        return opts;
    }
};

} // namespace

//////////////////////////////////////////// POST ////////////////////////////////////////////

TEST_F(HttpTransportTest, InitializeMintsSession) {
    auto res = httpPost(port, kInit);
    ASSERT_EQ(res.result_int(), 200);
    const std::string sid = headerValue(res, "Mcp-Session-Id");
    EXPECT_FALSE(sid.empty());
    EXPECT_EQ(headerValue(res, "MCP-Protocol-Version"), "2025-11-25");
    EXPECT_TRUE(transport->HasSession(sid));
    EXPECT_EQ(transport->SessionCount(), 1u);

    auto body = parseJSON(res.body());
    EXPECT_EQ(getString(*body.find("result"), "protocolVersion").value(), "2025-11-25");

    // A second initialize mints a different session
    auto again = httpPost(port, kInit);
    EXPECT_NE(headerValue(again, "Mcp-Session-Id"), sid);
    EXPECT_EQ(transport->SessionCount(), 2u);
}

TEST_F(HttpTransportTest, RequestsFlowThroughTheSession) {
    const std::string sid = openSession();
    auto res = httpPost(port,
                        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})",
                        {{"Mcp-Session-Id", sid}});
    ASSERT_EQ(res.result_int(), 200);
    EXPECT_EQ(headerValue(res, "Mcp-Session-Id"), sid);
    auto body = parseJSON(res.body());
    const auto& content = std::get<JSONValue::Array>(body.find("result")->find("content")->value);
    EXPECT_EQ(getString(*content[0], "text").value(), "hi");
}

TEST_F(HttpTransportTest, RepeatedRequestsReuseTheWorkerPool) {
    const std::string sid = openSession();
    for (int i = 0; i < 25; ++i) {
        auto res = httpPost(port,
                            R"({"jsonrpc":"2.0","id":)" + std::to_string(100 + i) +
                                R"(,"method":"tools/call","params":{"name":"echo","arguments":{"text":"n)" +
                                std::to_string(i) + R"("}}})",
                            {{"Mcp-Session-Id", sid}});
        ASSERT_EQ(res.result_int(), 200);
        auto body = parseJSON(res.body());
        EXPECT_EQ(getInt(body, "id").value(), 100 + i);
        const auto& content = std::get<JSONValue::Array>(body.find("result")->find("content")->value);
        EXPECT_EQ(getString(*content[0], "text").value(), "n" + std::to_string(i));
    }
    EXPECT_TRUE(transport->HasSession(sid));
}

TEST_F(HttpTransportTest, NonStandardToolExceptionIsErrorResult) {
    const std::string sid = openSession();
    auto res = httpPost(port, R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"raw-throw"}})",
                        {{"Mcp-Session-Id", sid}});
    ASSERT_EQ(res.result_int(), 200);
    auto body = parseJSON(res.body());
    EXPECT_EQ(getBool(*body.find("result"), "isError").value(), true);
    const auto& content = std::get<JSONValue::Array>(body.find("result")->find("content")->value);
    EXPECT_EQ(getString(*content[0], "text").value(), "Error: Unknown error");

    EXPECT_EQ(httpPost(port, kPing, {{"Mcp-Session-Id", sid}}).result_int(), 200);
}

TEST_F(HttpTransportTest, NotificationIsAccepted) {
    auto init = httpPost(port, kInit);
    const std::string sid = headerValue(init, "Mcp-Session-Id");
    auto res = httpPost(port, kInitialized, {{"Mcp-Session-Id", sid}});
    EXPECT_EQ(res.result_int(), 202);
    EXPECT_TRUE(res.body().empty());
}

TEST_F(HttpTransportTest, MissingSessionIsBadRequest) {
    auto res = httpPost(port, kPing);
    EXPECT_EQ(res.result_int(), 400);
}

TEST_F(HttpTransportTest, UnknownSessionIsNotFound) {
    auto res = httpPost(port, kPing, {{"Mcp-Session-Id", "no-such-session"}});
    EXPECT_EQ(res.result_int(), 404);
}

TEST_F(HttpTransportTest, DisallowedOriginIsForbidden) {
    auto res = httpPost(port, kInit, {{"Origin", "https://evil.example.com"}});
    EXPECT_EQ(res.result_int(), 403);
    EXPECT_EQ(transport->SessionCount(), 0u);
}

TEST_F(HttpTransportTest, LocalhostOriginIsAllowedAndEchoed) {
    auto res = httpPost(port, kInit, {{"Origin", "http://localhost:3000"}});
    ASSERT_EQ(res.result_int(), 200);
    EXPECT_EQ(headerValue(res, "Access-Control-Allow-Origin"), "http://localhost:3000");
}

TEST_F(HttpTransportTest, UnsupportedProtocolVersionHeaderIsBadRequest) {
    const std::string sid = openSession();
    auto res = httpPost(port, kPing, {{"Mcp-Session-Id", sid}, {"MCP-Protocol-Version", "1999-01-01"}});
    EXPECT_EQ(res.result_int(), 400);
    auto ok = httpPost(port, kPing, {{"Mcp-Session-Id", sid}, {"MCP-Protocol-Version", "2025-03-26"}});
    EXPECT_EQ(ok.result_int(), 200);
}

TEST_F(HttpTransportTest, WrongContentTypeIsUnsupportedMediaType) {
    auto res = httpPost(port, kInit, {{"Content-Type", "text/plain"}});
    EXPECT_EQ(res.result_int(), 415);
}

TEST_F(HttpTransportTest, UnparseableBodyIsParseError) {
    auto res = httpPost(port, "{not json");
    ASSERT_EQ(res.result_int(), 400);
    auto body = parseJSON(res.body());
    EXPECT_EQ(getInt(*body.find("error"), "code").value(), JSONRPCErrorCodes::ParseError);
}

TEST_F(HttpTransportTest, EventStreamAcceptGetsSseReply) {
    const std::string sid = openSession();
    auto res = httpPost(port, kPing, {{"Mcp-Session-Id", sid}, {"Accept", "application/json, text/event-stream"}});
    ASSERT_EQ(res.result_int(), 200);
    EXPECT_EQ(headerValue(res, "Content-Type"), "text/event-stream");
    const std::string& body = res.body();
    ASSERT_EQ(body.rfind("event: message\ndata: ", 0), 0u);
    const std::string data = body.substr(std::string("event: message\ndata: ").size());
    auto msg = parseJSON(data.substr(0, data.find('\n')));
    EXPECT_EQ(getInt(msg, "id").value(), 2);
}

TEST_F(HttpTransportTest, RejectionsStillCarryProtocolVersion) {
    auto res = httpPost(port, kPing);
    EXPECT_EQ(res.result_int(), 400);
    EXPECT_EQ(headerValue(res, "MCP-Protocol-Version"), "2025-11-25");
}

TEST_F(SmallBodyTest, OversizedBodyIsRejected) {
    auto res = httpPost(port, kInit);
    EXPECT_EQ(res.result_int(), 413);
}

//////////////////////////////////////////// DELETE ////////////////////////////////////////////

TEST_F(HttpTransportTest, DeleteEndsSession) {
    const std::string sid = openSession();
    auto res = httpRequest(port, http::verb::delete_, "/mcp", "", {{"Mcp-Session-Id", sid}});
    EXPECT_EQ(res.result_int(), 204);
    EXPECT_FALSE(transport->HasSession(sid));
    EXPECT_FALSE(server.IsInitialized(sid));

    EXPECT_EQ(httpPost(port, kPing, {{"Mcp-Session-Id", sid}}).result_int(), 404);
    EXPECT_EQ(httpRequest(port, http::verb::delete_, "/mcp", "", {{"Mcp-Session-Id", sid}}).result_int(), 404);
    EXPECT_EQ(httpRequest(port, http::verb::delete_, "/mcp").result_int(), 400);
}

TEST_F(HttpTransportTest, DeleteDropsReplayHistory) {
    const std::string sid = openSession();
    ASSERT_TRUE(transport->Publish(sid, note("notifications/message", 1)));
    ASSERT_TRUE(transport->Publish(sid, note("notifications/message", 2)));
    ASSERT_EQ(httpRequest(port, http::verb::delete_, "/mcp", "", {{"Mcp-Session-Id", sid}}).result_int(), 204);

    auto replay = httpRequest(port, http::verb::get, "/mcp", "",
                              {{"Accept", "text/event-stream"}, {"Mcp-Session-Id", sid}, {"Last-Event-ID", "1"}});
    EXPECT_EQ(replay.result_int(), 404);
    EXPECT_FALSE(transport->Publish(sid, note("notifications/message", 3)));
}

TEST_F(NoTerminationTest, DeleteIsNotAllowed) {
    const std::string sid = openSession();
    auto res = httpRequest(port, http::verb::delete_, "/mcp", "", {{"Mcp-Session-Id", sid}});
    EXPECT_EQ(res.result_int(), 405);
    EXPECT_TRUE(transport->HasSession(sid));
}

//////////////////////////////////////////// Other routes ////////////////////////////////////////////

TEST_F(HttpTransportTest, PreflightListsAllowedMethods) {
    auto res = httpRequest(port, http::verb::options, "/mcp", "", {{"Origin", "http://127.0.0.1:5173"}});
    EXPECT_EQ(res.result_int(), 204);
    EXPECT_NE(headerValue(res, "Access-Control-Allow-Methods").find("DELETE"), std::string::npos);
    EXPECT_NE(headerValue(res, "Access-Control-Allow-Headers").find("Mcp-Session-Id"), std::string::npos);
}

TEST_F(HttpTransportTest, HealthAndIdentity) {
    openSession();
    auto health = httpRequest(port, http::verb::get, "/health");
    ASSERT_EQ(health.result_int(), 200);
    auto status = parseJSON(health.body());
    EXPECT_EQ(getString(status, "status").value(), "healthy");
    EXPECT_EQ(getString(status, "server").value(), "http-server");
    EXPECT_EQ(getString(status, "protocol_version").value(), "2025-11-25");
    EXPECT_EQ(getInt(status, "active_sessions").value(), 1);

    auto identity = httpRequest(port, http::verb::get, "/");
    ASSERT_EQ(identity.result_int(), 200);
    EXPECT_EQ(headerValue(identity, "MCP-Protocol-Version"), "2025-11-25");
    auto body = parseJSON(identity.body());
    EXPECT_EQ(getString(body, "mcp_endpoint").value(), "/mcp");
    EXPECT_NE(getString(body, "message").value().find("http-server"), std::string::npos);
}

TEST_F(HttpTransportTest, UnknownPathAndMethod) {
    EXPECT_EQ(httpRequest(port, http::verb::get, "/nowhere").result_int(), 404);
    auto put = httpRequest(port, http::verb::put, "/mcp", kPing);
    EXPECT_EQ(put.result_int(), 405);
    EXPECT_FALSE(headerValue(put, "Allow").empty());
}

//////////////////////////////////////////// GET streams ////////////////////////////////////////////

TEST_F(HttpTransportTest, StreamRequiresSessionAndEventStreamAccept) {
    EXPECT_EQ(httpRequest(port, http::verb::get, "/mcp", "", {{"Accept", "text/event-stream"}}).result_int(), 400);
    EXPECT_EQ(httpRequest(port, http::verb::get, "/mcp", "",
                          {{"Accept", "text/event-stream"}, {"Mcp-Session-Id", "missing"}}).result_int(), 404);
    const std::string sid = openSession();
    EXPECT_EQ(httpRequest(port, http::verb::get, "/mcp", "",
                          {{"Accept", "application/json"}, {"Mcp-Session-Id", sid}}).result_int(), 406);
}

TEST_F(HttpTransportTest, StreamDeliversPublishedNotifications) {
    const std::string sid = openSession();
    SseStream stream(port, "/mcp", {{"Accept", "text/event-stream"}, {"Mcp-Session-Id", sid}});
    EXPECT_NE(stream.Head().find("200"), std::string::npos);
    EXPECT_NE(stream.Head().find("text/event-stream"), std::string::npos);

    ASSERT_TRUE(transport->Publish(sid, note("notifications/message", 7)));
    auto frame = stream.NextEvent();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->rfind("id: 1\nevent: message\ndata: ", 0), 0u);
    auto msg = parseJSON(frame->substr(frame->find("data: ") + 6));
    EXPECT_EQ(getString(msg, "method").value(), "notifications/message");
    EXPECT_EQ(getInt(*msg.find("params"), "n").value(), 7);

    EXPECT_FALSE(transport->Publish("unknown", note("notifications/message", 1)));
}

TEST_F(HttpTransportTest, StreamReplaysAfterLastEventId) {
    const std::string sid = openSession();
    for (int64_t i = 1; i <= 3; ++i) {
        ASSERT_TRUE(transport->Publish(sid, note("notifications/message", i)));
    }
    SseStream stream(port, "/mcp", {{"Accept", "text/event-stream"}, {"Mcp-Session-Id", sid}, {"Last-Event-ID", "1"}});
    auto second = stream.NextEvent();
    auto third = stream.NextEvent();
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(second->rfind("id: 2\n", 0), 0u);
    EXPECT_EQ(third->rfind("id: 3\n", 0), 0u);
}

TEST_F(HttpTransportTest, StreamWithoutLastEventIdStartsLive) {
    const std::string sid = openSession();
    ASSERT_TRUE(transport->Publish(sid, note("notifications/message", 1)));
    SseStream stream(port, "/mcp", {{"Accept", "text/event-stream"}, {"Mcp-Session-Id", sid}});
    ASSERT_TRUE(transport->Publish(sid, note("notifications/message", 2)));
    auto frame = stream.NextEvent();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->rfind("id: 2\n", 0), 0u);
}

TEST_F(HttpTransportTest, IdleStreamSendsKeepAlive) {
    const std::string sid = openSession();
    SseStream stream(port, "/mcp", {{"Accept", "text/event-stream"}, {"Mcp-Session-Id", sid}});
    EXPECT_EQ(stream.NextFrame(), ":keepalive");
}

TEST_F(HttpTransportTest, ProgressFromToolCallReachesTheStream) {
    const std::string sid = openSession();
    SseStream stream(port, "/mcp", {{"Accept", "text/event-stream"}, {"Mcp-Session-Id", sid}});
    auto res = httpPost(port,
                        R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"progress","_meta":{"progressToken":"p1"}}})",
                        {{"Mcp-Session-Id", sid}});
    ASSERT_EQ(res.result_int(), 200);
    auto frame = stream.NextEvent();
    ASSERT_TRUE(frame.has_value());
    auto msg = parseJSON(frame->substr(frame->find("data: ") + 6));
    EXPECT_EQ(getString(msg, "method").value(), "notifications/progress");
    EXPECT_EQ(getString(*msg.find("params"), "progressToken").value(), "p1");
}

//////////////////////////////////////////// Sessions ////////////////////////////////////////////

TEST_F(ShortTtlTest, IdleSessionsAreSwept) {
    const std::string sid = openSession();
    ASSERT_TRUE(transport->HasSession(sid));
    std::this_thread::sleep_for(200ms);
    transport->SweepExpiredSessions();
    EXPECT_FALSE(transport->HasSession(sid));
    EXPECT_EQ(transport->SessionCount(), 0u);
    EXPECT_FALSE(server.IsInitialized(sid));
}

//////////////////////////////////////////// Origin policy ////////////////////////////////////////////

TEST(HttpOriginPolicy, LoopbackBindAllowsLocalOriginsOnly) {
    ProtocolServer server("origin-server");
    HttpStreamTransport::Options opts;
    opts.address = "127.0.0.1";
    HttpStreamTransport transport(server, opts);
    EXPECT_TRUE(transport.IsOriginAllowed("http://localhost"));
    EXPECT_TRUE(transport.IsOriginAllowed("http://127.0.0.1:8080"));
    EXPECT_TRUE(transport.IsOriginAllowed("http://[::1]:9000"));
    EXPECT_FALSE(transport.IsOriginAllowed("https://example.com"));
    EXPECT_FALSE(transport.IsOriginAllowed("http://localhost.example.com"));
}

TEST(HttpOriginPolicy, ExternalBindWithoutListAllowsNone) {
    ProtocolServer server("origin-server");
    HttpStreamTransport::Options opts;
    opts.address = "0.0.0.0";
    HttpStreamTransport transport(server, opts);
    EXPECT_FALSE(transport.IsOriginAllowed("http://localhost"));
}

TEST(HttpOriginPolicy, ExplicitListAndWildcard) {
    ProtocolServer server("origin-server");
    HttpStreamTransport::Options listed;
    listed.address = "0.0.0.0";
    listed.allowedOrigins = {"https://app.example.com"};
    HttpStreamTransport a(server, listed);
    EXPECT_TRUE(a.IsOriginAllowed("https://APP.example.com"));
    EXPECT_TRUE(a.IsOriginAllowed("https://app.example.com:8443"));
    EXPECT_FALSE(a.IsOriginAllowed("https://app.example.com.evil.org"));
    EXPECT_FALSE(a.IsOriginAllowed("https://other.example.com"));

    HttpStreamTransport::Options any;
    any.allowedOrigins = {"*"};
    HttpStreamTransport b(server, any);
    EXPECT_TRUE(b.IsOriginAllowed("https://anything.example.org"));
}

TEST(HttpOptions, FromUriParsesEndpointPortAndTlsFiles) {
    auto plain = HttpStreamTransport::Options::FromUri("http://0.0.0.0:9443/rpc/");
    EXPECT_EQ(plain.scheme, "http");
    EXPECT_EQ(plain.address, "0.0.0.0");
    EXPECT_EQ(plain.port, "9443");
    EXPECT_EQ(plain.endpoint, "/rpc");

    auto tls = HttpStreamTransport::Options::FromUri("https://[::1]:8443?cert=server.pem&key=server.key&x=y");
    EXPECT_EQ(tls.scheme, "https");
    EXPECT_EQ(tls.address, "::1");
    EXPECT_EQ(tls.port, "8443");
    EXPECT_EQ(tls.endpoint, "/mcp");
    EXPECT_EQ(tls.certFile, "server.pem");
    EXPECT_EQ(tls.keyFile, "server.key");

    auto bare = HttpStreamTransport::Options::FromUri("http://localhost");
    EXPECT_EQ(bare.address, "localhost");
    EXPECT_EQ(bare.port, "8080");
}

TEST(HttpOptions, InvalidPortFailsStart) {
    ProtocolServer server("port-server");
    HttpStreamTransport::Options opts;
    opts.port = "99999";
    HttpStreamTransport transport(server, opts);
    std::string reported;
    transport.SetErrorHandler([&](const std::string& e) { reported = e; });
    auto started = transport.Start();
    EXPECT_THROW(started.get(), std::invalid_argument);
    EXPECT_FALSE(reported.empty());
}
