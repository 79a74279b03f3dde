//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcphost server executable with demo tools, a resource and a prompt
//==========================================================================================================

#include <chrono>
#include <csignal>
#include <cstddef>
#include <iostream>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "mcphost/HttpStreamTransport.hpp"
#include "mcphost/ProtocolServer.h"
#include "mcphost/ServerConfig.h"
#include "mcphost/StdioTransport.hpp"

using namespace mcphost;

namespace {

JSONValue objectSchema(std::initializer_list<std::pair<const char*, const char*>> props,
                       std::initializer_list<const char*> requiredNames) {
    JSONValue::Object properties;
    for (const auto& [name, type] : props) {
        JSONValue::Object p;
        p["type"] = std::make_shared<JSONValue>(type);
        properties[name] = std::make_shared<JSONValue>(std::move(p));
    }
    JSONValue::Array required;
    for (const char* r : requiredNames) required.push_back(std::make_shared<JSONValue>(r));
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(std::move(properties));
    schema["required"] = std::make_shared<JSONValue>(std::move(required));
    return JSONValue(std::move(schema));
}

//==========================================================================================================
// registerDemoCapabilities
// Purpose: Eager echo tool plus a loader that adds the rest when serving begins.
//==========================================================================================================
void registerDemoCapabilities(ProtocolServer& server) {
    Tool echo;
    echo.name = "echo";
    echo.description = "Echo a message";
    echo.inputSchema = objectSchema({{"text", "string"}}, {"text"});
    echo.annotations.readOnly = true;
    echo.annotations.idempotent = true;
    echo.category = "demo";
    echo.tags = {"text"};
    server.RegisterTool(echo, makeSyncToolHandler([](const JSONValue& args) {
        auto text = getString(args, "text");
        if (!text.has_value()) {
            throw std::invalid_argument("missing 'text'");
        }
        return JSONValue(*text);
    }));

    server.Tools().AddLoader([](CapabilityRegistry<ToolDefinition>& tools) {
        Tool add;
        add.name = "add";
        add.description = "Add two numbers";
        add.inputSchema = objectSchema({{"a", "number"}, {"b", "number"}}, {"a", "b"});
        add.annotations.readOnly = true;
        add.annotations.idempotent = true;
        add.category = "math";
        add.tags = {"arithmetic"};
        tools.Register(ToolDefinition{add, makeSyncToolHandler([](const JSONValue& args) {
            auto ia = getInt(args, "a");
            auto ib = getInt(args, "b");
            if (ia.has_value() && ib.has_value()) {
                return JSONValue(*ia + *ib);
            }
            auto a = getNumber(args, "a");
            auto b = getNumber(args, "b");
            if (!a.has_value() || !b.has_value()) {
                throw std::invalid_argument("'a' and 'b' must be numbers");
            }
            return JSONValue(*a + *b);
        })});

        Tool countdown;
        countdown.name = "countdown";
        countdown.description = "Count down from n with one progress update per step";
        countdown.inputSchema = objectSchema({{"n", "integer"}, {"delayMs", "integer"}}, {"n"});
        countdown.annotations.readOnly = true;
        countdown.category = "demo";
        countdown.tags = {"progress", "long-running"};
        tools.Register(ToolDefinition{countdown, makeSyncToolHandler([](const JSONValue& args, const ToolCallContext& ctx) {
            const int64_t n = getInt(args, "n").value_or(3);
            const auto delay = std::chrono::milliseconds(getInt(args, "delayMs").value_or(100));
            for (int64_t i = 0; i < n; ++i) {
                if (ctx.stopToken.stop_requested()) {
                    throw std::runtime_error("countdown cancelled");
                }
                ctx.ReportProgress(static_cast<double>(i + 1), static_cast<double>(n));
                std::this_thread::sleep_for(delay);
            }
            return JSONValue("liftoff");
        })});
    });

    Resource info;
    info.uri = "mcphost://server/info";
    info.name = "server-info";
    info.description = "Server identity";
    info.mimeType = "application/json";
    const Implementation identity = server.ServerInfo();
    server.RegisterResource(info, [identity]() {
        JSONValue::Object o;
        o["name"] = std::make_shared<JSONValue>(identity.name);
        o["version"] = std::make_shared<JSONValue>(identity.version);
        return JSONValue(std::move(o));
    });

    Prompt summarize;
    summarize.name = "summarize";
    summarize.description = "Ask for a short summary of a text";
    {
        JSONValue::Object arg;
        arg["name"] = std::make_shared<JSONValue>("text");
        arg["required"] = std::make_shared<JSONValue>(true);
        JSONValue::Array args;
        args.push_back(std::make_shared<JSONValue>(std::move(arg)));
        summarize.arguments = JSONValue(std::move(args));
    }
    server.RegisterPrompt(summarize, [](const JSONValue& args) {
        return JSONValue("Summarize in one sentence:\n" + getString(args, "text").value_or(""));
    });
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ServerConfig config = ServerConfig::FromEnvironment();
    std::string argError;
    if (!config.ApplyArguments(argc, argv, argError)) {
        std::cerr << argError << "\nusage: mcphost_server [--transport=stdio|http]" << std::endl;
        return 2;
    }

    if (config.transport == TransportKind::Stdio) {
        Logger::setUseStderr(true);
    }
    Logger::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty()) {
        Logger::setLogFile(config.logFile);
    }

    ProtocolServer server(config.ToServerOptions());
    registerDemoCapabilities(server);
    LOG_INFO("{} {} starting with transport={}", server.ServerInfo().name, server.ServerInfo().version,
             toString(config.transport));

    if (config.transport == TransportKind::Stdio) {
        StdioTransport transport(server);
        transport.SetErrorHandler([](const std::string& err) { LOG_WARN("stdio: {}", err); });
        server.BeginServing();
        transport.Start().get();
        transport.Stop().get();
        return 0;
    }

    HttpStreamTransport::Options httpOptions = config.ToHttpOptions();
    if (httpOptions.scheme == "https" && (httpOptions.certFile.empty() || httpOptions.keyFile.empty())) {
        LOG_ERROR("https listen address requires MCPHOST_TLS_CERT and MCPHOST_TLS_KEY");
        return 2;
    }
    try {
        HttpStreamTransport transport(server, std::move(httpOptions));
        transport.SetErrorHandler([](const std::string& err) { LOG_WARN("http: {}", err); });
        transport.Start().get();

        boost::asio::io_context signalsIo;
        boost::asio::signal_set signals(signalsIo, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code&, int sig) {
            LOG_INFO("Received signal {}; shutting down", sig);
        });
        signalsIo.run();
        transport.Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTP transport failed: {}", e.what());
        return 1;
    }
    return 0;
}
