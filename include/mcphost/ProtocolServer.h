//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolServer.h
// Purpose: Transport-independent MCP dispatcher: handshake, capability registries, tasks and cancellation
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcphost/CapabilityRegistry.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/TaskManager.h"

namespace mcphost {

//==========================================================================================================
// ConnectionContext
// Purpose: Identifies the logical connection a message arrived on.
// Fields:
//   connectionId: HTTP session id; empty for the single stdio connection.
//==========================================================================================================
struct ConnectionContext {
    std::string connectionId;
};

//==========================================================================================================
// ProtocolServer
// Purpose: Owns the tool/resource/prompt registries and the task manager and answers JSON-RPC messages.
// Lifecycle:
//   Register phase: host registers capabilities or queues loaders.
//   Serve phase: BeginServing() runs loaders once, then list_changed notifications are emitted on changes.
//   Loaders queued during the serve phase run before the next message is handled.
// Handshake:
//   Per connection, only initialize and ping are accepted until initialize succeeds.
// Thread safety:
//   All public methods may be called concurrently from transport threads.
//==========================================================================================================
class ProtocolServer {
public:
    // Delivers server-initiated notifications (progress, list_changed) to a connection.
    using NotificationSink = std::function<void(const std::string& connectionId, const JSONRPCNotification& notification)>;

    struct Options {
        Implementation serverInfo;
        std::optional<std::string> instructions;
        TaskManager::Options tasks;
    };

    explicit ProtocolServer(const std::string& name);
    explicit ProtocolServer(Options options);
    ~ProtocolServer();

    ProtocolServer(const ProtocolServer&) = delete;
    ProtocolServer& operator=(const ProtocolServer&) = delete;

    ///////////////////////////////////////// Registration ///////////////////////////////////////////
    ToolRegistry& Tools();
    ResourceRegistry& Resources();
    PromptRegistry& Prompts();
    TaskManager& Tasks();

    void RegisterTool(const Tool& tool, ToolHandler handler);
    void RegisterResource(const Resource& resource, ResourceHandler handler);
    void RegisterPrompt(const Prompt& prompt, PromptHandler handler);

    // Run pending loaders once and enter the serve phase. Later calls only run newly queued loaders.
    void BeginServing();
    bool IsServing() const;

    void SetNotificationSink(NotificationSink sink);

    ///////////////////////////////////////// Dispatch ///////////////////////////////////////////
    //======================================================================================================
    // HandleMessage
    // Purpose: Validate and dispatch one inbound JSON-RPC message.
    // Args:
    //   text / message: Raw text or an already parsed message.
    //   ctx: Connection the message arrived on.
    // Returns:
    //   Response for requests (including error envelopes for malformed input); nullptr for notifications
    //   and client responses.
    //======================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleMessage(const std::string& text, const ConnectionContext& ctx);
    std::unique_ptr<JSONRPCResponse> HandleMessage(const JSONValue& message, const ConnectionContext& ctx);

    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request, const ConnectionContext& ctx);
    void HandleNotification(const JSONRPCNotification& notification, const ConnectionContext& ctx);

    ///////////////////////////////////////// Connections ///////////////////////////////////////////
    bool IsInitialized(const std::string& connectionId) const;
    std::optional<std::string> NegotiatedVersion(const std::string& connectionId) const;
    std::optional<Implementation> ClientInfo(const std::string& connectionId) const;

    // Forget handshake state for a connection (session deleted or expired).
    void EndConnection(const std::string& connectionId);

    const Implementation& ServerInfo() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
