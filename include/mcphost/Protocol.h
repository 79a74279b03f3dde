//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, version negotiation and method enumerations
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphost {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capability metadata, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Preferred protocol version; returned when the client requests one we do not support.
constexpr const char* PROTOCOL_VERSION = "2025-11-25";

// Versions this server negotiates. Order is preference order.
constexpr std::array<const char*, 2> SUPPORTED_PROTOCOL_VERSIONS = {"2025-11-25", "2025-03-26"};

bool isSupportedProtocolVersion(std::string_view version);

// Echo a supported requested version, otherwise fall back to PROTOCOL_VERSION.
std::string negotiateProtocolVersion(const std::optional<std::string>& requested);

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Behavior hints advertised with a tool.
struct ToolAnnotations {
    bool readOnly = false;
    bool destructive = false;
    bool idempotent = false;
    bool openWorld = false;
};

// Tool metadata as listed to clients
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters
    std::optional<JSONValue> outputSchema;
    ToolAnnotations annotations;
    std::optional<std::string> category;
    std::vector<std::string> tags;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
// Resource structures
struct Resource {
    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType = "text/plain";

    Resource() = default;
    Resource(std::string uri, std::string name, std::string description = {},
             std::string mimeType = "text/plain")
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
// Prompt structures
struct Prompt {
    std::string name;
    std::string description;
    std::optional<JSONValue> arguments;  // argument descriptors [{name, description?, required?}]

    Prompt() = default;
    Prompt(std::string name, std::string description,
           std::optional<JSONValue> arguments = std::nullopt)
        : name(std::move(name)), description(std::move(description)),
          arguments(std::move(arguments)) {}
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
// MCP method names
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* SearchTools = "tools/search";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
    constexpr const char* SetLogLevel = "logging/setLevel";
    constexpr const char* GetTask = "tasks/get";
    constexpr const char* ListTasks = "tasks/list";
    constexpr const char* CancelTask = "tasks/cancel";
    constexpr const char* TaskResult = "tasks/result";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* PromptListChanged = "notifications/prompts/list_changed";
}

///////////////////////////////////////// Dispatch enums ///////////////////////////////////////////
// Closed set of request methods the server answers.
enum class Method {
    Initialize,
    Ping,
    ToolsList,
    ToolsCall,
    ToolsSearch,
    ResourcesList,
    ResourcesRead,
    PromptsList,
    PromptsGet,
    LoggingSetLevel,
    TasksGet,
    TasksList,
    TasksCancel,
    TasksResult
};

// Closed set of client notifications the server reacts to.
enum class Notification {
    Initialized,
    Cancelled
};

std::optional<Method> methodFromString(std::string_view name);
const char* methodName(Method m);
std::optional<Notification> notificationFromString(std::string_view name);

} // namespace mcphost
