//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Version negotiation and method name <-> enum mapping
//==========================================================================================================

#include "mcphost/Protocol.h"

namespace mcphost {

bool isSupportedProtocolVersion(std::string_view version) {
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS) {
        if (version == v) return true;
    }
    return false;
}

std::string negotiateProtocolVersion(const std::optional<std::string>& requested) {
    if (requested.has_value() && isSupportedProtocolVersion(*requested)) {
        return *requested;
    }
    return PROTOCOL_VERSION;
}

namespace {
struct MethodEntry {
    Method method;
    const char* name;
};

constexpr MethodEntry kMethods[] = {
    {Method::Initialize, Methods::Initialize},
    {Method::Ping, Methods::Ping},
    {Method::ToolsList, Methods::ListTools},
    {Method::ToolsCall, Methods::CallTool},
    {Method::ToolsSearch, Methods::SearchTools},
    {Method::ResourcesList, Methods::ListResources},
    {Method::ResourcesRead, Methods::ReadResource},
    {Method::PromptsList, Methods::ListPrompts},
    {Method::PromptsGet, Methods::GetPrompt},
    {Method::LoggingSetLevel, Methods::SetLogLevel},
    {Method::TasksGet, Methods::GetTask},
    {Method::TasksList, Methods::ListTasks},
    {Method::TasksCancel, Methods::CancelTask},
    {Method::TasksResult, Methods::TaskResult},
};
} // namespace

std::optional<Method> methodFromString(std::string_view name) {
    for (const auto& e : kMethods) {
        if (name == e.name) return e.method;
    }
    return std::nullopt;
}

const char* methodName(Method m) {
    for (const auto& e : kMethods) {
        if (e.method == m) return e.name;
    }
    return "";
}

std::optional<Notification> notificationFromString(std::string_view name) {
    if (name == Methods::Initialized) return Notification::Initialized;
    if (name == Methods::Cancelled) return Notification::Cancelled;
    return std::nullopt;
}

} // namespace mcphost
