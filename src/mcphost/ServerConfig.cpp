//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Environment-driven server configuration
//==========================================================================================================

#include "mcphost/ServerConfig.h"

#include <cctype>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/auth/AuthGate.hpp"
#include "mcphost/version.h"

namespace mcphost {

namespace {

std::optional<int64_t> readNonNegative(const char* name) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) return std::nullopt;
    auto v = ParseEnvInt(raw);
    if (!v.has_value() || *v < 0) {
        LOG_WARN("Ignoring malformed {}='{}'", name, raw);
        return std::nullopt;
    }
    return v;
}

void readSeconds(const char* name, std::chrono::seconds& out) {
    if (auto v = readNonNegative(name)) out = std::chrono::seconds(*v);
}

void readCount(const char* name, std::size_t& out) {
    if (auto v = readNonNegative(name)) out = static_cast<std::size_t>(*v);
}

void readBool(const char* name, bool& out) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) return;
    auto v = ParseEnvBool(raw);
    if (!v.has_value()) {
        LOG_WARN("Ignoring malformed {}='{}'", name, raw);
        return;
    }
    out = *v;
}

} // namespace

std::optional<TransportKind> transportKindFromString(const std::string& s) {
    std::string lo;
    for (char c : s) lo.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lo == "stdio") return TransportKind::Stdio;
    if (lo == "http" || lo == "https") return TransportKind::Http;
    return std::nullopt;
}

const char* toString(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
    }
    return "stdio";
}

ServerConfig ServerConfig::FromEnvironment() {
    ServerConfig cfg;
    cfg.name = GetEnvOrDefault("MCPHOST_NAME", cfg.name);
    cfg.version = GetEnvOrDefault("MCPHOST_VERSION", cfg.version);
    if (auto instr = GetEnvOrDefault("MCPHOST_INSTRUCTIONS", ""); !instr.empty()) {
        cfg.instructions = instr;
    }
    if (auto t = GetEnvOrDefault("MCPHOST_TRANSPORT", ""); !t.empty()) {
        if (auto kind = transportKindFromString(t)) {
            cfg.transport = *kind;
        } else {
            LOG_WARN("Unknown MCPHOST_TRANSPORT '{}'; using {}", t, toString(cfg.transport));
        }
    }
    cfg.listen = GetEnvOrDefault("MCPHOST_LISTEN", cfg.listen);
    cfg.tlsCert = GetEnvOrDefault("MCPHOST_TLS_CERT", cfg.tlsCert);
    cfg.tlsKey = GetEnvOrDefault("MCPHOST_TLS_KEY", cfg.tlsKey);
    cfg.allowedOrigins = SplitEnvList(GetEnvOrDefault("MCPHOST_ALLOWED_ORIGINS", ""));
    cfg.apiKey = GetEnvOrDefault("MCPHOST_API_KEY", "");
    readSeconds("MCPHOST_SESSION_TTL_S", cfg.sessionTtl);
    readBool("MCPHOST_ALLOW_CLIENT_TERMINATION", cfg.allowClientTermination);
    readSeconds("MCPHOST_EVENT_HISTORY_S", cfg.eventHistory);
    readCount("MCPHOST_EVENT_HISTORY_MAX", cfg.eventHistoryMax);
    readSeconds("MCPHOST_KEEPALIVE_S", cfg.keepAlive);
    readCount("MCPHOST_TASK_CAPACITY", cfg.taskCapacity);
    readSeconds("MCPHOST_TASK_RETENTION_S", cfg.taskRetention);
    cfg.logLevel = GetEnvOrDefault("MCPHOST_LOG_LEVEL", cfg.logLevel);
    cfg.logFile = GetEnvOrDefault("MCPHOST_LOG_FILE", cfg.logFile);
    return cfg;
}

bool ServerConfig::ApplyArguments(int argc, const char* const* argv, std::string& error) {
    const std::string prefix = "--transport=";
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg.rfind(prefix, 0) == 0) {
            auto kind = transportKindFromString(arg.substr(prefix.size()));
            if (!kind.has_value()) {
                error = "Unknown transport: " + arg.substr(prefix.size());
                return false;
            }
            transport = *kind;
            continue;
        }
        error = "Unknown argument: " + arg;
        return false;
    }
    return true;
}

ProtocolServer::Options ServerConfig::ToServerOptions() const {
    ProtocolServer::Options o;
    o.serverInfo.name = name;
    o.serverInfo.version = version.empty() ? getVersionString() : version;
    o.instructions = instructions;
    o.tasks.capacity = taskCapacity;
    o.tasks.retention = taskRetention;
    return o;
}

HttpStreamTransport::Options ServerConfig::ToHttpOptions() const {
    auto o = HttpStreamTransport::Options::FromUri(listen);
    if (!tlsCert.empty()) o.certFile = tlsCert;
    if (!tlsKey.empty()) o.keyFile = tlsKey;
    o.allowedOrigins = allowedOrigins;
    o.sessionTtl = sessionTtl;
    o.allowClientTermination = allowClientTermination;
    o.eventHistoryDuration = eventHistory;
    o.eventHistoryMax = eventHistoryMax;
    o.keepAliveInterval = keepAlive;
    if (!apiKey.empty()) {
        o.authGate = std::make_shared<auth::AuthGate>(std::make_shared<auth::StaticTokenVerifier>(apiKey));
    }
    return o;
}

} // namespace mcphost
