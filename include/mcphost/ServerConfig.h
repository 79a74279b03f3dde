//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Process configuration for the server executable, read from MCPHOST_* environment variables
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/HttpStreamTransport.hpp"
#include "mcphost/ProtocolServer.h"

namespace mcphost {

enum class TransportKind {
    Stdio,
    Http
};

std::optional<TransportKind> transportKindFromString(const std::string& s);
const char* toString(TransportKind kind);

//==========================================================================================================
// ServerConfig
// Purpose: Everything the executable needs to assemble a ProtocolServer and one transport.
// Notes:
//   Malformed numeric or boolean values keep the default and log a warning.
//==========================================================================================================
struct ServerConfig {
    std::string name{"mcphost"};
    std::string version;                      // empty: library version
    std::optional<std::string> instructions;
    TransportKind transport{TransportKind::Stdio};
    std::string listen{"http://127.0.0.1:8080/mcp"};
    std::string tlsCert;
    std::string tlsKey;
    std::vector<std::string> allowedOrigins;
    std::string apiKey;                       // non-empty enables bearer authentication over HTTP
    std::chrono::seconds sessionTtl{3600};
    bool allowClientTermination{true};
    std::chrono::seconds eventHistory{300};
    std::size_t eventHistoryMax{1000};
    std::chrono::seconds keepAlive{30};
    std::size_t taskCapacity{1000};
    std::chrono::seconds taskRetention{3600};
    std::string logLevel{"INFO"};
    std::string logFile;

    static ServerConfig FromEnvironment();

    //==========================================================================================================
    // ApplyArguments
    // Purpose: Apply the only supported command-line override, --transport=stdio|http.
    // Returns:
    //   false with error set when an argument is not recognized.
    //==========================================================================================================
    bool ApplyArguments(int argc, const char* const* argv, std::string& error);

    ProtocolServer::Options ToServerOptions() const;
    HttpStreamTransport::Options ToHttpOptions() const;
};

} // namespace mcphost
