//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpStreamTransport.hpp
// Purpose: Session-oriented streamable HTTP transport (JSON and SSE) using Boost.Beast coroutines
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Transport.h"
#include "mcphost/auth/AuthGate.hpp"

namespace mcphost {

class ProtocolServer;

//==========================================================================================================
// HttpStreamTransport
// Purpose: Serves many clients over one endpoint path.
//   POST    client message; JSON body or one-shot SSE frame depending on Accept; 202 for notifications
//   GET     long-lived SSE stream of server notifications with Last-Event-ID replay and keep-alives
//   DELETE  client-initiated session termination (when allowed)
//   OPTIONS CORS preflight
// Plus GET /health (liveness) and GET / (identity).
// Notes:
//   - Inbound requests on the endpoint are validated in order: Origin (403), MCP-Protocol-Version (400),
//     bearer credential (401/403 with WWW-Authenticate), Mcp-Session-Id (404 when unknown).
//   - A successful initialize always mints a new session returned in the Mcp-Session-Id header.
//   - Dispatch runs on a worker pool so a long tool call never stalls the I/O threads.
//==========================================================================================================
class HttpStreamTransport : public IServerTransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address/port: Bind address and port ("0" picks an ephemeral port; see BoundPort()).
    //   endpoint: MCP endpoint path.
    //   scheme: "http" or "https" (TLS 1.3 only for https).
    //   certFile/keyFile: PEM files required when scheme == https.
    //   allowedOrigins: Explicit Origin allow-list ("*" allows any; an entry also matches itself plus a port).
    //                   When empty, loopback binds allow
    //                   localhost origins only and external binds allow none.
    //   sessionTtl: Idle time after which a session is swept.
    //   allowClientTermination: Whether DELETE may end a session (405 otherwise).
    //   eventHistoryDuration/eventHistoryMax: Replay buffer bounds per session (time and count).
    //   keepAliveInterval: Idle time between SSE keep-alive comments.
    //   ioThreads/workerThreads: Sizes of the I/O and dispatch pools.
    //   maxBodyBytes: Largest accepted POST body (413 beyond).
    //   authGate: Optional bearer validation; null disables authentication.
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8080"};
        std::string endpoint{"/mcp"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::vector<std::string> allowedOrigins;
        std::chrono::milliseconds sessionTtl{std::chrono::hours(1)};
        bool allowClientTermination{true};
        std::chrono::milliseconds eventHistoryDuration{std::chrono::minutes(5)};
        std::size_t eventHistoryMax{1000};
        std::chrono::milliseconds keepAliveInterval{std::chrono::seconds(30)};
        std::size_t ioThreads{1};
        std::size_t workerThreads{4};
        std::size_t maxBodyBytes{4 * 1024 * 1024};
        std::shared_ptr<auth::AuthGate> authGate;

        //==========================================================================================================
        // FromUri
        // Purpose: Build options from "http[s]://<address>:<port>[/<endpoint>][?cert=<pem>&key=<pem>]".
        //          Missing parts keep their defaults; unknown query parameters are ignored.
        //==========================================================================================================
        static Options FromUri(const std::string& uri);
    };

    HttpStreamTransport(ProtocolServer& server, Options options);
    ~HttpStreamTransport() override;

    HttpStreamTransport(const HttpStreamTransport&) = delete;
    HttpStreamTransport& operator=(const HttpStreamTransport&) = delete;

    //==========================================================================================================
    // Binds the listener synchronously and starts the I/O threads.
    // Returns:
    //   Ready future; holds the bind/TLS setup exception when the listener could not be created.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes the listener and open streams, stops the I/O context and joins all threads.
    //==========================================================================================================
    std::future<void> Stop() override;

    void SetErrorHandler(ErrorHandler handler) override;

    // Port actually bound (useful with port "0"); 0 before Start().
    unsigned short BoundPort() const;

    ///////////////////////////////////////// Sessions ///////////////////////////////////////////
    std::size_t SessionCount() const;
    bool HasSession(const std::string& sessionId) const;

    // Remove sessions idle for longer than sessionTtl. Returns how many were removed.
    std::size_t SweepExpiredSessions();

    //==========================================================================================================
    // Publish
    // Purpose: Append a notification to a session's replay buffer and wake its open SSE streams.
    // Returns:
    //   false when the session does not exist.
    //==========================================================================================================
    bool Publish(const std::string& sessionId, const JSONRPCNotification& notification);

    // Origin policy check; see Options::allowedOrigins.
    bool IsOriginAllowed(const std::string& origin) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
