//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Server-side transport interface shared by the stdio and HTTP transports
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <string>

namespace mcphost {

//==========================================================================================================
// IServerTransport
// Purpose: Drives a ProtocolServer over some byte channel. A transport owns its I/O threads and installs
//          itself as the server's notification sink while running.
//==========================================================================================================
class IServerTransport {
public:
    virtual ~IServerTransport() = default;

    //==========================================================================================================
    // Starts the transport I/O loop.
    // Returns:
    //   Future that completes when the transport has finished serving (end of stream for stdio) or, for
    //   listening transports, once the listener is bound.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the transport and releases resources.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    /////////////////////////////////////////// Error handling ///////////////////////////////////////////
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace mcphost
