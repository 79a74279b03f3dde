//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Newline-delimited JSON-RPC transport over a pair of streams (stdin/stdout by default)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>

#include "mcphost/Transport.h"

namespace mcphost {

class ProtocolServer;

//==========================================================================================================
// StdioTransport
// Purpose: Serves exactly one client over a line-oriented byte stream. Each inbound line is one JSON-RPC
//          message; each outbound message is written as one line. The transport is the session, so the
//          connection id handed to the server is empty.
// Notes:
//   - Messages are processed one at a time; a slow tool call delays the following lines.
//   - Construction routes the process logger to stderr so stdout carries only protocol lines.
//==========================================================================================================
class StdioTransport : public IServerTransport {
public:
    explicit StdioTransport(ProtocolServer& server);
    StdioTransport(ProtocolServer& server, std::istream& in, std::ostream& out);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    ////////////////////////////////////////// IServerTransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the reader loop on a background thread.
    // Returns:
    //   Future that completes when the input reaches end of stream.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops accepting input and joins the reader. Blocks until the reader finishes its current line or
    // observes end of stream.
    //==========================================================================================================
    std::future<void> Stop() override;

    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // Run
    // Purpose: Read, dispatch and answer lines on the calling thread until end of stream or Stop().
    // Returns:
    //   Number of lines processed (blank lines excluded).
    //==========================================================================================================
    std::size_t Run();

    //==========================================================================================================
    // SetMaxLineBytes
    // Purpose: Lines longer than this are answered with an InvalidRequest error instead of being parsed.
    // Args:
    //   maxBytes: Limit in bytes (default 4 MiB).
    //==========================================================================================================
    void SetMaxLineBytes(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
