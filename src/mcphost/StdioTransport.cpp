//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Newline-delimited stdio transport implementation
//==========================================================================================================

#include <atomic>
#include <future>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/ProtocolServer.h"
#include "mcphost/StdioTransport.hpp"

namespace mcphost {

class StdioTransport::Impl {
public:
    ProtocolServer& server;
    std::istream& in;
    std::ostream& out;

    std::atomic<bool> running{false};
    std::thread readerThread;
    std::mutex writeMutex;
    IServerTransport::ErrorHandler errorHandler;
    std::size_t maxLineBytes{4 * 1024 * 1024};

    Impl(ProtocolServer& s, std::istream& i, std::ostream& o) : server(s), in(i), out(o) {
        // stdout belongs to the protocol
        Logger::setUseStderr(true);
        server.SetNotificationSink([this](const std::string&, const JSONRPCNotification& n) {
            writeLine(n.Serialize());
        });
    }

    ~Impl() {
        server.SetNotificationSink(nullptr);
        running = false;
        if (readerThread.joinable()) {
            readerThread.join();
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void writeLine(const std::string& payload) {
        std::lock_guard<std::mutex> lk(writeMutex);
        out << payload << '\n';
        out.flush();
        if (!out.good()) {
            setError("StdioTransport: write to output stream failed");
        }
    }

    void handleLine(const std::string& line) {
        std::unique_ptr<JSONRPCResponse> response;
        if (line.size() > maxLineBytes) {
            LOG_WARN("StdioTransport: dropping {} byte line (max {})", line.size(), maxLineBytes);
            response = CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Message too large");
        } else {
            try {
                response = server.HandleMessage(line, ConnectionContext{});
            } catch (const std::exception& e) {
                LOG_ERROR("StdioTransport: dispatch failed: {}", e.what());
                response = CreateErrorResponse(nullptr, JSONRPCErrorCodes::InternalError, e.what());
            } catch (...) {
                LOG_ERROR("StdioTransport: dispatch failed: unknown exception");
                response = CreateErrorResponse(nullptr, JSONRPCErrorCodes::InternalError, "Unknown error");
            }
        }
        if (response) {
            writeLine(response->Serialize());
        }
    }

    std::size_t run() {
        running = true;
        std::size_t processed = 0;
        std::string line;
        while (running.load() && std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }
            ++processed;
            handleLine(line);
        }
        if (in.bad()) {
            setError("StdioTransport: input stream error");
        }
        LOG_INFO("StdioTransport: input closed after {} message(s)", processed);
        server.EndConnection("");
        running = false;
        return processed;
    }
};

StdioTransport::StdioTransport(ProtocolServer& server)
    : StdioTransport(server, std::cin, std::cout) {}

StdioTransport::StdioTransport(ProtocolServer& server, std::istream& in, std::ostream& out)
    : pImpl(std::make_unique<Impl>(server, in, out)) { FUNC_SCOPE(); }

StdioTransport::~StdioTransport() { FUNC_SCOPE(); }

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting StdioTransport");
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->readerThread = std::thread([this, pr = std::move(done)]() mutable {
        pImpl->run();
        pr.set_value();
    });
    return fut;
}

std::future<void> StdioTransport::Stop() {
    FUNC_SCOPE();
    LOG_INFO("Stopping StdioTransport");
    pImpl->running = false;
    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

std::size_t StdioTransport::Run() {
    return pImpl->run();
}

void StdioTransport::SetMaxLineBytes(std::size_t maxBytes) {
    pImpl->maxLineBytes = maxBytes;
}

} // namespace mcphost
