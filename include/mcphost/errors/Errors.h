//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, registry exceptions and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Typed error representation used by the dispatcher.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Build a typed error from a code, message and optional structured data.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = getInt(errVal, "code");
    auto message = getString(errVal, "message");
    if (!code || !message) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = errVal.find("data")) {
        data = *d;
    }
    return makeError(static_cast<int>(*code), *message, std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// InvalidCursorError
// Purpose: Raised by registries when a pagination cursor cannot be decoded, is out of range, or was
//          issued for a different search. Distinct from "not found" so callers can tell protocol misuse
//          apart from an empty result.
// Fields:
//   cursor: The raw cursor as supplied by the client.
//   offset: Decoded offset when decoding succeeded.
//   total:  Number of items available at the time of the call.
//==========================================================================================================
class InvalidCursorError : public std::invalid_argument {
public:
    InvalidCursorError(const std::string& what, std::string cursor,
                       std::optional<int64_t> offset = std::nullopt, std::size_t total = 0)
        : std::invalid_argument(what), cursor_(std::move(cursor)), offset_(offset), total_(total) {}

    const std::string& cursor() const noexcept { return cursor_; }
    std::optional<int64_t> offset() const noexcept { return offset_; }
    std::size_t total() const noexcept { return total_; }

    InvalidCursorError withTotal(std::size_t total) const {
        return InvalidCursorError(what(), cursor_, offset_, total);
    }

    // Structured data for the JSON-RPC error: { cursor, offset?, total }
    JSONValue toData() const {
        JSONValue::Object o;
        o["cursor"] = std::make_shared<JSONValue>(cursor_);
        if (offset_.has_value()) {
            o["offset"] = std::make_shared<JSONValue>(offset_.value());
        }
        o["total"] = std::make_shared<JSONValue>(static_cast<int64_t>(total_));
        return JSONValue(std::move(o));
    }

private:
    std::string cursor_;
    std::optional<int64_t> offset_;
    std::size_t total_;
};

} // namespace errors
} // namespace mcphost
