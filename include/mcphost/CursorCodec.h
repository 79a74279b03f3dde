//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CursorCodec.h
// Purpose: Opaque pagination cursors: base64url("v1:<offset>[:<snapshot>]")
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mcphost {

//==========================================================================================================
// Cursor
// Purpose: Decoded pagination position.
// Fields:
//   offset: Index of the first item of the next page.
//   snapshot: Optional token binding the cursor to a particular query (tools/search filter set).
//==========================================================================================================
struct Cursor {
    int64_t offset{0};
    std::optional<std::string> snapshot;
};

class CursorCodec {
public:
    // Encode a cursor as an opaque URL-safe string.
    static std::string Encode(const Cursor& cursor);
    static std::string Encode(int64_t offset, const std::optional<std::string>& snapshot = std::nullopt) {
        return Encode(Cursor{offset, snapshot});
    }

    //======================================================================================================
    // Decode
    // Purpose: Reverse Encode.
    // Args:
    //   token: Cursor string received from the client.
    // Returns:
    //   The decoded Cursor. Throws errors::InvalidCursorError when the token is not a cursor this codec
    //   produced. Range checks against a collection are the caller's concern.
    //======================================================================================================
    static Cursor Decode(const std::string& token);
};

//==========================================================================================================
// PageWindow
// Purpose: Resolved [begin, end) window over a collection plus the cursor for the following page.
//==========================================================================================================
struct PageWindow {
    std::size_t begin{0};
    std::size_t end{0};
    std::optional<std::string> nextCursor;
};

constexpr int64_t kDefaultPageSize = 50;
constexpr int64_t kMaxPageSize = 100;

//==========================================================================================================
// resolvePage
// Purpose: Shared pagination contract for every list operation.
// Args:
//   total: Number of items in the collection.
//   cursor: Cursor from the previous page; nullopt or "" starts at offset 0.
//   pageSize: Non-positive means kDefaultPageSize; clamped to maxPageSize.
//   snapshot: Query fingerprint the cursor must carry (nullopt for plain listings).
// Returns:
//   PageWindow. Throws errors::InvalidCursorError when the cursor does not decode, carries the wrong
//   snapshot, or its offset is negative or not below total.
//==========================================================================================================
PageWindow resolvePage(std::size_t total, const std::optional<std::string>& cursor,
                       int64_t pageSize = kDefaultPageSize, int64_t maxPageSize = kMaxPageSize,
                       const std::optional<std::string>& snapshot = std::nullopt);

} // namespace mcphost
