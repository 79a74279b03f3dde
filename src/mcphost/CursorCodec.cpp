//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CursorCodec.cpp
// Purpose: base64url cursor encoding and validation
//==========================================================================================================

#include "mcphost/CursorCodec.h"
#include "mcphost/errors/Errors.h"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace mcphost {

namespace {
constexpr const char* kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
constexpr const char* kVersionPrefix = "v1:";

int decodeChar(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '-') return 62;
    if (c == '_') return 63;
    return -1;
}

std::string base64UrlEncode(const std::string& in) {
    std::string out;
    out.reserve((in.size() + 2) / 3 * 4);
    std::size_t i = 0;
    while (i + 3 <= in.size()) {
        uint32_t n = (static_cast<uint8_t>(in[i]) << 16) | (static_cast<uint8_t>(in[i + 1]) << 8) | static_cast<uint8_t>(in[i + 2]);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
        i += 3;
    }
    std::size_t rest = in.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(in[i]) << 16;
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(in[i]) << 16) | (static_cast<uint8_t>(in[i + 1]) << 8);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
    }
    return out;
}

std::optional<std::string> base64UrlDecode(const std::string& in) {
    if (in.size() % 4 == 1) return std::nullopt;
    std::string out;
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : in) {
        int v = decodeChar(c);
        if (v < 0) return std::nullopt;
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}
} // namespace

std::string CursorCodec::Encode(const Cursor& cursor) {
    std::string raw = fmt::format("{}{}", kVersionPrefix, cursor.offset);
    if (cursor.snapshot.has_value()) {
        raw += ":" + cursor.snapshot.value();
    }
    return base64UrlEncode(raw);
}

Cursor CursorCodec::Decode(const std::string& token) {
    auto raw = base64UrlDecode(token);
    if (!raw.has_value() || raw->rfind(kVersionPrefix, 0) != 0) {
        throw errors::InvalidCursorError("Invalid cursor", token);
    }
    std::string body = raw->substr(3);
    std::string offsetPart = body;
    Cursor c;
    auto colon = body.find(':');
    if (colon != std::string::npos) {
        offsetPart = body.substr(0, colon);
        c.snapshot = body.substr(colon + 1);
    }
    std::size_t k = (!offsetPart.empty() && offsetPart[0] == '-') ? 1 : 0;
    if (k == offsetPart.size() || offsetPart.size() > 19) {
        throw errors::InvalidCursorError("Invalid cursor", token);
    }
    for (; k < offsetPart.size(); ++k) {
        if (!std::isdigit(static_cast<unsigned char>(offsetPart[k]))) {
            throw errors::InvalidCursorError("Invalid cursor", token);
        }
    }
    try {
        c.offset = std::stoll(offsetPart);
    } catch (const std::out_of_range&) {
        throw errors::InvalidCursorError("Invalid cursor", token);
    }
    return c;
}

PageWindow resolvePage(std::size_t total, const std::optional<std::string>& cursor,
                       int64_t pageSize, int64_t maxPageSize,
                       const std::optional<std::string>& snapshot) {
    if (maxPageSize <= 0) maxPageSize = kMaxPageSize;
    if (pageSize <= 0) pageSize = kDefaultPageSize;
    pageSize = std::min(pageSize, maxPageSize);

    const auto count = static_cast<int64_t>(total);
    int64_t offset = 0;
    // an empty cursor means the first page
    if (cursor.has_value() && !cursor->empty()) {
        Cursor decoded;
        try {
            decoded = CursorCodec::Decode(cursor.value());
        } catch (const errors::InvalidCursorError& e) {
            throw e.withTotal(total);
        }
        if (decoded.snapshot != snapshot) {
            throw errors::InvalidCursorError("Cursor does not match this query", cursor.value(), decoded.offset, total);
        }
        if (decoded.offset < 0 || decoded.offset >= count) {
            throw errors::InvalidCursorError("Cursor offset out of range", cursor.value(), decoded.offset, total);
        }
        offset = decoded.offset;
    }

    PageWindow w;
    w.begin = static_cast<std::size_t>(offset);
    const int64_t end = std::min(count, offset + pageSize);
    w.end = static_cast<std::size_t>(end);
    if (end < count) {
        w.nextCursor = CursorCodec::Encode(end, snapshot);
    }
    return w;
}

} // namespace mcphost
