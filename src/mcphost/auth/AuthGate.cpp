//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcphost/auth/AuthGate.cpp
// Purpose: Bearer authentication helpers implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <vector>

#include <openssl/crypto.h>

#include "mcphost/auth/AuthGate.hpp"

namespace mcphost::auth {

namespace {
    // Thread-local storage for per-request TokenInfo.
    thread_local const TokenInfo* gCurrentTokenInfo = nullptr;

    bool icaseEqual(char a, char b) {
        return (std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)));
    }

    bool startsWithBearer(const std::string& s) {
        const std::string pfx = "Bearer ";
        if (s.size() < pfx.size()) {
            return false;
        }
        for (size_t i = 0; i < pfx.size(); ++i) {
            if (!icaseEqual(s[i], pfx[i])) {
                return false;
            }
        }
        return true;
    }

    bool containsAllScopes(const std::vector<std::string>& have, const std::vector<std::string>& need) {
        return std::all_of(need.begin(), need.end(), [&](const std::string& s) {
            return std::find(have.begin(), have.end(), s) != have.end();
        });
    }

    BearerCheckResult fail(int status, std::string message) {
        BearerCheckResult r;
        r.ok = false;
        r.httpStatus = status;
        r.errorMessage = std::move(message);
        r.includeWWWAuthenticate = true;
        return r;
    }
}

const TokenInfo* CurrentTokenInfo() {
    return gCurrentTokenInfo;
}

TokenInfoScope::TokenInfoScope(const TokenInfo* info) : prev(gCurrentTokenInfo) {
    gCurrentTokenInfo = info;
}

TokenInfoScope::~TokenInfoScope() {
    gCurrentTokenInfo = prev;
}

///////////////////////////////////////// StaticTokenVerifier ///////////////////////////////////////////
StaticTokenVerifier::StaticTokenVerifier(std::string expectedToken, std::vector<std::string> scopes)
    : expected(std::move(expectedToken)), grantedScopes(std::move(scopes)) {}

bool StaticTokenVerifier::Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) {
    if (expected.empty() || token.size() != expected.size() ||
        CRYPTO_memcmp(token.data(), expected.data(), expected.size()) != 0) {
        errorMessage = "invalid token";
        return false;
    }
    outInfo.scopes = grantedScopes;
    outInfo.expiration = std::chrono::system_clock::time_point::max();
    return true;
}

///////////////////////////////////////// CheckBearerAuth ///////////////////////////////////////////
BearerCheckResult CheckBearerAuth(
    const std::string& authHeader,
    ITokenVerifier& verifier,
    const RequireBearerTokenOptions& opts,
    TokenInfo& outInfo) {

    if (authHeader.empty() || !startsWithBearer(authHeader)) {
        return fail(401, "no bearer token");
    }
    std::string token = authHeader.substr(7);
    // Trim surrounding spaces on token
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())) != 0) {
        token.erase(token.begin());
    }
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())) != 0) {
        token.pop_back();
    }
    if (token.empty()) {
        return fail(401, "no bearer token");
    }

    std::string err;
    TokenInfo info;
    if (!verifier.Verify(token, info, err)) {
        return fail(401, err.empty() ? std::string("invalid token") : err);
    }

    if (!opts.requiredScopes.empty() && !containsAllScopes(info.scopes, opts.requiredScopes)) {
        return fail(403, "insufficient scope");
    }

    if (info.expiration.time_since_epoch().count() == 0) {
        return fail(401, "token missing expiration");
    }
    if (info.expiration <= std::chrono::system_clock::now()) {
        return fail(401, "token expired");
    }

    outInfo = std::move(info);
    BearerCheckResult r;
    r.ok = true;
    r.httpStatus = 200;
    r.includeWWWAuthenticate = false;
    return r;
}

///////////////////////////////////////// AuthGate ///////////////////////////////////////////
AuthGate::AuthGate(std::shared_ptr<ITokenVerifier> v, RequireBearerTokenOptions opts)
    : verifier(std::move(v)), options(std::move(opts)) {}

BearerCheckResult AuthGate::Check(const std::string& authHeader, TokenInfo& outInfo) const {
    if (!verifier) {
        return fail(401, "no verifier configured");
    }
    return CheckBearerAuth(authHeader, *verifier, options, outInfo);
}

bool AuthGate::Validate(const std::string& credential, const std::optional<std::string>& requiredScope) const {
    if (!verifier) {
        return false;
    }
    RequireBearerTokenOptions opts = options;
    if (requiredScope.has_value()) {
        opts.requiredScopes.push_back(*requiredScope);
    }
    TokenInfo info;
    return CheckBearerAuth("Bearer " + credential, *verifier, opts, info).ok;
}

std::string AuthGate::Challenge(const BearerCheckResult& result) const {
    std::string v = "Bearer";
    bool first = true;
    auto add = [&](const std::string& key, const std::string& value) {
        v += first ? " " : ", ";
        first = false;
        v += key + "=\"" + value + "\"";
    };
    if (!options.resourceMetadataUrl.empty()) {
        add("resource_metadata", options.resourceMetadataUrl);
    }
    if (result.httpStatus == 403) {
        add("error", "insufficient_scope");
    } else if (result.errorMessage != "no bearer token") {
        add("error", "invalid_token");
    }
    return v;
}

} // namespace mcphost::auth
