//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthGate.hpp
// Purpose: Bearer credential validation at the HTTP boundary
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcphost::auth {

//==========================================================================================================
// TokenInfo
// Purpose: Information extracted from a bearer token (scopes, expiration, and optional extra fields).
//==========================================================================================================
struct TokenInfo {
    std::vector<std::string> scopes;
    std::chrono::system_clock::time_point expiration;
    std::unordered_map<std::string, std::string> extra;
};

//==========================================================================================================
// ITokenVerifier
// Purpose: Interface to validate a bearer token and populate TokenInfo when valid.
// Returns: true on success (TokenInfo populated); false on failure (set errorMessage).
//==========================================================================================================
class ITokenVerifier {
public:
    virtual ~ITokenVerifier() = default;
    virtual bool Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) = 0;
};

//==========================================================================================================
// StaticTokenVerifier
// Purpose: Shared-secret verifier. Accepts exactly one token (constant-time compare) and grants the
//          configured scopes with a far-future expiration.
//==========================================================================================================
class StaticTokenVerifier : public ITokenVerifier {
public:
    explicit StaticTokenVerifier(std::string expectedToken, std::vector<std::string> scopes = {});
    bool Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) override;

private:
    std::string expected;
    std::vector<std::string> grantedScopes;
};

//==========================================================================================================
// RequireBearerTokenOptions
// Purpose: Options controlling bearer enforcement and resource metadata advertisement.
// Fields:
//   resourceMetadataUrl: URL to include in WWW-Authenticate header when returning 401/403.
//   requiredScopes: All listed scopes must be present in the token.
//==========================================================================================================
struct RequireBearerTokenOptions {
    std::string resourceMetadataUrl;
    std::vector<std::string> requiredScopes;
};

//==========================================================================================================
// BearerCheckResult
// Purpose: Result of checking a bearer Authorization header.
// Fields:
//   ok: True if authorization passed.
//   httpStatus: HTTP status to use on failure (401 or 403).
//   errorMessage: Error message to include in payload.
//   includeWWWAuthenticate: Whether the caller should include a WWW-Authenticate header.
//==========================================================================================================
struct BearerCheckResult {
    bool ok{false};
    int httpStatus{401};
    std::string errorMessage;
    bool includeWWWAuthenticate{false};
};

//==========================================================================================================
// CheckBearerAuth
// Purpose: Validate Authorization header using the supplied verifier and options.
// Args:
//   authHeader: Value of the Authorization header (may be empty).
//   verifier: Token verifier.
//   opts: Enforcement options (required scopes and resource metadata URL).
//   outInfo: Populated on success with token information.
//==========================================================================================================
BearerCheckResult CheckBearerAuth(
    const std::string& authHeader,
    ITokenVerifier& verifier,
    const RequireBearerTokenOptions& opts,
    TokenInfo& outInfo);

//==========================================================================================================
// AuthGate
// Purpose: Owns a verifier plus enforcement options; the HTTP transport consults it for every request
//          on the MCP endpoint.
//==========================================================================================================
class AuthGate {
public:
    AuthGate(std::shared_ptr<ITokenVerifier> verifier, RequireBearerTokenOptions opts = {});

    // Check an Authorization header value; outInfo is populated on success.
    BearerCheckResult Check(const std::string& authHeader, TokenInfo& outInfo) const;

    // Validate a bare credential, optionally requiring one scope.
    bool Validate(const std::string& credential, const std::optional<std::string>& requiredScope = std::nullopt) const;

    // Value for the WWW-Authenticate response header.
    std::string Challenge(const BearerCheckResult& result) const;

    const RequireBearerTokenOptions& Options() const { return options; }

private:
    std::shared_ptr<ITokenVerifier> verifier;
    RequireBearerTokenOptions options;
};

//==========================================================================================================
// Per-request TokenInfo context accessors
// Purpose: Provide access to the current request's TokenInfo for capability handlers.
//==========================================================================================================
const TokenInfo* CurrentTokenInfo();

// RAII helper: sets the current TokenInfo for the lifetime of this object, then restores the previous one.
class TokenInfoScope {
public:
    explicit TokenInfoScope(const TokenInfo* info);
    ~TokenInfoScope();
private:
    const TokenInfo* prev{nullptr};
};

} // namespace mcphost::auth
