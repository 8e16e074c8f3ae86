//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: auth/ServerAuth.h
// Purpose: Optional bearer-token authentication, method permissions and rate limiting for network transports
//==========================================================================================================

#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcplease::auth {

//==========================================================================================================
// TokenInfo
// Purpose: What a verified bearer token grants.
// Fields:
//   scopes: Permissions held; empty or "*" grants every method.
//==========================================================================================================
struct TokenInfo {
    std::vector<std::string> scopes;
};

//==========================================================================================================
// ITokenVerifier
// Purpose: Validates a bearer token and fills TokenInfo when valid.
// Returns: true on success; false on failure (errorMessage set).
//==========================================================================================================
class ITokenVerifier {
public:
    virtual ~ITokenVerifier() = default;
    virtual bool Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) = 0;
};

//==========================================================================================================
// StaticTokenVerifier
// Purpose: Fixed token table.
//   FromSpec parses "tokA,tokB:tools/list+read": comma separated entries, each a token optionally followed
//   by ':' and '+'-separated scopes. Empty entries are skipped.
//==========================================================================================================
class StaticTokenVerifier : public ITokenVerifier {
public:
    explicit StaticTokenVerifier(std::unordered_map<std::string, TokenInfo> tokens);

    static std::shared_ptr<StaticTokenVerifier> FromSpec(const std::string& spec);

    bool Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) override;
    std::size_t Size() const { return tokens.size(); }

private:
    std::unordered_map<std::string, TokenInfo> tokens;
};

//==========================================================================================================
// BearerCheckResult
// Fields:
//   ok: Authentication passed.
//   httpStatus: 401 on failure.
//   errorMessage: Reason placed in the error payload.
//==========================================================================================================
struct BearerCheckResult {
    bool ok{false};
    int httpStatus{401};
    std::string errorMessage;
};

//==========================================================================================================
// CheckBearerAuth
// Purpose: Validates an Authorization header value ("Bearer <token>", scheme case-insensitive).
// Args:
//   authHeader: Header value (may be empty).
//   verifier: Token verifier.
//   outInfo: Populated on success.
//==========================================================================================================
BearerCheckResult CheckBearerAuth(const std::string& authHeader, ITokenVerifier& verifier, TokenInfo& outInfo);

// Scope a method needs: "tools/call" and "tools/list" need themselves, everything else "read".
std::string RequiredScope(const std::string& method);
bool IsMethodAllowed(const TokenInfo& info, const std::string& method);

// Serialized JSON-RPC error reply {"error":{"code","message","data":{"error":detail}},"id":null,...}.
std::string ErrorReply(int code, const std::string& message, const std::string& detail);

//==========================================================================================================
// RateLimiter
// Purpose: Sliding one-minute window per key (client address). A limit of 0 allows everything.
//==========================================================================================================
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(std::size_t perMinute, std::function<Clock::time_point()> clock = {});

    // Records the attempt when allowed.
    bool Allow(const std::string& key);

private:
    std::size_t limit;
    std::function<Clock::time_point()> clock;
    std::mutex mtx;
    std::unordered_map<std::string, std::deque<Clock::time_point>> windows;
};

//==========================================================================================================
// AccessPolicy
// Purpose: Per-transport access settings.
// Fields:
//   verifier: When set, every HTTP request / WebSocket upgrade needs a valid bearer token.
//   rateLimitPerMinute: Messages per client address per minute; 0 disables limiting.
//==========================================================================================================
struct AccessPolicy {
    std::shared_ptr<ITokenVerifier> verifier;
    std::size_t rateLimitPerMinute{0};
};

// MCPLEASE_AUTH_TOKENS (StaticTokenVerifier spec; empty = no authentication) and MCPLEASE_RATE_LIMIT_PER_MIN (0).
AccessPolicy AccessPolicyFromEnvironment();

} // namespace mcplease::auth
