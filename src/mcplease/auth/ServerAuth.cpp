//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: auth/ServerAuth.cpp
// Purpose: Bearer-token checks, method permissions and per-client rate limiting
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplease/JSONRPCTypes.h"
#include "mcplease/auth/ServerAuth.h"

namespace mcplease::auth {

namespace {
bool icaseEqual(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

bool startsWithBearer(const std::string& s) {
    const std::string pfx = "Bearer ";
    if (s.size() < pfx.size()) {
        return false;
    }
    for (std::size_t i = 0; i < pfx.size(); ++i) {
        if (!icaseEqual(s[i], pfx[i])) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t pos = s.find(sep, start);
        std::string item = trim(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (!item.empty()) out.push_back(std::move(item));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return out;
}
} // namespace

/////////////////////////////////////////// StaticTokenVerifier ///////////////////////////////////////////

StaticTokenVerifier::StaticTokenVerifier(std::unordered_map<std::string, TokenInfo> t) : tokens(std::move(t)) {}

std::shared_ptr<StaticTokenVerifier> StaticTokenVerifier::FromSpec(const std::string& spec) {
    std::unordered_map<std::string, TokenInfo> table;
    for (const auto& entry : split(spec, ',')) {
        const auto colon = entry.find(':');
        const std::string token = trim(entry.substr(0, colon));
        if (token.empty()) continue;
        TokenInfo info;
        if (colon != std::string::npos) {
            info.scopes = split(entry.substr(colon + 1), '+');
        }
        table[token] = std::move(info);
    }
    return std::make_shared<StaticTokenVerifier>(std::move(table));
}

bool StaticTokenVerifier::Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) {
    auto it = tokens.find(token);
    if (it == tokens.end()) {
        errorMessage = "invalid token";
        return false;
    }
    outInfo = it->second;
    return true;
}

/////////////////////////////////////////// Checks ///////////////////////////////////////////

BearerCheckResult CheckBearerAuth(const std::string& authHeader, ITokenVerifier& verifier, TokenInfo& outInfo) {
    BearerCheckResult r;
    if (authHeader.empty() || !startsWithBearer(authHeader)) {
        r.errorMessage = "no bearer token";
        return r;
    }
    const std::string token = trim(authHeader.substr(7));
    if (token.empty()) {
        r.errorMessage = "no bearer token";
        return r;
    }
    std::string err;
    TokenInfo info;
    if (!verifier.Verify(token, info, err)) {
        r.errorMessage = err.empty() ? std::string("invalid token") : err;
        return r;
    }
    outInfo = std::move(info);
    r.ok = true;
    r.httpStatus = 200;
    return r;
}

std::string RequiredScope(const std::string& method) {
    if (method == "tools/call" || method == "tools/list") return method;
    return "read";
}

bool IsMethodAllowed(const TokenInfo& info, const std::string& method) {
    if (info.scopes.empty()) return true;
    const std::string need = RequiredScope(method);
    return std::any_of(info.scopes.begin(), info.scopes.end(),
                       [&](const std::string& s) { return s == "*" || s == need; });
}

std::string ErrorReply(int code, const std::string& message, const std::string& detail) {
    JSONValue::Object data;
    data["error"] = std::make_shared<JSONValue>(detail);
    return CreateErrorResponse(nullptr, code, message, JSONValue{data})->Serialize();
}

/////////////////////////////////////////// RateLimiter ///////////////////////////////////////////

RateLimiter::RateLimiter(std::size_t perMinute, std::function<Clock::time_point()> c)
    : limit(perMinute), clock(std::move(c)) {
    if (!clock) {
        clock = []() { return Clock::now(); };
    }
}

bool RateLimiter::Allow(const std::string& key) {
    if (limit == 0) return true;
    const auto now = clock();
    const auto windowStart = now - std::chrono::minutes(1);
    std::lock_guard<std::mutex> lk(mtx);
    if (windows.size() > 4096) {
        for (auto it = windows.begin(); it != windows.end();) {
            if (it->second.empty() || it->second.back() <= windowStart) it = windows.erase(it);
            else ++it;
        }
    }
    auto& w = windows[key];
    while (!w.empty() && w.front() <= windowStart) w.pop_front();
    if (w.size() >= limit) {
        return false;
    }
    w.push_back(now);
    return true;
}

AccessPolicy AccessPolicyFromEnvironment() {
    AccessPolicy p;
    const std::string spec = GetEnvOrDefault("MCPLEASE_AUTH_TOKENS", "");
    if (!spec.empty()) {
        auto verifier = StaticTokenVerifier::FromSpec(spec);
        if (verifier->Size() == 0) {
            LOG_WARN("MCPLEASE_AUTH_TOKENS is set but names no tokens; authentication stays off");
        } else {
            p.verifier = std::move(verifier);
        }
    }
    p.rateLimitPerMinute = static_cast<std::size_t>(GetEnvIntOrDefault("MCPLEASE_RATE_LIMIT_PER_MIN", 0));
    return p;
}

} // namespace mcplease::auth
