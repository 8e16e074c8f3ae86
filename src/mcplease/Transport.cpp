//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: Transport selection from URI-like configuration strings
//==========================================================================================================

#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "mcplease/Transport.h"
#include "mcplease/StdioTransport.hpp"
#include "mcplease/SseServer.hpp"
#include "mcplease/WebSocketServer.hpp"

namespace mcplease {

namespace {
bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}
} // namespace

std::unique_ptr<ITransport> CreateTransportFromUri(const std::string& uri) {
    if (uri == "stdio" || startsWith(uri, "stdio:") || startsWith(uri, "stdio?")) {
        std::string config;
        auto q = uri.find_first_of(":?");
        if (q != std::string::npos) {
            config = uri.substr(q + 1);
            while (!config.empty() && config.front() == '/') config.erase(0, 1);
        }
        StdioTransportFactory f;
        return f.CreateTransport(config);
    }
    if (startsWith(uri, "sse://") || startsWith(uri, "sses://")) {
        SseServerFactory f;
        return f.CreateTransport(uri);
    }
    if (startsWith(uri, "ws://") || startsWith(uri, "wss://")) {
        WebSocketServerFactory f;
        return f.CreateTransport(uri);
    }
    LOG_ERROR("Unknown transport: {}", uri);
    throw std::invalid_argument("Unknown transport: " + uri);
}

} // namespace mcplease
