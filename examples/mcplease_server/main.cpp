//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcplease server executable (stdio, SSE and WebSocket transports)
//==========================================================================================================

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "logging/Logger.h"
#include "mcplease/Server.h"
#include "mcplease/StdioTransport.hpp"
#include "mcplease/Transport.h"
#include "mcplease/auth/ServerAuth.h"

using namespace mcplease;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   key: Option name including leading dashes (e.g., "--transport")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) continue;
        std::string a = argv[i];
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t comma = s.find(',', start);
        std::string item = s.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        if (!item.empty()) out.push_back(item);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

int main(int argc, char** argv) {
    std::string transportList = getArgValue(argc, argv, "--transport").value_or("stdio");
    if (transportList == "all") transportList = "stdio,sse,websocket";
    const std::vector<std::string> kinds = splitList(transportList);

    // stdout belongs to the protocol when stdio is in use; route logs to stderr before the first log line.
    for (const auto& k : kinds) {
        if (k == "stdio") ::setenv("MCPLEASE_STDIO_MODE", "1", 0);
    }

    ServerConfig cfg = ServerConfig::FromEnvironment();
    Logger::setLogLevelFromString(cfg.logLevel);
    if (!cfg.logFile.empty()) {
        Logger::setLogFile(cfg.logFile);
    }
    LOG_INFO("Server starting with transport={}", transportList);

    std::unique_ptr<Server> server;
    StdioTransport* stdio = nullptr;
    try {
        server = std::make_unique<Server>(cfg);
        for (const auto& kind : kinds) {
            if (kind == "stdio") {
                StdioTransportFactory f;
                auto t = f.CreateTransport(cfg.stdioConfig);
                stdio = static_cast<StdioTransport*>(t.get());
                server->AddTransport(std::move(t));
            } else if (kind == "sse") {
                server->AddTransport(CreateTransportFromUri(getArgValue(argc, argv, "--sse").value_or("sse://127.0.0.1:8000")));
            } else if (kind == "websocket" || kind == "ws") {
                server->AddTransport(CreateTransportFromUri(getArgValue(argc, argv, "--ws").value_or("ws://127.0.0.1:8001")));
            } else {
                LOG_ERROR("Unknown transport '{}' (expected stdio, sse, websocket or all)", kind);
                return 2;
            }
        }
        if (std::any_of(kinds.begin(), kinds.end(), [](const std::string& k) { return k != "stdio"; })) {
            if (!auth::AccessPolicyFromEnvironment().verifier) {
                LOG_WARN("Network transports accept unauthenticated clients; set MCPLEASE_AUTH_TOKENS to require a bearer token");
            }
        }
        server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed to start: {}", e.what());
        return 1;
    }

    boost::asio::io_context sigIoc;
    boost::asio::signal_set signals(sigIoc, SIGINT, SIGTERM);
    signals.async_wait([&sigIoc](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}; shutting down", signo);
        }
        sigIoc.stop();
    });

    // With stdio as the only transport, EOF on stdin ends the process.
    std::thread eofWatcher;
    if (stdio != nullptr && kinds.size() == 1) {
        eofWatcher = std::thread([stdio, &sigIoc]() {
            stdio->WaitUntilStopped();
            LOG_INFO("stdin closed; shutting down");
            boost::asio::post(sigIoc, [&sigIoc]() { sigIoc.stop(); });
        });
    }

    sigIoc.run();
    try {
        server->Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Error during shutdown: {}", e.what());
    }
    if (eofWatcher.joinable()) {
        eofWatcher.join();
    }
    return 0;
}
