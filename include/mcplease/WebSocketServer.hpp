//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketServer.hpp
// Purpose: WebSocket transport using Boost.Beast websocket streams (optional TLS 1.3)
//==========================================================================================================

#pragma once

#include <string>
#include <future>
#include <memory>
#include <vector>
#include "mcplease/Transport.h"
#include "mcplease/NetworkEndpoint.hpp"
#include "mcplease/auth/ServerAuth.h"

namespace mcplease {

//==========================================================================================================
// WebSocketServer
// Purpose: Multi-client bidirectional transport. Each text frame carries one JSON-RPC message; the reply
//          is written back on the same socket. A welcome frame {"type":"connected","client_id":...} is sent
//          after the upgrade.
//          With an access verifier the upgrade request needs a bearer token (header or ?access_token=);
//          otherwise it is answered 401. Frames over the rate limit get a RateLimitExceeded reply and
//          methods outside the token's scopes an AuthorizationError reply.
//==========================================================================================================
class WebSocketServer : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   endpoint: Bind address/port and TLS files (endpoint.tls selects wss).
    //   maxQueuedMessages: Per-client outbound backlog; a client that falls further behind is dropped.
    //   workerThreads: Threads running request handlers.
    //   access: Optional bearer authentication and per-address rate limit.
    //==========================================================================================================
    struct Options {
        NetworkEndpoint endpoint;
        std::size_t maxQueuedMessages{1024};
        std::size_t workerThreads{4};
        auth::AccessPolicy access;
    };

    explicit WebSocketServer(const Options& opts);
    ~WebSocketServer() override;

    std::future<void> Start() override;
    std::future<void> Stop() override;

    bool IsRunning() const override;
    std::string Name() const override;
    std::size_t ConnectedClients() const override;
    std::size_t SendMessage(const std::string& json) override;

    bool SendToClient(const std::string& clientId, const std::string& json);
    std::vector<std::string> ClientIds() const;
    unsigned short BoundPort() const;

    void SetRequestHandler(RequestHandler handler) override;
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// WebSocketServerFactory
// Purpose: "ws://host:port" or "wss://host:port?cert=<pem>&key=<pem>" (default port 8001).
//          Access settings come from auth::AccessPolicyFromEnvironment().
//==========================================================================================================
class WebSocketServerFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcplease
