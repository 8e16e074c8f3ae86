//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SseServer.hpp
// Purpose: Server-Sent-Events transport using Boost.Beast coroutines (optional TLS 1.3)
//==========================================================================================================

#pragma once

#include <string>
#include <future>
#include <functional>
#include <memory>
#include <vector>
#include "mcplease/Transport.h"
#include "mcplease/NetworkEndpoint.hpp"
#include "mcplease/auth/ServerAuth.h"

namespace mcplease {

//==========================================================================================================
// SseServer
// Purpose: Multi-client HTTP transport.
//   GET  <ssePath>     : long-lived text/event-stream; first event announces the generated client id,
//                        then broadcast messages and periodic keepalive events.
//   POST <messagePath> : one JSON-RPC message per request; the response is the HTTP body.
// With an access verifier both routes need "Authorization: Bearer <token>" (or ?access_token=<token>);
// failures are 401 with an AuthenticationError body, refused methods 403 with AuthorizationError.
// Over the rate limit a POST gets 429 with RateLimitExceeded.
//==========================================================================================================
class SseServer : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   endpoint: Bind address/port and TLS files (endpoint.tls selects HTTPS).
    //   ssePath/messagePath: Routes for the event stream and inbound messages.
    //   keepaliveIntervalMs: Idle time after which a keepalive event is written to a stream.
    //   maxQueuedMessages: Per-client outbound backlog; a client that falls further behind is dropped.
    //   workerThreads: Threads running request handlers so slow tools never stall the I/O loop.
    //   access: Optional bearer authentication and per-address rate limit.
    //==========================================================================================================
    struct Options {
        NetworkEndpoint endpoint;
        std::string ssePath{"/mcp/sse"};
        std::string messagePath{"/mcp/message"};
        uint64_t keepaliveIntervalMs{30000};
        std::size_t maxQueuedMessages{1024};
        std::size_t workerThreads{4};
        auth::AccessPolicy access;
    };

    explicit SseServer(const Options& opts);
    ~SseServer() override;

    //==========================================================================================================
    // Binds and listens on the calling thread, then runs the accept loop on a background I/O thread.
    // Returns:
    //   Future that is ready once listening; holds an exception when bind/listen failed.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes the listener and all streams, waits for running handlers, then joins the I/O thread.
    //==========================================================================================================
    std::future<void> Stop() override;

    bool IsRunning() const override;
    std::string Name() const override;
    std::size_t ConnectedClients() const override;

    //==========================================================================================================
    // Queues a "data:" event for every connected stream. Clients with a full backlog are removed.
    //==========================================================================================================
    std::size_t SendMessage(const std::string& json) override;

    //==========================================================================================================
    // Queues a "data:" event for one stream client. Returns false when the client is unknown or was removed.
    //==========================================================================================================
    bool SendToClient(const std::string& clientId, const std::string& json);

    std::vector<std::string> ClientIds() const;

    // Port actually bound (useful when the endpoint asked for port 0). 0 before Start().
    unsigned short BoundPort() const;

    void SetRequestHandler(RequestHandler handler) override;
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// SseServerFactory
// Purpose: "sse://host:port" or "sses://host:port?cert=<pem>&key=<pem>" (default port 8000).
//          Optional query keys: keepalive_ms, workers. Access settings come from
//          auth::AccessPolicyFromEnvironment().
//==========================================================================================================
class SseServerFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcplease
