//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Server-side transport interfaces; a transport moves JSON-RPC messages between clients and the
//          request handler without interpreting them.
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

namespace mcplease {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// RequestContext
// Purpose: Per-request facts a transport knows and the handler may need.
// Fields:
//   transport: Name of the transport that received the request ("stdio", "sse", "websocket", ...).
//   clientId: Transport-assigned client identifier (empty for stdio).
//   sessionId: Client-provided session id from transport metadata (e.g. Mcp-Session-Id header), may be empty.
//   receivedAt: Monotonic timestamp taken once the request was fully parsed.
//==========================================================================================================
struct RequestContext {
    std::string transport;
    std::string clientId;
    std::string sessionId;
    std::chrono::steady_clock::time_point receivedAt{std::chrono::steady_clock::now()};
};

//==========================================================================================================
// ITransport
// Purpose: A server-side channel. Implementations own their I/O loop(s) and invoke the registered handlers
//          from those loops; every request handled yields exactly one response written back to the client
//          that sent it.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loop (bind/listen or attach to stdio).
    // Returns:
    //   A future that completes when the transport is running (or failed to start; the future then throws).
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the transport: no new requests are accepted, client connections are closed.
    // Returns:
    //   A future that completes when the I/O loop has exited.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    virtual bool IsRunning() const = 0;

    // Short transport name used in logs, status and RequestContext::transport.
    virtual std::string Name() const = 0;

    // Number of currently connected clients (stdio reports 1 while running).
    virtual std::size_t ConnectedClients() const = 0;

    /////////////////////////////////////////// Outbound ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a raw JSON message to every connected client. Clients whose write fails are dropped.
    // Args:
    //   json: Serialized JSON document (one message).
    // Returns:
    //   Number of clients the message was queued for.
    //==========================================================================================================
    virtual std::size_t SendMessage(const std::string& json) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&, const RequestContext&)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>, const RequestContext&)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// ITransportFactory
// Purpose: Creates transports from configuration strings (e.g. "stdio", "sse://0.0.0.0:8000").
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

//==========================================================================================================
// CreateTransportFromUri
// Purpose: Dispatches on the URI scheme to the stdio, SSE or WebSocket factory.
// Throws:
//   std::invalid_argument for unknown schemes or malformed endpoints.
//==========================================================================================================
std::unique_ptr<ITransport> CreateTransportFromUri(const std::string& uri);

} // namespace mcplease
