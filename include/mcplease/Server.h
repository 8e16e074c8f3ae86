//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Server object owning the tool registry, context manager, protocol handler and transports
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "mcplease/ContextManager.h"
#include "mcplease/ContextStore.h"
#include "mcplease/GenerationProvider.h"
#include "mcplease/ProtocolHandler.h"
#include "mcplease/ToolRegistry.h"
#include "mcplease/Transport.h"

namespace mcplease {

//==========================================================================================================
// ServerConfig
// Purpose: Everything the server needs, usually read once from MCPLEASE_* environment variables.
//==========================================================================================================
struct ServerConfig {
    Implementation serverInfo;
    ContextManagerOptions contextOptions;
    std::string contextDir{".mcp_contexts"};
    SessionlessPolicy sessionlessPolicy{SessionlessPolicy::Synthesize};
    bool recordResponses{false};
    std::string generationUrl;
    unsigned int generationTimeoutMs{30000};
    std::string logLevel{"INFO"};
    std::string logFile;
    std::string stdioConfig;

    ServerConfig();
    static ServerConfig FromEnvironment();
};

//==========================================================================================================
// IServer
// Purpose: Lifecycle of a server serving one protocol handler over any number of transports.
//==========================================================================================================
class IServer {
public:
    virtual ~IServer() = default;

    //==========================================================================================================
    // Starts the context reaper and every transport added so far.
    // Returns:
    //   A future that completes once all transports are running. If one fails to start, the ones already
    //   started are stopped again and the future carries that failure.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the transports, waits for in-flight requests to complete, then stops the reaper.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    virtual bool IsRunning() const = 0;
};

class Server : public IServer {
public:
    // File-backed contexts in config.contextDir, generation provider from config.generationUrl.
    explicit Server(const ServerConfig& config);
    // Explicit collaborators (tests, embedding).
    Server(const ServerConfig& config,
           std::shared_ptr<IContextStore> store,
           std::shared_ptr<IGenerationProvider> provider);
    ~Server() override;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Must be called before Start().
    void AddTransport(std::unique_ptr<ITransport> transport);

    std::future<void> Start() override;
    std::future<void> Stop() override;
    bool IsRunning() const override;

    // Sends a notification to every client of every transport; returns the number of deliveries.
    std::size_t Broadcast(const JSONRPCNotification& notification);

    //==========================================================================================================
    // GetStatus
    // Returns:
    //   {running, server:{name,version}, transports:[{name, running, clients}], tools:{...}, contexts:{...},
    //    inflight_requests}
    //==========================================================================================================
    JSONValue GetStatus() const;
    // Running, every transport running and at least one tool registered.
    bool HealthCheck() const;

    ToolRegistry& Tools();
    ContextManager& Contexts();
    ProtocolHandler& Handler();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplease
