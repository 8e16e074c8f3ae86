//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Server wiring, lifecycle and status
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplease/DefaultTools.h"
#include "mcplease/Server.h"
#include "mcplease/version.h"

namespace mcplease {

//////////////////////////////////////////// ServerConfig ////////////////////////////////////////////

ServerConfig::ServerConfig()
    : serverInfo("mcplease", getVersionString(), "MCP server with local AI model integration") {}

ServerConfig ServerConfig::FromEnvironment() {
    ServerConfig cfg;
    auto positive = [](const char* name, int64_t def) {
        int64_t v = GetEnvIntOrDefault(name, def);
        if (v <= 0) {
            LOG_WARN("{} must be positive; using {}", name, def);
            return def;
        }
        return v;
    };
    cfg.logLevel = GetEnvOrDefault("MCPLEASE_LOG_LEVEL", "INFO");
    cfg.logFile = GetEnvOrDefault("MCPLEASE_LOG_FILE", "");
    cfg.contextDir = GetEnvOrDefault("MCPLEASE_CONTEXT_DIR", ".mcp_contexts");
    cfg.contextOptions.maxContextAge = std::chrono::minutes(positive("MCPLEASE_CONTEXT_TTL_MIN", 30));
    cfg.contextOptions.maxHistory = static_cast<std::size_t>(positive("MCPLEASE_MAX_HISTORY", 50));
    cfg.contextOptions.maxActiveFiles = static_cast<std::size_t>(positive("MCPLEASE_MAX_ACTIVE_FILES", 20));
    cfg.contextOptions.maxContextsPerUser = static_cast<std::size_t>(positive("MCPLEASE_MAX_CONTEXTS_PER_USER", 10));
    cfg.contextOptions.cleanupInterval = std::chrono::seconds(positive("MCPLEASE_CLEANUP_INTERVAL_SEC", 300));
    cfg.sessionlessPolicy = SessionlessPolicyFromString(GetEnvOrDefault("MCPLEASE_SESSIONLESS_POLICY", "synthesize"));
    cfg.recordResponses = GetEnvBoolOrDefault("MCPLEASE_RECORD_RESPONSES", false);
    cfg.generationUrl = GetEnvOrDefault("MCPLEASE_GENERATION_URL", "");
    cfg.generationTimeoutMs = static_cast<unsigned int>(positive("MCPLEASE_GENERATION_TIMEOUT_MS", 30000));
    cfg.stdioConfig = GetEnvOrDefault("MCPLEASE_STDIO_CONFIG", "");
    return cfg;
}

//////////////////////////////////////////// Server ////////////////////////////////////////////

class Server::Impl {
public:
    ServerConfig config;
    ToolRegistry registry;
    ContextManager contexts;
    ProtocolHandler handler;
    std::vector<std::unique_ptr<ITransport>> transports;
    std::atomic<bool> running{false};

    std::mutex inflightMutex;
    std::condition_variable inflightCv;
    std::size_t inflight{0};

    Impl(const ServerConfig& cfg, std::shared_ptr<IContextStore> store, std::shared_ptr<IGenerationProvider> provider)
        : config(cfg),
          contexts(std::move(store), cfg.contextOptions),
          handler(registry, contexts, ProtocolHandlerOptions{cfg.serverInfo, cfg.sessionlessPolicy, cfg.recordResponses}) {
        RegisterDefaultTools(registry, std::move(provider));
    }

    struct InflightGuard {
        Impl* impl;
        explicit InflightGuard(Impl* i) : impl(i) {
            std::lock_guard<std::mutex> lk(impl->inflightMutex);
            ++impl->inflight;
        }
        ~InflightGuard() {
            std::lock_guard<std::mutex> lk(impl->inflightMutex);
            if (--impl->inflight == 0) impl->inflightCv.notify_all();
        }
    };

    void wire(ITransport& t) {
        const std::string name = t.Name();
        t.SetRequestHandler([this](const JSONRPCRequest& req, const RequestContext& ctx) {
            InflightGuard guard(this);
            return handler.Handle(req, ctx);
        });
        t.SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n, const RequestContext& ctx) {
            if (n) handler.HandleNotification(*n, ctx);
        });
        t.SetErrorHandler([name](const std::string& err) {
            LOG_ERROR("Transport {} error: {}", name, err);
        });
    }

    void stopTransports() {
        for (auto& t : transports) {
            try {
                t->Stop().get();
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to stop transport {}: {}", t->Name(), e.what());
            }
        }
    }

    void waitForInflight() {
        std::unique_lock<std::mutex> lk(inflightMutex);
        if (inflight > 0) {
            LOG_INFO("Waiting for {} in-flight requests", inflight);
        }
        inflightCv.wait(lk, [this]() { return inflight == 0; });
    }
};

Server::Server(const ServerConfig& config)
    : Server(config, std::make_shared<FileContextStore>(config.contextDir),
             MakeGenerationProvider(config.generationUrl, config.generationTimeoutMs)) {}

Server::Server(const ServerConfig& config, std::shared_ptr<IContextStore> store,
               std::shared_ptr<IGenerationProvider> provider)
    : pImpl(std::make_unique<Impl>(config, std::move(store), std::move(provider))) {}

Server::~Server() {
    if (pImpl->running.load()) {
        try {
            Stop().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Error while stopping server: {}", e.what());
        }
    }
}

void Server::AddTransport(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("Server::AddTransport: transport is null");
    }
    if (pImpl->running.load()) {
        throw std::logic_error("Server::AddTransport: server already running");
    }
    pImpl->wire(*transport);
    LOG_INFO("Added transport: {}", transport->Name());
    pImpl->transports.push_back(std::move(transport));
}

std::future<void> Server::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->running.exchange(true)) {
        ready.set_value();
        return fut;
    }
    if (pImpl->transports.empty()) {
        LOG_WARN("Server started without transports");
    }
    pImpl->contexts.Start();
    for (std::size_t i = 0; i < pImpl->transports.size(); ++i) {
        try {
            pImpl->transports[i]->Start().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to start transport {}: {}", pImpl->transports[i]->Name(), e.what());
            for (std::size_t j = 0; j < i; ++j) {
                try {
                    pImpl->transports[j]->Stop().get();
                } catch (const std::exception& se) {
                    LOG_ERROR("Failed to stop transport {}: {}", pImpl->transports[j]->Name(), se.what());
                }
            }
            pImpl->contexts.Stop();
            pImpl->running.store(false);
            ready.set_exception(std::current_exception());
            return fut;
        }
    }
    LOG_INFO("{} {} started with {} transport(s) and {} tool(s)", pImpl->config.serverInfo.name,
             pImpl->config.serverInfo.version, pImpl->transports.size(), pImpl->registry.Count());
    ready.set_value();
    return fut;
}

std::future<void> Server::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    if (!pImpl->running.exchange(false)) {
        done.set_value();
        return fut;
    }
    LOG_INFO("Stopping server");
    pImpl->stopTransports();
    pImpl->waitForInflight();
    pImpl->contexts.Stop();
    LOG_INFO("Server stopped");
    done.set_value();
    return fut;
}

bool Server::IsRunning() const {
    return pImpl->running.load();
}

std::size_t Server::Broadcast(const JSONRPCNotification& notification) {
    const std::string json = notification.Serialize();
    std::size_t delivered = 0;
    for (auto& t : pImpl->transports) {
        if (t->IsRunning()) delivered += t->SendMessage(json);
    }
    LOG_DEBUG("Broadcast {} to {} client(s)", notification.method, delivered);
    return delivered;
}

JSONValue Server::GetStatus() const {
    JSONValue::Array transports;
    for (const auto& t : pImpl->transports) {
        JSONValue::Object o;
        o["name"] = std::make_shared<JSONValue>(t->Name());
        o["running"] = std::make_shared<JSONValue>(t->IsRunning());
        o["clients"] = std::make_shared<JSONValue>(static_cast<int64_t>(t->ConnectedClients()));
        transports.push_back(std::make_shared<JSONValue>(std::move(o)));
    }
    std::size_t inflight = 0;
    {
        std::lock_guard<std::mutex> lk(pImpl->inflightMutex);
        inflight = pImpl->inflight;
    }
    JSONValue::Object server;
    server["name"] = std::make_shared<JSONValue>(pImpl->config.serverInfo.name);
    server["version"] = std::make_shared<JSONValue>(pImpl->config.serverInfo.version);

    JSONValue::Object status;
    status["running"] = std::make_shared<JSONValue>(pImpl->running.load());
    status["server"] = std::make_shared<JSONValue>(std::move(server));
    status["transports"] = std::make_shared<JSONValue>(std::move(transports));
    status["tools"] = std::make_shared<JSONValue>(pImpl->registry.Stats());
    status["contexts"] = std::make_shared<JSONValue>(pImpl->contexts.Stats());
    status["inflight_requests"] = std::make_shared<JSONValue>(static_cast<int64_t>(inflight));
    return JSONValue{status};
}

bool Server::HealthCheck() const {
    if (!pImpl->running.load() || pImpl->registry.Count() == 0) {
        return false;
    }
    for (const auto& t : pImpl->transports) {
        if (!t->IsRunning()) return false;
    }
    return true;
}

ToolRegistry& Server::Tools() { return pImpl->registry; }
ContextManager& Server::Contexts() { return pImpl->contexts; }
ProtocolHandler& Server::Handler() { return pImpl->handler; }

} // namespace mcplease
