//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketServer.cpp
// Purpose: WebSocket transport using Boost.Beast coroutines (TLS 1.3 only for wss://)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "logging/Logger.h"
#include "mcplease/JSONRPCTypes.h"
#include "mcplease/WebSocketServer.hpp"
#include "detail/MessageDispatch.hpp"
#include "detail/NetUtil.hpp"
#include "detail/OutboundQueue.hpp"
#include "detail/TlsContext.hpp"

namespace mcplease {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

template <class NextLayer>
struct WsConnection {
    websocket::stream<NextLayer> ws;
    std::shared_ptr<detail::OutboundQueue> queue;
    std::string id;

    template <class... Args>
    explicit WsConnection(Args&&... args) : ws(std::forward<Args>(args)...) {}
};

// What the client map keeps per connection, independent of the stream type
struct ClientEntry {
    std::shared_ptr<detail::OutboundQueue> queue;
};

} // namespace

class WebSocketServer::Impl {
public:
    WebSocketServer::Options opts;
    std::atomic<bool> running{false};

    net::io_context ioc;
    net::thread_pool workers;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx;
    std::thread ioThread;
    std::atomic<unsigned short> boundPort{0};

    mutable std::mutex clientsMutex;
    std::unordered_map<std::string, ClientEntry> clients;

    auth::RateLimiter limiter;

    ITransport::RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;

    explicit Impl(const WebSocketServer::Options& o)
        : opts(o), workers(std::max<std::size_t>(1, o.workerThreads)), limiter(o.access.rateLimitPerMinute) {
        if (opts.endpoint.tls) {
            sslCtx = detail::MakeServerTlsContext(opts.endpoint.certFile, opts.endpoint.keyFile);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
        workers.stop();
        workers.join();
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    void removeClient(const std::string& clientId) {
        std::shared_ptr<detail::OutboundQueue> queue;
        {
            std::lock_guard<std::mutex> lk(clientsMutex);
            auto it = clients.find(clientId);
            if (it == clients.end()) return;
            queue = std::move(it->second.queue);
            clients.erase(it);
        }
        queue->Close();
        LOG_INFO("WebSocketServer: client removed: {}", clientId);
    }

    bool pushTo(const std::string& clientId, const std::string& json) {
        std::shared_ptr<detail::OutboundQueue> queue;
        {
            std::lock_guard<std::mutex> lk(clientsMutex);
            auto it = clients.find(clientId);
            if (it == clients.end()) return false;
            queue = it->second.queue;
        }
        if (queue->Push(json)) return true;
        LOG_WARN("WebSocketServer: client {} backlog full or closed; removing", clientId);
        removeClient(clientId);
        return false;
    }

    net::awaitable<detail::DispatchOutcome> dispatchOnWorker(std::string text, RequestContext ctx,
                                                             detail::MethodFilter filter) {
        co_return detail::DispatchMessage(text, ctx, requestHandler, notificationHandler, filter);
    }

    net::awaitable<void> handleInbound(std::string clientId, std::string text, RequestContext ctx,
                                       detail::MethodFilter filter) {
        try {
            detail::DispatchOutcome outcome =
                co_await net::co_spawn(workers.get_executor(), dispatchOnWorker(std::move(text), ctx, std::move(filter)),
                                       net::use_awaitable);
            if (outcome.reply) {
                (void)pushTo(clientId, *outcome.reply);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("WebSocketServer: dispatch failed for {}: {}", clientId, e.what());
        }
    }

    template <class NextLayer>
    net::awaitable<void> writerLoop(std::shared_ptr<WsConnection<NextLayer>> conn) {
        try {
            for (;;) {
                while (auto msg = conn->queue->Pop()) {
                    conn->ws.text(true);
                    co_await conn->ws.async_write(net::buffer(*msg), net::use_awaitable);
                }
                if (conn->queue->IsClosed()) break;
                co_await conn->queue->Wait(std::chrono::hours(1));
            }
            if (conn->ws.is_open()) {
                boost::system::error_code ec;
                co_await conn->ws.async_close(websocket::close_code::normal,
                                              net::redirect_error(net::use_awaitable, ec));
            }
        } catch (const std::exception& e) {
            LOG_WARN("WebSocketServer: write to {} failed: {}", conn->id, e.what());
            removeClient(conn->id);
        }
    }

    template <class NextLayer>
    net::awaitable<void> runConnection(std::shared_ptr<WsConnection<NextLayer>> conn) {
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(conn->ws.next_layer(), buffer, req, net::use_awaitable);
        const auto [path, query] = detail::SplitTarget(req.target());
        const std::string peer = detail::RemoteAddress(conn->ws);

        detail::MethodFilter filter;
        if (opts.access.verifier) {
            auth::TokenInfo token;
            auto check = auth::CheckBearerAuth(detail::AuthorizationOf(req, query), *opts.access.verifier, token);
            if (!check.ok) {
                LOG_WARN("WebSocketServer: rejected upgrade from {}: {}", peer, check.errorMessage);
                auto res = detail::UnauthorizedResponse(req.version(), check.errorMessage);
                co_await http::async_write(conn->ws.next_layer(), res, net::use_awaitable);
                co_return;
            }
            filter = [token](const std::string& method) { return auth::IsMethodAllowed(token, method); };
        }

        if (!websocket::is_upgrade(req)) {
            http::response<http::string_body> res{http::status::upgrade_required, req.version()};
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = "{\"error\":\"WebSocket upgrade required\"}";
            res.prepare_payload();
            co_await http::async_write(conn->ws.next_layer(), res, net::use_awaitable);
            co_return;
        }
        conn->ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        co_await conn->ws.async_accept(req, net::use_awaitable);

        std::string sessionId = detail::ToString(req["Mcp-Session-Id"]);
        if (sessionId.empty()) sessionId = detail::QueryParam(query, "session_id");

        conn->id = detail::MakeClientId("ws_client_");
        conn->queue = std::make_shared<detail::OutboundQueue>(ioc.get_executor(), opts.maxQueuedMessages);
        {
            std::lock_guard<std::mutex> lk(clientsMutex);
            clients[conn->id] = ClientEntry{conn->queue};
        }
        LOG_INFO("WebSocketServer: client connected: {} (path {})", conn->id, path);

        JSONValue::Object hello;
        hello["type"] = std::make_shared<JSONValue>("connected");
        hello["client_id"] = std::make_shared<JSONValue>(conn->id);
        (void)conn->queue->Push(SerializeJSONValue(JSONValue(std::move(hello))));
        net::co_spawn(ioc, writerLoop(conn), net::detached);

        try {
            for (;;) {
                beast::flat_buffer frame;
                co_await conn->ws.async_read(frame, net::use_awaitable);
                if (!running.load()) break;
                if (!limiter.Allow(peer)) {
                    LOG_WARN("WebSocketServer: rate limit exceeded for {} ({})", conn->id, peer);
                    (void)pushTo(conn->id, auth::ErrorReply(JSONRPCErrorCodes::RateLimitExceeded, "Rate limit exceeded",
                                                            "Rate limit exceeded for " + peer));
                    continue;
                }
                RequestContext ctx;
                ctx.transport = "websocket";
                ctx.clientId = conn->id;
                ctx.sessionId = sessionId;
                ctx.receivedAt = std::chrono::steady_clock::now();
                net::co_spawn(ioc, handleInbound(conn->id, beast::buffers_to_string(frame.data()), std::move(ctx), filter),
                              net::detached);
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                LOG_INFO("WebSocketServer: client {} closed the connection", conn->id);
            } else {
                LOG_WARN("WebSocketServer: client {} disconnected with error: {}", conn->id, e.what());
            }
        }
        removeClient(conn->id);
    }

    net::awaitable<void> session(tcp::socket socket) {
        try {
            if (sslCtx) {
                auto conn = std::make_shared<WsConnection<ssl::stream<tcp::socket>>>(std::move(socket), *sslCtx);
                co_await conn->ws.next_layer().async_handshake(ssl::stream_base::server, net::use_awaitable);
                co_await runConnection(conn);
            } else {
                auto conn = std::make_shared<WsConnection<tcp::socket>>(std::move(socket));
                co_await runConnection(conn);
            }
        } catch (const std::exception& e) {
            LOG_DEBUG("WebSocketServer: session ended: {}", e.what());
        }
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(ioc, session(std::move(socket)), net::detached);
            }
        } catch (const std::exception& e) {
            if (running.load()) {
                LOG_ERROR("WebSocketServer: accept error: {}", e.what());
                setError(std::string("WebSocketServer accept error: ") + e.what());
            } else {
                LOG_DEBUG("WebSocketServer: accept loop ended during shutdown: {}", e.what());
            }
        }
    }
};

WebSocketServer::WebSocketServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

WebSocketServer::~WebSocketServer() {
    if (pImpl->running.load()) {
        Stop().wait();
    }
}

std::future<void> WebSocketServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        tcp::resolver resolver(pImpl->ioc);
        auto results = resolver.resolve(pImpl->opts.endpoint.address, pImpl->opts.endpoint.port);
        tcp::endpoint ep = *results.begin();
        pImpl->acceptor = std::make_unique<tcp::acceptor>(pImpl->ioc);
        pImpl->acceptor->open(ep.protocol());
        pImpl->acceptor->set_option(tcp::acceptor::reuse_address(true));
        pImpl->acceptor->bind(ep);
        pImpl->acceptor->listen();
        pImpl->boundPort = pImpl->acceptor->local_endpoint().port();
    } catch (const std::exception& e) {
        LOG_ERROR("WebSocketServer: failed to listen on {}:{}: {}", pImpl->opts.endpoint.address, pImpl->opts.endpoint.port, e.what());
        pImpl->setError(std::string("WebSocketServer listen error: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }

    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("WebSocketServer: I/O loop error: {}", e.what());
            pImpl->setError(e.what());
        }
    });
    LOG_INFO("WebSocketServer listening on {}:{} ({}, auth {})", pImpl->opts.endpoint.address, pImpl->boundPort.load(),
             pImpl->opts.endpoint.tls ? "wss" : "ws", pImpl->opts.access.verifier ? "bearer" : "off");
    ready.set_value();
    return fut;
}

std::future<void> WebSocketServer::Stop() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    if (!pImpl->running.exchange(false)) {
        done.set_value();
        return fut;
    }
    LOG_INFO("Stopping WebSocketServer");
    auto closed = std::make_shared<std::promise<void>>();
    auto closedFut = closed->get_future();
    net::post(pImpl->ioc, [impl = pImpl.get(), closed]() {
        boost::system::error_code ec;
        if (impl->acceptor) { impl->acceptor->close(ec); }
        std::unordered_map<std::string, ClientEntry> snapshot;
        {
            std::lock_guard<std::mutex> lk(impl->clientsMutex);
            snapshot.swap(impl->clients);
        }
        for (auto& [id, entry] : snapshot) {
            entry.queue->Close();
        }
        closed->set_value();
    });
    if (closedFut.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
        LOG_WARN("WebSocketServer: I/O loop did not acknowledge shutdown in time");
    }
    pImpl->workers.join();
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

bool WebSocketServer::IsRunning() const { return pImpl->running.load(); }
std::string WebSocketServer::Name() const { return "websocket"; }

std::size_t WebSocketServer::ConnectedClients() const {
    std::lock_guard<std::mutex> lk(pImpl->clientsMutex);
    return pImpl->clients.size();
}

std::vector<std::string> WebSocketServer::ClientIds() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lk(pImpl->clientsMutex);
    ids.reserve(pImpl->clients.size());
    for (const auto& kv : pImpl->clients) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t WebSocketServer::SendMessage(const std::string& json) {
    std::size_t delivered = 0;
    for (const auto& id : ClientIds()) {
        if (pImpl->pushTo(id, json)) ++delivered;
    }
    return delivered;
}

bool WebSocketServer::SendToClient(const std::string& clientId, const std::string& json) {
    return pImpl->pushTo(clientId, json);
}

unsigned short WebSocketServer::BoundPort() const { return pImpl->boundPort.load(); }

void WebSocketServer::SetRequestHandler(RequestHandler handler) { pImpl->requestHandler = std::move(handler); }
void WebSocketServer::SetNotificationHandler(NotificationHandler handler) { pImpl->notificationHandler = std::move(handler); }
void WebSocketServer::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }

std::unique_ptr<ITransport> WebSocketServerFactory::CreateTransport(const std::string& config) {
    WebSocketServer::Options opts;
    opts.endpoint = ParseEndpointUri(config, "ws", "wss", "8001");
    auto it = opts.endpoint.params.find("workers");
    if (it != opts.endpoint.params.end() && !it->second.empty() && it->second.size() < 6 &&
        std::all_of(it->second.begin(), it->second.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
        opts.workerThreads = std::max<std::size_t>(1, std::stoul(it->second));
    }
    opts.access = auth::AccessPolicyFromEnvironment();
    return std::make_unique<WebSocketServer>(opts);
}

} // namespace mcplease
