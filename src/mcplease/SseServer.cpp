//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SseServer.cpp
// Purpose: Server-Sent-Events transport using Boost.Beast coroutines (TLS 1.3 only for sses://)
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcplease/JSONRPCTypes.h"
#include "mcplease/SseServer.hpp"
#include "detail/MessageDispatch.hpp"
#include "detail/NetUtil.hpp"
#include "detail/OutboundQueue.hpp"
#include "detail/TlsContext.hpp"

namespace mcplease {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
std::string eventFrame(const std::string& json) {
    std::string frame;
    frame.reserve(json.size() + 8);
    frame.append("data: ").append(json).append("\n\n");
    return frame;
}
} // namespace

class SseServer::Impl {
public:
    SseServer::Options opts;
    std::atomic<bool> running{false};

    net::io_context ioc;
    net::thread_pool workers;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when endpoint.tls
    std::thread ioThread;
    std::atomic<unsigned short> boundPort{0};

    mutable std::mutex clientsMutex;
    std::unordered_map<std::string, std::shared_ptr<detail::OutboundQueue>> clients;

    auth::RateLimiter limiter;

    ITransport::RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;

    explicit Impl(const SseServer::Options& o)
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
            queue = std::move(it->second);
            clients.erase(it);
        }
        queue->Close();
        LOG_INFO("SseServer: client disconnected: {}", clientId);
    }

    void closeAllClients() {
        std::unordered_map<std::string, std::shared_ptr<detail::OutboundQueue>> snapshot;
        {
            std::lock_guard<std::mutex> lk(clientsMutex);
            snapshot.swap(clients);
        }
        for (auto& [id, queue] : snapshot) {
            queue->Close();
        }
    }

    bool pushTo(const std::string& clientId, const std::string& json) {
        std::shared_ptr<detail::OutboundQueue> queue;
        {
            std::lock_guard<std::mutex> lk(clientsMutex);
            auto it = clients.find(clientId);
            if (it == clients.end()) return false;
            queue = it->second;
        }
        if (queue->Push(json)) return true;
        LOG_WARN("SseServer: client {} backlog full or closed; removing", clientId);
        removeClient(clientId);
        return false;
    }

    net::awaitable<detail::DispatchOutcome> dispatchOnWorker(std::string body, RequestContext ctx,
                                                             detail::MethodFilter filter) {
        co_return detail::DispatchMessage(body, ctx, requestHandler, notificationHandler, filter);
    }

    template <class Stream>
    net::awaitable<void> writeResponse(Stream& stream, unsigned version, http::status status,
                                       std::string contentType, std::string body) {
        http::response<http::string_body> res{status, version};
        res.set(http::field::content_type, contentType);
        res.set(http::field::access_control_allow_origin, "*");
        res.keep_alive(false);
        res.body() = std::move(body);
        res.prepare_payload();
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    template <class Stream>
    net::awaitable<void> streamEvents(Stream& stream, unsigned version) {
        http::response<http::empty_body> res{http::status::ok, version};
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.set(http::field::access_control_allow_origin, "*");
        res.keep_alive(true);
        http::response_serializer<http::empty_body> sr{res};
        co_await http::async_write_header(stream, sr, net::use_awaitable);

        const std::string clientId = detail::MakeClientId("client_");
        auto queue = std::make_shared<detail::OutboundQueue>(ioc.get_executor(), opts.maxQueuedMessages);
        {
            std::lock_guard<std::mutex> lk(clientsMutex);
            clients[clientId] = queue;
        }
        LOG_INFO("SseServer: client connected: {}", clientId);

        try {
            JSONValue::Object hello;
            hello["type"] = std::make_shared<JSONValue>("connected");
            hello["client_id"] = std::make_shared<JSONValue>(clientId);
            const std::string greeting = eventFrame(SerializeJSONValue(JSONValue(std::move(hello))));
            co_await net::async_write(stream, net::buffer(greeting), net::use_awaitable);

            const std::string keepalive = eventFrame("{\"type\":\"keepalive\"}");
            const auto interval = std::chrono::milliseconds(std::max<uint64_t>(opts.keepaliveIntervalMs, 10));
            while (running.load()) {
                while (auto msg = queue->Pop()) {
                    const std::string frame = eventFrame(*msg);
                    co_await net::async_write(stream, net::buffer(frame), net::use_awaitable);
                }
                if (queue->IsClosed()) break;
                const bool woke = co_await queue->Wait(interval);
                if (!woke && running.load()) {
                    co_await net::async_write(stream, net::buffer(keepalive), net::use_awaitable);
                }
            }
        } catch (const std::exception& e) {
            LOG_WARN("SseServer: stream write to {} failed: {}", clientId, e.what());
        }
        removeClient(clientId);
    }

    template <class Stream>
    net::awaitable<void> serve(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        const auto [path, query] = detail::SplitTarget(req.target());

        auth::TokenInfo token;
        if (opts.access.verifier && (path == opts.ssePath || path == opts.messagePath)) {
            auto check = auth::CheckBearerAuth(detail::AuthorizationOf(req, query), *opts.access.verifier, token);
            if (!check.ok) {
                LOG_WARN("SseServer: rejected {} {} from {}: {}", detail::ToString(req.method_string()), path,
                         detail::RemoteAddress(stream), check.errorMessage);
                auto res = detail::UnauthorizedResponse(req.version(), check.errorMessage);
                co_await http::async_write(stream, res, net::use_awaitable);
                co_return;
            }
        }

        if (path == opts.ssePath) {
            if (req.method() != http::verb::get) {
                co_await writeResponse(stream, req.version(), http::status::method_not_allowed,
                                       "application/json", "{\"error\":\"GET required\"}");
                co_return;
            }
            co_await streamEvents(stream, req.version());
            co_return;
        }

        if (path == opts.messagePath) {
            if (req.method() != http::verb::post) {
                co_await writeResponse(stream, req.version(), http::status::method_not_allowed,
                                       "application/json", "{\"error\":\"POST required\"}");
                co_return;
            }
            if (!running.load()) {
                co_await writeResponse(stream, req.version(), http::status::service_unavailable,
                                       "application/json", "{\"error\":\"Server stopping\"}");
                co_return;
            }
            const std::string peer = detail::RemoteAddress(stream);
            if (!limiter.Allow(peer)) {
                LOG_WARN("SseServer: rate limit exceeded for {}", peer);
                co_await writeResponse(stream, req.version(), http::status::too_many_requests, "application/json",
                                       auth::ErrorReply(JSONRPCErrorCodes::RateLimitExceeded, "Rate limit exceeded",
                                                        "Rate limit exceeded for " + peer));
                co_return;
            }
            detail::MethodFilter filter;
            if (opts.access.verifier) {
                filter = [token](const std::string& method) { return auth::IsMethodAllowed(token, method); };
            }
            RequestContext ctx;
            ctx.transport = "sse";
            ctx.clientId = detail::ToString(req["X-Client-Id"]);
            if (ctx.clientId.empty()) ctx.clientId = detail::QueryParam(query, "client_id");
            ctx.sessionId = detail::ToString(req["Mcp-Session-Id"]);
            ctx.receivedAt = std::chrono::steady_clock::now();

            detail::DispatchOutcome outcome =
                co_await net::co_spawn(workers.get_executor(), dispatchOnWorker(req.body(), ctx, std::move(filter)),
                                       net::use_awaitable);
            if (outcome.malformed) {
                co_await writeResponse(stream, req.version(), http::status::bad_request,
                                       "application/json", "{\"error\":\"Invalid JSON\"}");
            } else if (outcome.forbidden) {
                co_await writeResponse(stream, req.version(), http::status::forbidden,
                                       "application/json", outcome.reply.value_or(""));
            } else if (outcome.reply) {
                co_await writeResponse(stream, req.version(), http::status::ok,
                                       "application/json", std::move(*outcome.reply));
            } else {
                co_await writeResponse(stream, req.version(), http::status::accepted, "application/json", "");
            }
            co_return;
        }

        co_await writeResponse(stream, req.version(), http::status::not_found,
                               "application/json", "{\"error\":\"Not found\"}");
    }

    net::awaitable<void> session(tcp::socket socket) {
        try {
            if (sslCtx) {
                ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
                co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
                co_await serve(tls);
                detail::CloseStream(tls);
            } else {
                co_await serve(socket);
                detail::CloseStream(socket);
            }
        } catch (const std::exception& e) {
            // Peers closing mid-request are routine for an HTTP server
            LOG_DEBUG("SseServer: session ended: {}", e.what());
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
                LOG_ERROR("SseServer: accept error: {}", e.what());
                setError(std::string("SseServer accept error: ") + e.what());
            } else {
                LOG_DEBUG("SseServer: accept loop ended during shutdown: {}", e.what());
            }
        }
    }
};

SseServer::SseServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

SseServer::~SseServer() {
    if (pImpl->running.load()) {
        Stop().wait();
    }
}

std::future<void> SseServer::Start() {
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
        LOG_ERROR("SseServer: failed to listen on {}:{}: {}", pImpl->opts.endpoint.address, pImpl->opts.endpoint.port, e.what());
        pImpl->setError(std::string("SseServer listen error: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }

    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("SseServer: I/O loop error: {}", e.what());
            pImpl->setError(e.what());
        }
    });
    LOG_INFO("SseServer listening on {}:{} ({}{}, auth {})", pImpl->opts.endpoint.address, pImpl->boundPort.load(),
             pImpl->opts.endpoint.tls ? "https" : "http", pImpl->opts.ssePath,
             pImpl->opts.access.verifier ? "bearer" : "off");
    ready.set_value();
    return fut;
}

std::future<void> SseServer::Stop() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    if (!pImpl->running.exchange(false)) {
        done.set_value();
        return fut;
    }
    LOG_INFO("Stopping SseServer");
    auto closed = std::make_shared<std::promise<void>>();
    auto closedFut = closed->get_future();
    net::post(pImpl->ioc, [impl = pImpl.get(), closed]() {
        boost::system::error_code ec;
        if (impl->acceptor) { impl->acceptor->close(ec); }
        impl->closeAllClients();
        closed->set_value();
    });
    if (closedFut.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
        LOG_WARN("SseServer: I/O loop did not acknowledge shutdown in time");
    }
    // Let in-flight handlers finish so their context updates complete
    pImpl->workers.join();
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

bool SseServer::IsRunning() const { return pImpl->running.load(); }
std::string SseServer::Name() const { return "sse"; }

std::size_t SseServer::ConnectedClients() const {
    std::lock_guard<std::mutex> lk(pImpl->clientsMutex);
    return pImpl->clients.size();
}

std::vector<std::string> SseServer::ClientIds() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lk(pImpl->clientsMutex);
    ids.reserve(pImpl->clients.size());
    for (const auto& kv : pImpl->clients) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t SseServer::SendMessage(const std::string& json) {
    std::size_t delivered = 0;
    for (const auto& id : ClientIds()) {
        if (pImpl->pushTo(id, json)) ++delivered;
    }
    return delivered;
}

bool SseServer::SendToClient(const std::string& clientId, const std::string& json) {
    return pImpl->pushTo(clientId, json);
}

unsigned short SseServer::BoundPort() const { return pImpl->boundPort.load(); }

void SseServer::SetRequestHandler(RequestHandler handler) { pImpl->requestHandler = std::move(handler); }
void SseServer::SetNotificationHandler(NotificationHandler handler) { pImpl->notificationHandler = std::move(handler); }
void SseServer::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }

std::unique_ptr<ITransport> SseServerFactory::CreateTransport(const std::string& config) {
    SseServer::Options opts;
    opts.endpoint = ParseEndpointUri(config, "sse", "sses", "8000");
    auto parseCount = [](const std::string& s, uint64_t& out) -> bool {
        if (s.empty() || s.size() > 12) return false;
        if (!std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return false;
        out = std::stoull(s);
        return true;
    };
    uint64_t v = 0;
    auto it = opts.endpoint.params.find("keepalive_ms");
    if (it != opts.endpoint.params.end() && parseCount(it->second, v)) {
        opts.keepaliveIntervalMs = v;
    }
    it = opts.endpoint.params.find("workers");
    if (it != opts.endpoint.params.end() && parseCount(it->second, v)) {
        opts.workerThreads = static_cast<std::size_t>(std::max<uint64_t>(1, v));
    }
    opts.access = auth::AccessPolicyFromEnvironment();
    return std::make_unique<SseServer>(opts);
}

} // namespace mcplease
