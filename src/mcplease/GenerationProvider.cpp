//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GenerationProvider.cpp
// Purpose: Generation backends (null, llama.cpp-style HTTP, deadline wrapper)
//==========================================================================================================

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcplease/GenerationProvider.h"
#include "mcplease/JSONRPCTypes.h"

namespace mcplease {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

GenerationResult NullGenerationProvider::Generate(const GenerationRequest&) {
    return GenerationResult::Failure("no generation backend configured");
}

//////////////////////////////////////// HttpGenerationProvider ////////////////////////////////////////

namespace {
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

UrlParts parseUrl(const std::string& url) {
    UrlParts u;
    std::string rest = url;
    auto sep = rest.find("://");
    if (sep == std::string::npos) {
        u.scheme = "http";
    } else {
        u.scheme = rest.substr(0, sep);
        rest = rest.substr(sep + 3);
    }
    if (u.scheme != "http" && u.scheme != "https") {
        throw std::invalid_argument("unsupported generation URL scheme: " + u.scheme);
    }
    auto slash = rest.find('/');
    std::string hostPort = rest.substr(0, slash);
    u.path = slash == std::string::npos ? std::string("/completion") : rest.substr(slash);
    if (u.path == "/") u.path = "/completion";
    auto colon = hostPort.rfind(':');
    if (colon != std::string::npos && hostPort.find(']') == std::string::npos) {
        u.host = hostPort.substr(0, colon);
        u.port = hostPort.substr(colon + 1);
    } else {
        u.host = hostPort;
        u.port = u.scheme == "https" ? "443" : "80";
    }
    if (u.host.size() > 2 && u.host.front() == '[' && u.host.back() == ']') {
        u.host = u.host.substr(1, u.host.size() - 2);
    }
    if (u.host.empty()) {
        throw std::invalid_argument("generation URL has no host: " + url);
    }
    return u;
}
} // namespace

class HttpGenerationProvider::Impl {
public:
    HttpGenerationProvider::Options opts;
    UrlParts url;
    std::unique_ptr<ssl::context> sslCtx;

    explicit Impl(const HttpGenerationProvider::Options& o) : opts(o), url(parseUrl(o.url)) {
        if (url.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            if (!opts.caFile.empty()) {
                sslCtx->load_verify_file(opts.caFile);
            } else {
                sslCtx->set_default_verify_paths();
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }
    }

    http::request<http::string_body> makeRequest(const std::string& body) const {
        http::request<http::string_body> req{http::verb::post, url.path, 11};
        req.set(http::field::host, url.host);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    net::awaitable<http::response<http::string_body>> coPost(std::string body) {
        auto ex = co_await net::this_coro::executor;
        tcp::resolver resolver(ex);
        auto results = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);
        auto req = makeRequest(body);
        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        if (sslCtx) {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(ex, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                LOG_WARN("HttpGenerationProvider: failed to set SNI hostname {}", url.host);
            }
            (void)::SSL_set1_host(stream.native_handle(), url.host.c_str());
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.next_layer().socket().shutdown(tcp::socket::shutdown_both, ec);
        } else {
            boost::beast::tcp_stream stream(ex);
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);
            stream.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        co_return res;
    }
};

HttpGenerationProvider::HttpGenerationProvider(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HttpGenerationProvider::~HttpGenerationProvider() = default;

bool HttpGenerationProvider::IsAvailable() const {
    return !pImpl->opts.url.empty();
}

std::string HttpGenerationProvider::BuildRequestBody(const GenerationRequest& request) {
    JSONValue::Object o;
    o["prompt"] = std::make_shared<JSONValue>(request.prompt);
    o["n_predict"] = std::make_shared<JSONValue>(static_cast<int64_t>(request.maxTokens));
    o["temperature"] = std::make_shared<JSONValue>(request.temperature);
    o["stream"] = std::make_shared<JSONValue>(false);
    return SerializeJSONValue(JSONValue{o});
}

GenerationResult HttpGenerationProvider::ParseResponseBody(const std::string& body) {
    auto doc = ParseJSONValue(body);
    if (!doc.has_value()) {
        return GenerationResult::Failure("completion reply is not JSON");
    }
    auto content = GetStringMember(*doc, "content");
    if (!content.has_value()) {
        return GenerationResult::Failure("completion reply has no content");
    }
    return GenerationResult::Success(std::move(*content));
}

GenerationResult HttpGenerationProvider::Generate(const GenerationRequest& request) {
    FUNC_SCOPE();
    net::io_context ioc;
    auto fut = net::co_spawn(ioc, pImpl->coPost(BuildRequestBody(request)), net::use_future);
    ioc.run();
    http::response<http::string_body> res;
    try {
        res = fut.get();
    } catch (const std::exception& e) {
        LOG_WARN("HttpGenerationProvider: request to {}:{} failed: {}", pImpl->url.host, pImpl->url.port, e.what());
        return GenerationResult::Failure(e.what());
    }
    if (res.result() != http::status::ok) {
        LOG_WARN("HttpGenerationProvider: HTTP {} from {}", res.result_int(), pImpl->url.host);
        return GenerationResult::Failure("HTTP " + std::to_string(res.result_int()));
    }
    return ParseResponseBody(res.body());
}

//////////////////////////////////////// TimeoutGenerationProvider ////////////////////////////////////////

TimeoutGenerationProvider::TimeoutGenerationProvider(std::shared_ptr<IGenerationProvider> inner, unsigned int timeoutMs)
    : inner(std::move(inner)), timeoutMs(timeoutMs) {
    if (!this->inner) {
        throw std::invalid_argument("TimeoutGenerationProvider: inner provider is null");
    }
}

bool TimeoutGenerationProvider::IsAvailable() const { return inner->IsAvailable(); }
std::string TimeoutGenerationProvider::Name() const { return inner->Name(); }

GenerationResult TimeoutGenerationProvider::Generate(const GenerationRequest& request) {
    auto promise = std::make_shared<std::promise<GenerationResult>>();
    auto fut = promise->get_future();
    std::thread([provider = inner, promise, request]() {
        try {
            promise->set_value(provider->Generate(request));
        } catch (const std::exception& e) {
            promise->set_value(GenerationResult::Failure(e.what()));
        }
    }).detach();
    if (fut.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
        LOG_WARN("Generation timed out after {} ms", timeoutMs);
        return GenerationResult::Failure("generation timed out");
    }
    return fut.get();
}

std::shared_ptr<IGenerationProvider> MakeGenerationProvider(const std::string& url, unsigned int timeoutMs) {
    if (url.empty()) {
        LOG_INFO("No generation backend configured; tools use fallback responses");
        return std::make_shared<NullGenerationProvider>();
    }
    HttpGenerationProvider::Options opts;
    opts.url = url;
    opts.readTimeoutMs = timeoutMs;
    LOG_INFO("Generation backend: {} (timeout {} ms)", url, timeoutMs);
    return std::make_shared<TimeoutGenerationProvider>(std::make_shared<HttpGenerationProvider>(opts), timeoutMs);
}

} // namespace mcplease
