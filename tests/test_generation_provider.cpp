//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_generation_provider.cpp
// Purpose: GoogleTests for generation backends: request/response bodies, HTTP loopback, timeouts
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "mcplease/GenerationProvider.h"
#include "mcplease/JSONRPCTypes.h"

using namespace mcplease;
using namespace std::chrono_literals;

namespace {

namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

// Single-shot HTTP server that records the request body and replies with a fixed status/body.
class OneShotHttpServer {
public:
    OneShotHttpServer(http::status status, std::string body)
        : acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)), status(status), body(std::move(body)) {
        port = acceptor.local_endpoint().port();
        worker = std::thread([this]() { serve(); });
    }
    ~OneShotHttpServer() { Join(); }

    void Join() {
        if (worker.joinable()) worker.join();
    }

    unsigned short Port() const { return port; }
    // Valid after the exchange completed.
    std::string Target() { Join(); return target; }
    std::string RequestBody() { Join(); return requestBody; }

private:
    void serve() {
        boost::system::error_code ec;
        tcp::socket sock(ioc);
        acceptor.accept(sock, ec);
        if (ec) return;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(sock, buffer, req, ec);
        if (ec) return;
        target = std::string(req.target());
        requestBody = req.body();
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::content_type, "application/json");
        res.body() = body;
        res.prepare_payload();
        http::write(sock, res, ec);
        sock.shutdown(tcp::socket::shutdown_both, ec);
    }

    net::io_context ioc;
    tcp::acceptor acceptor;
    http::status status;
    std::string body;
    unsigned short port{0};
    std::thread worker;
    std::string target;
    std::string requestBody;
};

class SlowProvider : public IGenerationProvider {
public:
    explicit SlowProvider(std::chrono::milliseconds delay) : delay(delay) {}
    GenerationResult Generate(const GenerationRequest&) override {
        std::this_thread::sleep_for(delay);
        return GenerationResult::Success("late");
    }
    bool IsAvailable() const override { return true; }
    std::string Name() const override { return "slow"; }

private:
    std::chrono::milliseconds delay;
};

} // namespace

TEST(GenerationProvider, NullProviderIsUnavailable) {
    NullGenerationProvider p;
    EXPECT_FALSE(p.IsAvailable());
    EXPECT_EQ(p.Name(), "none");
    EXPECT_FALSE(p.Generate(GenerationRequest{}).ok);
}

TEST(GenerationProvider, RequestBodyShape) {
    GenerationRequest req;
    req.prompt = "complete me";
    req.maxTokens = 300;
    req.temperature = 0.5;
    auto doc = ParseJSONValue(HttpGenerationProvider::BuildRequestBody(req));
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(GetStringMember(*doc, "prompt").value_or(""), "complete me");
    EXPECT_EQ(GetIntMember(*doc, "n_predict").value_or(0), 300);
    const JSONValue* stream = FindMember(*doc, "stream");
    ASSERT_NE(stream, nullptr);
    EXPECT_FALSE(std::get<bool>(stream->value));
}

TEST(GenerationProvider, ParseResponseBody) {
    auto ok = HttpGenerationProvider::ParseResponseBody(R"({"content":"return n","stop":true})");
    EXPECT_TRUE(ok.ok);
    EXPECT_EQ(ok.text, "return n");
    EXPECT_FALSE(HttpGenerationProvider::ParseResponseBody("not json").ok);
    EXPECT_FALSE(HttpGenerationProvider::ParseResponseBody(R"({"text":"x"})").ok);
}

TEST(GenerationProvider, HttpLoopbackSuccess) {
    OneShotHttpServer server(http::status::ok, R"j({"content":"    return fib(n-1) + fib(n-2)"})j");
    HttpGenerationProvider::Options opts;
    opts.url = "http://127.0.0.1:" + std::to_string(server.Port());
    HttpGenerationProvider p(opts);
    EXPECT_TRUE(p.IsAvailable());

    GenerationRequest req;
    req.prompt = "def fib(n):";
    auto res = p.Generate(req);
    ASSERT_TRUE(res.ok) << res.error;
    EXPECT_EQ(res.text, "    return fib(n-1) + fib(n-2)");
    EXPECT_EQ(server.Target(), "/completion");
    auto sent = ParseJSONValue(server.RequestBody());
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(GetStringMember(*sent, "prompt").value_or(""), "def fib(n):");
}

TEST(GenerationProvider, HttpErrorStatusIsFailure) {
    OneShotHttpServer server(http::status::internal_server_error, "{}");
    HttpGenerationProvider::Options opts;
    opts.url = "http://127.0.0.1:" + std::to_string(server.Port()) + "/v1/complete";
    HttpGenerationProvider p(opts);
    auto res = p.Generate(GenerationRequest{});
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.error, "HTTP 500");
    EXPECT_EQ(server.Target(), "/v1/complete");
}

TEST(GenerationProvider, HttpConnectFailureIsFailure) {
    unsigned short freePort = 0;
    {
        net::io_context ioc;
        tcp::acceptor a(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        freePort = a.local_endpoint().port();
    }
    HttpGenerationProvider::Options opts;
    opts.url = "http://127.0.0.1:" + std::to_string(freePort);
    opts.connectTimeoutMs = 500;
    HttpGenerationProvider p(opts);
    EXPECT_FALSE(p.Generate(GenerationRequest{}).ok);
}

TEST(GenerationProvider, TimeoutProviderGivesUp) {
    TimeoutGenerationProvider p(std::make_shared<SlowProvider>(500ms), 50);
    EXPECT_TRUE(p.IsAvailable());
    EXPECT_EQ(p.Name(), "slow");
    const auto start = std::chrono::steady_clock::now();
    auto res = p.Generate(GenerationRequest{});
    EXPECT_FALSE(res.ok);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 400ms);

    TimeoutGenerationProvider fast(std::make_shared<SlowProvider>(1ms), 2000);
    auto ok = fast.Generate(GenerationRequest{});
    EXPECT_TRUE(ok.ok);
    EXPECT_EQ(ok.text, "late");
}

TEST(GenerationProvider, Factory) {
    EXPECT_EQ(MakeGenerationProvider("", 1000)->Name(), "none");
    auto remote = MakeGenerationProvider("http://127.0.0.1:8080", 1000);
    EXPECT_EQ(remote->Name(), "http");
    EXPECT_TRUE(remote->IsAvailable());
    EXPECT_THROW(MakeGenerationProvider("ftp://example.com", 1000), std::invalid_argument);
    EXPECT_THROW(TimeoutGenerationProvider(nullptr, 10), std::invalid_argument);
}
