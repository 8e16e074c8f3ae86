//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: StdioTransport over pipes: line framing, malformed input, EOF, and an end-to-end server session
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/Server.h"
#include "mcplease/StdioTransport.hpp"

using namespace mcplease;
using namespace std::chrono_literals;

namespace {

// Pipes standing in for the client side of stdin/stdout.
class PipePair {
public:
    PipePair() {
        if (::pipe(toServer) != 0 || ::pipe(fromServer) != 0) {
            throw std::runtime_error("pipe() failed");
        }
    }
    ~PipePair() {
        CloseInput();
        for (int fd : {toServer[0], fromServer[0], fromServer[1]}) {
            if (fd >= 0) ::close(fd);
        }
    }

    StdioTransport::Options Options() const {
        StdioTransport::Options o;
        o.inFd = toServer[0];
        o.outFd = fromServer[1];
        return o;
    }

    void WriteLine(const std::string& line) {
        std::string data = line + "\n";
        std::size_t off = 0;
        while (off < data.size()) {
            ssize_t n = ::write(toServer[1], data.data() + off, data.size() - off);
            if (n <= 0) throw std::runtime_error("write failed");
            off += static_cast<std::size_t>(n);
        }
    }

    void CloseInput() {
        if (toServer[1] >= 0) {
            ::close(toServer[1]);
            toServer[1] = -1;
        }
    }

    // Next complete line from the transport, or nullopt after timeout.
    std::optional<std::string> ReadLine(std::chrono::milliseconds timeout = 2000ms) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            auto nl = pending.find('\n');
            if (nl != std::string::npos) {
                std::string line = pending.substr(0, nl);
                pending.erase(0, nl + 1);
                return line;
            }
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return std::nullopt;
            pollfd pfd{fromServer[0], POLLIN, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
            if (rc <= 0) return std::nullopt;
            char buf[4096];
            ssize_t n = ::read(fromServer[0], buf, sizeof(buf));
            if (n <= 0) return std::nullopt;
            pending.append(buf, static_cast<std::size_t>(n));
        }
    }

private:
    int toServer[2]{-1, -1};
    int fromServer[2]{-1, -1};
    std::string pending;
};

JSONValue parsed(const std::optional<std::string>& line) {
    if (!line) return JSONValue{};
    return ParseJSONValue(*line).value_or(JSONValue{});
}

} // namespace

TEST(StdioTransport, RequestResponseFraming) {
    PipePair pipes;
    StdioTransport t(pipes.Options());
    t.SetRequestHandler([](const JSONRPCRequest& req, const RequestContext& ctx) {
        JSONValue::Object o;
        o["method"] = std::make_shared<JSONValue>(req.method);
        o["transport"] = std::make_shared<JSONValue>(ctx.transport);
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue{o});
    });
    ASSERT_NO_THROW(t.Start().get());
    EXPECT_TRUE(t.IsRunning());
    EXPECT_EQ(t.Name(), "stdio");
    EXPECT_EQ(t.ConnectedClients(), 1u);

    pipes.WriteLine(R"({"jsonrpc":"2.0","id":"a1","method":"tools/list"})");
    JSONValue reply = parsed(pipes.ReadLine());
    EXPECT_EQ(GetStringMember(reply, "id").value_or(""), "a1");
    const JSONValue* result = FindMember(reply, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(GetStringMember(*result, "method").value_or(""), "tools/list");
    EXPECT_EQ(GetStringMember(*result, "transport").value_or(""), "stdio");

    ASSERT_NO_THROW(t.Stop().get());
    EXPECT_FALSE(t.IsRunning());
}

TEST(StdioTransport, MalformedLinesAndNotificationsProduceNoOutput) {
    PipePair pipes;
    StdioTransport t(pipes.Options());
    std::promise<std::string> noteSeen;
    t.SetNotificationHandler([&noteSeen](std::unique_ptr<JSONRPCNotification> n, const RequestContext&) {
        noteSeen.set_value(n->method);
    });
    t.SetRequestHandler([](const JSONRPCRequest& req, const RequestContext&) {
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
    });
    t.Start().get();

    pipes.WriteLine("{this is not json");
    pipes.WriteLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    auto noteFut = noteSeen.get_future();
    ASSERT_EQ(noteFut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(noteFut.get(), "notifications/initialized");

    // The next reply is the answer to this request; nothing was written for the lines above
    pipes.WriteLine(R"({"jsonrpc":"2.0","id":5,"method":"ping"})");
    JSONValue reply = parsed(pipes.ReadLine());
    EXPECT_EQ(GetIntMember(reply, "id").value_or(-1), 5);

    // An object with an id but no method gets InvalidRequest
    pipes.WriteLine(R"({"jsonrpc":"2.0","id":6})");
    JSONValue invalid = parsed(pipes.ReadLine());
    EXPECT_EQ(GetIntMember(invalid, "id").value_or(-1), 6);
    const JSONValue* err = FindMember(invalid, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetIntMember(*err, "code").value_or(0), JSONRPCErrorCodes::InvalidRequest);

    t.Stop().get();
}

TEST(StdioTransport, EndOfInputStopsReader) {
    PipePair pipes;
    StdioTransport t(pipes.Options());
    t.Start().get();
    pipes.CloseInput();
    auto waited = std::async(std::launch::async, [&t]() { t.WaitUntilStopped(); });
    ASSERT_EQ(waited.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(t.IsRunning());
    t.Stop().get();
}

TEST(StdioTransport, UnusableIdsGetInvalidRequestWithNullId) {
    PipePair pipes;
    StdioTransport t(pipes.Options());
    t.SetRequestHandler([](const JSONRPCRequest& req, const RequestContext&) {
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
    });
    t.Start().get();

    for (const char* line : {R"({"jsonrpc":"2.0","id":1e300,"method":"ping"})",
                             R"({"jsonrpc":"2.0","id":{"nested":1},"method":"ping"})",
                             R"({"jsonrpc":"2.0","id":2.5})"}) {
        pipes.WriteLine(line);
        JSONValue reply = parsed(pipes.ReadLine());
        const JSONValue* id = FindMember(reply, "id");
        ASSERT_NE(id, nullptr) << line;
        EXPECT_TRUE(id->IsNull()) << line;
        const JSONValue* err = FindMember(reply, "error");
        ASSERT_NE(err, nullptr) << line;
        EXPECT_EQ(GetIntMember(*err, "code").value_or(0), JSONRPCErrorCodes::InvalidRequest) << line;
    }
    t.Stop().get();
}

TEST(StdioTransport, WaitUntilStoppedBeforeStartReturns) {
    PipePair pipes;
    StdioTransport t(pipes.Options());
    auto waited = std::async(std::launch::async, [&t]() { t.WaitUntilStopped(); });
    EXPECT_EQ(waited.wait_for(2s), std::future_status::ready);
}

TEST(StdioTransport, StopAndDestroyWithRequestsInFlight) {
    for (int round = 0; round < 20; ++round) {
        PipePair pipes;
        auto t = std::make_unique<StdioTransport>(pipes.Options());
        t->SetRequestHandler([](const JSONRPCRequest& req, const RequestContext&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(req.id == JSONRPCId{int64_t{0}} ? 0 : 2));
            return std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
        });
        t->Start().get();
        for (int i = 0; i < 8; ++i) {
            pipes.WriteLine(R"({"jsonrpc":"2.0","id":)" + std::to_string(i) + R"(,"method":"ping"})");
        }
        // At least one reply proves requests are being handled when Stop runs
        ASSERT_TRUE(pipes.ReadLine().has_value()) << "round " << round;
        auto stopped = std::async(std::launch::async, [&t]() { t->Stop().get(); });
        ASSERT_EQ(stopped.wait_for(5s), std::future_status::ready) << "round " << round;
        t.reset();
    }
}

TEST(StdioTransport, EndToEndServerSession) {
    PipePair pipes;
    ServerConfig cfg;
    Server server(cfg, std::make_shared<MemoryContextStore>(), std::make_shared<NullGenerationProvider>());
    server.AddTransport(std::make_unique<StdioTransport>(pipes.Options()));
    ASSERT_NO_THROW(server.Start().get());

    pipes.WriteLine(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","clientInfo":{"name":"test","version":"1"}}})");
    JSONValue init = parsed(pipes.ReadLine());
    const JSONValue* initResult = FindMember(init, "result");
    ASSERT_NE(initResult, nullptr);
    const JSONValue* info = FindMember(*initResult, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetStringMember(*info, "name").value_or(""), "mcplease");

    pipes.WriteLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    pipes.WriteLine(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"code_completion","session_id":"pipe-session","arguments":{"code":"def fibonacci(n):","language":"python"}}})");
    JSONValue call = parsed(pipes.ReadLine());
    EXPECT_EQ(GetIntMember(call, "id").value_or(-1), 2);
    const JSONValue* callResult = FindMember(call, "result");
    ASSERT_NE(callResult, nullptr);
    EXPECT_NE(FindMember(*callResult, "content"), nullptr);

    auto history = server.Contexts().GetConversationHistory("pipe-session");
    ASSERT_TRUE(history.has_value());
    EXPECT_EQ(history->size(), 1u);

    pipes.WriteLine(R"({"jsonrpc":"2.0","id":3,"method":"initialize","params":{"protocolVersion":"2023-01-01"}})");
    JSONValue bad = parsed(pipes.ReadLine());
    const JSONValue* err = FindMember(bad, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetIntMember(*err, "code").value_or(0), -32602);

    ASSERT_NO_THROW(server.Stop().get());
}

TEST(StdioTransport, FactoryParsesOptions) {
    StdioTransportFactory f;
    auto t = f.CreateTransport("idle_read_timeout_ms=50;write_timeout_ms=100;max_line_bytes=1024");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->Name(), "stdio");
    EXPECT_FALSE(t->IsRunning());
}
