//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_protocol_handler.cpp
// Purpose: GoogleTests for request routing, protocol version negotiation, error shapes and session recording
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "mcplease/ContextManager.h"
#include "mcplease/DefaultTools.h"
#include "mcplease/ProtocolHandler.h"
#include "mcplease/ToolRegistry.h"
#include "mcplease/errors/Errors.h"

using namespace mcplease;

namespace {

class ProtocolHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        RegisterDefaultTools(registry, std::make_shared<NullGenerationProvider>());
        handler = std::make_unique<ProtocolHandler>(registry, contexts, optionsFor(SessionlessPolicy::Synthesize));
    }

    static ProtocolHandlerOptions optionsFor(SessionlessPolicy policy, bool recordResponses = false) {
        ProtocolHandlerOptions o;
        o.serverInfo = Implementation{"mcplease", "1.0.0", "MCP server with local AI model integration"};
        o.sessionless = policy;
        o.recordResponses = recordResponses;
        return o;
    }

    static JSONRPCRequest request(JSONRPCId id, const std::string& method, const std::string& paramsJson = "") {
        std::optional<JSONValue> params;
        if (!paramsJson.empty()) params = ParseJSONValue(paramsJson);
        return JSONRPCRequest(std::move(id), method, std::move(params));
    }

    static RequestContext stdioCtx() {
        RequestContext ctx;
        ctx.transport = "stdio";
        return ctx;
    }

    static int errorCode(const JSONRPCResponse& r) {
        auto e = errors::mcpErrorFromResponse(r);
        return e ? e->code : 0;
    }

    ToolRegistry registry;
    ContextManager contexts{std::make_shared<MemoryContextStore>()};
    std::unique_ptr<ProtocolHandler> handler;
};

const std::string kCompletionCall =
    R"({"name":"code_completion","arguments":{"code":"def fibonacci(n):","language":"python"}})";

} // namespace

TEST_F(ProtocolHandlerTest, InitializeWithSupportedVersion) {
    auto resp = handler->Handle(request(static_cast<int64_t>(1), "initialize",
                                        R"({"protocolVersion":"2024-11-05","clientInfo":{"name":"ide","version":"0.1"}})"),
                                stdioCtx());
    ASSERT_TRUE(resp);
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(GetStringMember(*resp->result, "protocolVersion").value_or(""), "2024-11-05");
    const JSONValue* info = FindMember(*resp->result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetStringMember(*info, "name").value_or(""), "mcplease");
    EXPECT_EQ(GetStringMember(*info, "version").value_or(""), "1.0.0");
    EXPECT_FALSE(GetStringMember(*info, "description").value_or("").empty());
    const JSONValue* caps = FindMember(*resp->result, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_NE(FindMember(*caps, "tools"), nullptr);
}

TEST_F(ProtocolHandlerTest, InitializeRejectsUnsupportedVersion) {
    auto resp = handler->Handle(request(static_cast<int64_t>(2), "initialize", R"({"protocolVersion":"2023-01-01"})"),
                                stdioCtx());
    ASSERT_TRUE(resp->IsError());
    auto err = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(err->message, "Unsupported protocol version: 2023-01-01");
    ASSERT_TRUE(err->data.has_value());
    const JSONValue* versions = FindMember(*err->data, "supported_versions");
    ASSERT_TRUE(versions && versions->IsArray());
    EXPECT_EQ(std::get<std::string>(std::get<JSONValue::Array>(versions->value)[0]->value), "2024-11-05");
}

TEST_F(ProtocolHandlerTest, InitializeWithoutVersionUsesDefault) {
    auto resp = handler->Handle(request(static_cast<int64_t>(3), "initialize", "{}"), stdioCtx());
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(GetStringMember(*resp->result, "protocolVersion").value_or(""), "2024-11-05");
}

TEST_F(ProtocolHandlerTest, EchoesStringAndIntegerIds) {
    auto a = handler->Handle(request(std::string("abc"), "tools/list"), stdioCtx());
    ASSERT_TRUE(std::holds_alternative<std::string>(a->id));
    EXPECT_EQ(std::get<std::string>(a->id), "abc");

    auto b = handler->Handle(request(static_cast<int64_t>(99), "no/such/method"), stdioCtx());
    ASSERT_TRUE(std::holds_alternative<int64_t>(b->id));
    EXPECT_EQ(std::get<int64_t>(b->id), 99);
}

TEST_F(ProtocolHandlerTest, ToolsListIsIdempotent) {
    auto first = handler->Handle(request(static_cast<int64_t>(1), "tools/list"), stdioCtx());
    auto second = handler->Handle(request(static_cast<int64_t>(1), "tools/list"), stdioCtx());
    ASSERT_FALSE(first->IsError());
    EXPECT_EQ(first->Serialize(), second->Serialize());
    const JSONValue* tools = FindMember(*first->result, "tools");
    ASSERT_TRUE(tools && tools->IsArray());
    const auto& arr = std::get<JSONValue::Array>(tools->value);
    ASSERT_EQ(arr.size(), 3u);
    for (const auto& t : arr) {
        EXPECT_TRUE(GetStringMember(*t, "name").has_value());
        EXPECT_TRUE(GetStringMember(*t, "description").has_value());
        EXPECT_NE(FindMember(*t, "inputSchema"), nullptr);
    }
}

TEST_F(ProtocolHandlerTest, UnknownMethodListsSupportedMethods) {
    auto resp = handler->Handle(request(static_cast<int64_t>(5), "resources/list"), stdioCtx());
    auto err = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::MethodNotFound);
    ASSERT_TRUE(err->data.has_value());
    const JSONValue* methods = FindMember(*err->data, "supported_methods");
    ASSERT_TRUE(methods && methods->IsArray());
    EXPECT_GE(std::get<JSONValue::Array>(methods->value).size(), 3u);
}

TEST_F(ProtocolHandlerTest, PingReturnsEmptyObject) {
    auto resp = handler->Handle(request(static_cast<int64_t>(6), "ping"), stdioCtx());
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(SerializeJSONValue(*resp->result), "{}");
}

TEST_F(ProtocolHandlerTest, CallToolRequiresName) {
    auto noParams = handler->Handle(request(static_cast<int64_t>(7), "tools/call"), stdioCtx());
    EXPECT_EQ(errorCode(*noParams), JSONRPCErrorCodes::InvalidParams);
    auto emptyName = handler->Handle(request(static_cast<int64_t>(8), "tools/call", R"({"name":""})"), stdioCtx());
    auto err = errors::mcpErrorFromResponse(*emptyName);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(err->message, "Tool name is required");
}

TEST_F(ProtocolHandlerTest, CallToolRejectsNonObjectArguments) {
    auto resp = handler->Handle(request(static_cast<int64_t>(9), "tools/call", R"({"name":"code_completion","arguments":[1]})"),
                                stdioCtx());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(ProtocolHandlerTest, UnknownToolIsMethodNotFoundAndStillRecorded) {
    auto resp = handler->Handle(request(static_cast<int64_t>(10), "tools/call", R"({"name":"nope","session_id":"s-unknown"})"),
                                stdioCtx());
    auto err = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::MethodNotFound);
    ASSERT_TRUE(err->data.has_value());
    EXPECT_NE(FindMember(*err->data, "available_tools"), nullptr);

    auto history = contexts.GetConversationHistory("s-unknown");
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(history->size(), 1u);
    EXPECT_EQ((*history)[0].content, "Called tool: nope");
}

TEST_F(ProtocolHandlerTest, PythonCompletionProducesTextAndSynthesizedSession) {
    auto resp = handler->Handle(request(static_cast<int64_t>(11), "tools/call", kCompletionCall), stdioCtx());
    ASSERT_FALSE(resp->IsError());
    const JSONValue* content = FindMember(*resp->result, "content");
    ASSERT_TRUE(content && content->IsArray());
    const auto& arr = std::get<JSONValue::Array>(content->value);
    ASSERT_FALSE(arr.empty());
    EXPECT_EQ(GetStringMember(*arr[0], "type").value_or(""), "text");
    EXPECT_FALSE(GetStringMember(*arr[0], "text").value_or("").empty());

    const JSONValue* meta = FindMember(*resp->result, "_meta");
    ASSERT_NE(meta, nullptr);
    EXPECT_EQ(GetStringMember(*meta, "session_id").value_or(""), "session_11");

    auto history = contexts.GetConversationHistory("session_11");
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(history->size(), 1u);
    EXPECT_EQ((*history)[0].role, "user");
    EXPECT_EQ((*history)[0].content, "Called tool: code_completion");
    EXPECT_EQ(GetStringMember((*history)[0].metadata, "tool").value_or(""), "code_completion");
    EXPECT_EQ(GetStringMember((*history)[0].metadata, "method").value_or(""), "tools/call");
}

TEST_F(ProtocolHandlerTest, NullIdCallsGetSeparateSessions) {
    auto first = handler->Handle(request(nullptr, "tools/call", kCompletionCall), stdioCtx());
    auto second = handler->Handle(request(nullptr, "tools/call", kCompletionCall), stdioCtx());
    ASSERT_FALSE(first->IsError());
    ASSERT_FALSE(second->IsError());
    const JSONValue* m1 = FindMember(*first->result, "_meta");
    const JSONValue* m2 = FindMember(*second->result, "_meta");
    ASSERT_TRUE(m1 && m2);
    std::string s1 = GetStringMember(*m1, "session_id").value_or("");
    std::string s2 = GetStringMember(*m2, "session_id").value_or("");
    EXPECT_FALSE(s1.empty());
    EXPECT_NE(s1, s2);
    EXPECT_NE(s1, "session_null");

    auto history = contexts.GetConversationHistory(s1);
    ASSERT_TRUE(history.has_value());
    EXPECT_EQ(history->size(), 1u);
}

TEST_F(ProtocolHandlerTest, SessionIdResolutionOrder) {
    RequestContext ctx = stdioCtx();
    ctx.sessionId = "from-transport";

    auto explicitParam = request(static_cast<int64_t>(1), "tools/call",
                                 R"({"name":"x","session_id":"param","clientInfo":{"session_id":"client"}})");
    EXPECT_EQ(handler->ResolveSessionId(explicitParam, ctx).value_or(""), "param");

    auto clientOnly = request(static_cast<int64_t>(1), "tools/call", R"({"name":"x","clientInfo":{"session_id":"client"}})");
    EXPECT_EQ(handler->ResolveSessionId(clientOnly, ctx).value_or(""), "client");

    auto none = request(std::string("r7"), "tools/call", R"({"name":"x"})");
    EXPECT_EQ(handler->ResolveSessionId(none, ctx).value_or(""), "from-transport");
    EXPECT_EQ(handler->ResolveSessionId(none, stdioCtx()).value_or(""), "session_r7");
}

TEST_F(ProtocolHandlerTest, IgnorePolicySkipsContext) {
    ProtocolHandler ignoring(registry, contexts, optionsFor(SessionlessPolicy::Ignore));
    auto resp = ignoring.Handle(request(static_cast<int64_t>(12), "tools/call", kCompletionCall), stdioCtx());
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(FindMember(*resp->result, "_meta"), nullptr);
    EXPECT_TRUE(contexts.ListSessions().empty());
}

TEST_F(ProtocolHandlerTest, RefusePolicyRequiresSession) {
    ProtocolHandler refusing(registry, contexts, optionsFor(SessionlessPolicy::Refuse));
    auto resp = refusing.Handle(request(static_cast<int64_t>(13), "tools/call", kCompletionCall), stdioCtx());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InvalidParams);

    auto ok = refusing.Handle(request(static_cast<int64_t>(14), "tools/call",
                                      R"({"name":"code_completion","session_id":"given","arguments":{"code":"x","language":"go"}})"),
                              stdioCtx());
    EXPECT_FALSE(ok->IsError());
}

TEST_F(ProtocolHandlerTest, RecordResponsesAppendsAssistantEntry) {
    ProtocolHandler recording(registry, contexts, optionsFor(SessionlessPolicy::Synthesize, true));
    auto resp = recording.Handle(request(static_cast<int64_t>(15), "tools/call",
                                         R"({"name":"debug_assistance","session_id":"rec","arguments":{"code":"x","language":"rust"}})"),
                                 stdioCtx());
    ASSERT_FALSE(resp->IsError());
    auto history = contexts.GetConversationHistory("rec");
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(history->size(), 2u);
    EXPECT_EQ((*history)[0].role, "user");
    EXPECT_EQ((*history)[1].role, "assistant");
    EXPECT_EQ((*history)[1].content.rfind("# Debug Analysis for rust", 0), 0u);
}

TEST_F(ProtocolHandlerTest, ToolFailureIsToolExecutionError) {
    auto resp = handler->Handle(request(static_cast<int64_t>(16), "tools/call",
                                        R"({"name":"code_completion","arguments":{"language":"python"}})"),
                                stdioCtx());
    auto err = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(err->message.rfind("Tool execution failed: ", 0), 0u);
}

TEST_F(ProtocolHandlerTest, ConcurrentCallsOnOneSessionAreAllRecorded) {
    const std::string call =
        R"({"name":"code_explanation","session_id":"shared","arguments":{"code":"x = 1","language":"python"}})";
    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i) {
        threads.emplace_back([&, i]() {
            auto resp = handler->Handle(request(static_cast<int64_t>(100 + i), "tools/call", call), stdioCtx());
            EXPECT_FALSE(resp->IsError());
        });
    }
    for (auto& t : threads) t.join();
    auto history = contexts.GetConversationHistory("shared");
    ASSERT_TRUE(history.has_value());
    EXPECT_EQ(history->size(), 2u);
}

TEST_F(ProtocolHandlerTest, NotificationsAreAccepted) {
    JSONRPCNotification n("notifications/initialized");
    EXPECT_NO_THROW(handler->HandleNotification(n, stdioCtx()));
    JSONRPCNotification other("notifications/cancelled");
    EXPECT_NO_THROW(handler->HandleNotification(other, stdioCtx()));
}

TEST(SessionlessPolicy, ParseAndPrint) {
    EXPECT_EQ(SessionlessPolicyFromString("IGNORE"), SessionlessPolicy::Ignore);
    EXPECT_EQ(SessionlessPolicyFromString("refuse"), SessionlessPolicy::Refuse);
    EXPECT_EQ(SessionlessPolicyFromString(""), SessionlessPolicy::Synthesize);
    EXPECT_EQ(SessionlessPolicyFromString("bogus"), SessionlessPolicy::Synthesize);
    EXPECT_EQ(ToString(SessionlessPolicy::Refuse), "refuse");
}
