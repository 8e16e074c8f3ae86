//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplease/JSONRPCTypes.h"
#include "mcplease/errors/Errors.h"

using namespace mcplease;

TEST(Errors, CategoryMapping) {
    using mcplease::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolExecutionError), ErrorCategory::ToolExecution);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::AuthenticationError), ErrorCategory::Authentication);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::AuthorizationError), ErrorCategory::Authorization);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ResourceNotFound), ErrorCategory::ResourceNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ContextError), ErrorCategory::Context);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::RateLimitExceeded), ErrorCategory::RateLimit);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, FixedNumericCodes) {
    EXPECT_EQ(JSONRPCErrorCodes::ParseError, -32700);
    EXPECT_EQ(JSONRPCErrorCodes::InvalidRequest, -32600);
    EXPECT_EQ(JSONRPCErrorCodes::MethodNotFound, -32601);
    EXPECT_EQ(JSONRPCErrorCodes::InvalidParams, -32602);
    EXPECT_EQ(JSONRPCErrorCodes::InternalError, -32603);
    EXPECT_EQ(JSONRPCErrorCodes::ToolExecutionError, -32000);
}

TEST(Errors, FromErrorValue_Valid) {
    JSONValue::Object dataObj; dataObj["foo"] = std::make_shared<JSONValue>(std::string("bar"));
    JSONValue::Object errObj;
    errObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(JSONRPCErrorCodes::MethodNotFound));
    errObj["message"] = std::make_shared<JSONValue>(std::string("Method not found"));
    errObj["data"] = std::make_shared<JSONValue>(JSONValue{dataObj});

    auto parsed = errors::mcpErrorFromErrorValue(JSONValue{errObj});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(parsed->category, errors::ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(parsed->message, std::string("Method not found"));
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(GetStringMember(*parsed->data, "foo").value_or(""), "bar");
}

TEST(Errors, FromErrorValue_InvalidShape) {
    // Not an object
    JSONValue notObj{nullptr};
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(notObj).has_value());

    // Missing code
    JSONValue::Object missCode; missCode["message"] = std::make_shared<JSONValue>(std::string("m"));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue{missCode}).has_value());

    // Missing message
    JSONValue::Object missMsg; missMsg["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(-1));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue{missMsg}).has_value());

    // Wrong types
    JSONValue::Object wrongTypes;
    wrongTypes["code"] = std::make_shared<JSONValue>(std::string("-32601"));
    wrongTypes["message"] = std::make_shared<JSONValue>(static_cast<int64_t>(123));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue{wrongTypes}).has_value());
}

TEST(Errors, FromResponse) {
    auto resp = CreateErrorResponse(std::string("1"), JSONRPCErrorCodes::InvalidParams, "bad args", std::nullopt);
    ASSERT_TRUE(resp != nullptr);
    auto parsed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(parsed->message, std::string("bad args"));
    EXPECT_FALSE(parsed->data.has_value());

    JSONRPCResponse ok(std::string("2"), JSONValue{JSONValue::Object{}});
    EXPECT_FALSE(errors::mcpErrorFromResponse(ok).has_value());
}

TEST(Errors, MakeErrorResponse_ContainsError) {
    auto e = errors::makeError(JSONRPCErrorCodes::ToolExecutionError, "Tool execution failed: boom");
    EXPECT_EQ(e.category, errors::ErrorCategory::ToolExecution);
    auto resp = errors::makeErrorResponse(static_cast<int64_t>(7), e);
    ASSERT_TRUE(resp != nullptr);
    EXPECT_TRUE(resp->IsError());
    ASSERT_TRUE(std::holds_alternative<int64_t>(resp->id));
    EXPECT_EQ(std::get<int64_t>(resp->id), 7);
    auto parsed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, e.code);
    EXPECT_EQ(parsed->message, e.message);
}
