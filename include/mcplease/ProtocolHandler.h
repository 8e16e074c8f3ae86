//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolHandler.h
// Purpose: Transport-agnostic dispatch of MCP requests to the tool registry and context manager
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplease/ContextManager.h"
#include "mcplease/JSONRPCTypes.h"
#include "mcplease/Protocol.h"
#include "mcplease/ToolRegistry.h"
#include "mcplease/Transport.h"

namespace mcplease {

//==========================================================================================================
// SessionlessPolicy
// Purpose: What tools/call does when neither params nor the transport name a session.
//   Synthesize: use "session_<request id>" (created lazily).
//   Ignore: run the tool without touching any context.
//   Refuse: answer InvalidParams.
//==========================================================================================================
enum class SessionlessPolicy { Synthesize, Ignore, Refuse };

// "synthesize" | "ignore" | "refuse" (case-insensitive); anything else is Synthesize.
SessionlessPolicy SessionlessPolicyFromString(const std::string& text);
std::string ToString(SessionlessPolicy policy);

struct ProtocolHandlerOptions {
    Implementation serverInfo;
    SessionlessPolicy sessionless{SessionlessPolicy::Synthesize};
    // Also append an "assistant" entry with the tool output.
    bool recordResponses{false};
};

//==========================================================================================================
// ProtocolHandler
// Purpose: Stateless orchestrator. All state lives in the registry and context manager, so Handle may be
//          called concurrently from any number of transports.
// Notes:
//   Context-layer failures are logged (ContextError) and never fail the request.
//   Every call returns exactly one response whose id equals the request id.
//==========================================================================================================
class ProtocolHandler {
public:
    using Options = ProtocolHandlerOptions;

    ProtocolHandler(ToolRegistry& registry, ContextManager& contexts, Options opts);

    std::unique_ptr<JSONRPCResponse> Handle(const JSONRPCRequest& request, const RequestContext& ctx);
    void HandleNotification(const JSONRPCNotification& notification, const RequestContext& ctx);

    static std::vector<std::string> SupportedMethods();

    //==========================================================================================================
    // ResolveSessionId
    // Purpose: params.session_id, then params.clientInfo.session_id, then the transport's session id, then
    //          the sessionless policy. nullopt means "no context" (Ignore) or "refuse" (see policy).
    //==========================================================================================================
    std::optional<std::string> ResolveSessionId(const JSONRPCRequest& request, const RequestContext& ctx) const;

    const Options& GetOptions() const { return opts; }

private:
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req, const RequestContext& ctx);
    std::unique_ptr<JSONRPCResponse> handleListTools(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleCallTool(const JSONRPCRequest& req, const RequestContext& ctx);
    std::unique_ptr<JSONRPCResponse> handlePing(const JSONRPCRequest& req);

    void recordToolCall(const std::string& sessionId, const std::string& toolName, const RequestContext& ctx);
    void recordToolResult(const std::string& sessionId, const std::string& toolName, const JSONValue& result,
                          const RequestContext& ctx);

    ToolRegistry& registry;
    ContextManager& contexts;
    Options opts;
};

} // namespace mcplease
