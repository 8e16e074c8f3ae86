//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolHandler.cpp
// Purpose: initialize / tools/list / tools/call / ping handling
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

#include "logging/Logger.h"
#include "mcplease/ProtocolHandler.h"
#include "mcplease/errors/Errors.h"

namespace mcplease {

SessionlessPolicy SessionlessPolicyFromString(const std::string& text) {
    std::string s;
    for (char c : text) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (s == "ignore") return SessionlessPolicy::Ignore;
    if (s == "refuse") return SessionlessPolicy::Refuse;
    if (!s.empty() && s != "synthesize") {
        LOG_WARN("Unknown sessionless policy '{}'; using synthesize", text);
    }
    return SessionlessPolicy::Synthesize;
}

std::string ToString(SessionlessPolicy policy) {
    switch (policy) {
        case SessionlessPolicy::Ignore: return "ignore";
        case SessionlessPolicy::Refuse: return "refuse";
        case SessionlessPolicy::Synthesize: break;
    }
    return "synthesize";
}

namespace {
// A null id names no conversation; each such request gets its own session.
std::string anonymousSessionId() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::ostringstream oss;
    oss << "session_anon_" << std::hex << std::setw(16) << std::setfill('0') << gen();
    return oss.str();
}

JSONValue stringArray(const std::vector<std::string>& items) {
    JSONValue::Array a;
    for (const auto& s : items) a.push_back(std::make_shared<JSONValue>(s));
    return JSONValue{a};
}

std::unique_ptr<JSONRPCResponse> makeResult(const JSONRPCId& id, JSONValue result) {
    auto resp = std::make_unique<JSONRPCResponse>();
    resp->id = id;
    resp->result = std::move(result);
    return resp;
}
} // namespace

ProtocolHandler::ProtocolHandler(ToolRegistry& registry, ContextManager& contexts, Options opts)
    : registry(registry), contexts(contexts), opts(std::move(opts)) {}

std::vector<std::string> ProtocolHandler::SupportedMethods() {
    return {Methods::Initialize, Methods::ListTools, Methods::CallTool, Methods::Ping};
}

std::unique_ptr<JSONRPCResponse> ProtocolHandler::Handle(const JSONRPCRequest& request, const RequestContext& ctx) {
    LOG_DEBUG("Handling {} (id {}) from {}", request.method, IdToString(request.id), ctx.transport);
    std::unique_ptr<JSONRPCResponse> resp;
    try {
        if (request.method == Methods::Initialize) {
            resp = handleInitialize(request, ctx);
        } else if (request.method == Methods::ListTools) {
            resp = handleListTools(request);
        } else if (request.method == Methods::CallTool) {
            resp = handleCallTool(request, ctx);
        } else if (request.method == Methods::Ping) {
            resp = handlePing(request);
        } else {
            JSONValue::Object data;
            data["supported_methods"] = std::make_shared<JSONValue>(stringArray(SupportedMethods()));
            LOG_WARN("Unknown method: {}", request.method);
            resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                       "Method not found: " + request.method, JSONValue{data});
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling {}: {}", request.method, e.what());
        resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError,
                                   std::string("Internal error: ") + e.what());
    }
    resp->id = request.id;
    return resp;
}

void ProtocolHandler::HandleNotification(const JSONRPCNotification& notification, const RequestContext& ctx) {
    if (notification.method == Methods::Initialized) {
        LOG_INFO("Client initialized ({} {})", ctx.transport, ctx.clientId);
        return;
    }
    LOG_DEBUG("Ignoring notification {} from {}", notification.method, ctx.transport);
}

std::unique_ptr<JSONRPCResponse> ProtocolHandler::handleInitialize(const JSONRPCRequest& req, const RequestContext& ctx) {
    std::optional<std::string> requested;
    if (req.params.has_value()) {
        requested = GetStringMember(*req.params, "protocolVersion");
        if (const JSONValue* client = FindMember(*req.params, "clientInfo")) {
            LOG_INFO("Initialize from {} {} via {}", GetStringMember(*client, "name").value_or("unknown"),
                     GetStringMember(*client, "version").value_or("?"), ctx.transport);
        }
    }
    // A client that omits the version gets the one we speak.
    if (!requested.has_value()) {
        requested = std::string(PROTOCOL_VERSION);
    }
    const bool supported =
        std::any_of(SUPPORTED_PROTOCOL_VERSIONS.begin(), SUPPORTED_PROTOCOL_VERSIONS.end(),
                    [&](const char* v) { return *requested == v; });
    if (!supported) {
        std::vector<std::string> versions(SUPPORTED_PROTOCOL_VERSIONS.begin(), SUPPORTED_PROTOCOL_VERSIONS.end());
        JSONValue::Object data;
        data["supported_versions"] = std::make_shared<JSONValue>(stringArray(versions));
        const std::string shown = *requested;
        LOG_WARN("Rejecting unsupported protocol version {}", shown);
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams,
                                   "Unsupported protocol version: " + shown, JSONValue{data});
    }

    JSONValue::Object serverInfo;
    serverInfo["name"] = std::make_shared<JSONValue>(opts.serverInfo.name);
    serverInfo["version"] = std::make_shared<JSONValue>(opts.serverInfo.version);
    serverInfo["description"] = std::make_shared<JSONValue>(opts.serverInfo.description);

    JSONValue::Object caps;
    caps["tools"] = std::make_shared<JSONValue>(JSONValue::Object{});

    JSONValue::Object result;
    result["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
    result["capabilities"] = std::make_shared<JSONValue>(std::move(caps));
    result["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfo));
    return makeResult(req.id, JSONValue{result});
}

std::unique_ptr<JSONRPCResponse> ProtocolHandler::handleListTools(const JSONRPCRequest& req) {
    JSONValue::Array tools;
    for (const auto& t : registry.List()) {
        tools.push_back(std::make_shared<JSONValue>(ToolToJSON(t)));
    }
    JSONValue::Object result;
    result["tools"] = std::make_shared<JSONValue>(std::move(tools));
    return makeResult(req.id, JSONValue{result});
}

std::unique_ptr<JSONRPCResponse> ProtocolHandler::handlePing(const JSONRPCRequest& req) {
    return makeResult(req.id, JSONValue{JSONValue::Object{}});
}

std::optional<std::string> ProtocolHandler::ResolveSessionId(const JSONRPCRequest& request, const RequestContext& ctx) const {
    if (request.params.has_value()) {
        if (auto sid = GetStringMember(*request.params, "session_id"); sid && !sid->empty()) {
            return sid;
        }
        if (const JSONValue* client = FindMember(*request.params, "clientInfo")) {
            if (auto sid = GetStringMember(*client, "session_id"); sid && !sid->empty()) {
                return sid;
            }
        }
    }
    if (!ctx.sessionId.empty()) {
        return ctx.sessionId;
    }
    if (opts.sessionless == SessionlessPolicy::Synthesize) {
        if (std::holds_alternative<std::nullptr_t>(request.id)) return anonymousSessionId();
        return "session_" + IdToString(request.id);
    }
    return std::nullopt;
}

void ProtocolHandler::recordToolCall(const std::string& sessionId, const std::string& toolName,
                                     const RequestContext& ctx) {
    try {
        (void)contexts.GetOrCreate(sessionId);
        JSONValue::Object md;
        md["tool"] = std::make_shared<JSONValue>(toolName);
        md["method"] = std::make_shared<JSONValue>(std::string(Methods::CallTool));
        if (!contexts.AddConversationEntry(sessionId, "user", "Called tool: " + toolName, JSONValue{md}, ctx.receivedAt)) {
            LOG_WARN("Context error ({}): session {} vanished before the call was recorded",
                     JSONRPCErrorCodes::ContextError, sessionId);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Context error ({}) for session {}: {}", JSONRPCErrorCodes::ContextError, sessionId, e.what());
    }
}

void ProtocolHandler::recordToolResult(const std::string& sessionId, const std::string& toolName,
                                       const JSONValue& result, const RequestContext& ctx) {
    std::string text;
    if (const JSONValue* content = FindMember(result, "content"); content && content->IsArray()) {
        for (const auto& block : std::get<JSONValue::Array>(content->value)) {
            if (!block) continue;
            if (auto t = GetStringMember(*block, "text")) {
                if (!text.empty()) text += "\n";
                text += *t;
            }
        }
    }
    try {
        JSONValue::Object md;
        md["tool"] = std::make_shared<JSONValue>(toolName);
        if (!contexts.AddConversationEntry(sessionId, "assistant", text, JSONValue{md}, ctx.receivedAt)) {
            LOG_WARN("Context error ({}): could not record result for session {}", JSONRPCErrorCodes::ContextError, sessionId);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Context error ({}) for session {}: {}", JSONRPCErrorCodes::ContextError, sessionId, e.what());
    }
}

std::unique_ptr<JSONRPCResponse> ProtocolHandler::handleCallTool(const JSONRPCRequest& req, const RequestContext& ctx) {
    std::string name;
    JSONValue arguments{JSONValue::Object{}};
    if (req.params.has_value()) {
        name = GetStringMember(*req.params, "name").value_or(std::string());
        if (const JSONValue* args = FindMember(*req.params, "arguments")) {
            if (args->IsObject()) {
                arguments = *args;
            } else if (!args->IsNull()) {
                return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Tool arguments must be an object");
            }
        }
    }
    if (name.empty()) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Tool name is required");
    }

    std::optional<std::string> sessionId = ResolveSessionId(req, ctx);
    if (!sessionId.has_value() && opts.sessionless == SessionlessPolicy::Refuse) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "session_id is required");
    }
    if (sessionId.has_value()) {
        recordToolCall(*sessionId, name, ctx);
    }

    LOG_INFO("Calling tool {} (session {})", name, sessionId.value_or("-"));
    ToolCallResult outcome = registry.Execute(name, arguments);
    if (!outcome.Ok()) {
        return errors::makeErrorResponse(req.id, *outcome.error);
    }
    JSONValue result = std::move(*outcome.result);
    if (sessionId.has_value()) {
        if (opts.recordResponses) {
            recordToolResult(*sessionId, name, result, ctx);
        }
        JSONValue::Object meta;
        if (const JSONValue* existing = FindMember(result, "_meta"); existing && existing->IsObject()) {
            meta = std::get<JSONValue::Object>(existing->value);
        }
        meta["session_id"] = std::make_shared<JSONValue>(*sessionId);
        SetMember(result, "_meta", JSONValue{meta});
    }
    return makeResult(req.id, std::move(result));
}

} // namespace mcplease
