//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: detail/MessageDispatch.cpp
// Purpose: Shared inbound message routing for SSE and WebSocket.
//==========================================================================================================

#include "detail/MessageDispatch.hpp"
#include "logging/Logger.h"
#include "mcplease/JSONRPCTypes.h"

namespace mcplease {
namespace detail {

DispatchOutcome DispatchMessage(const std::string& text,
                                const RequestContext& ctx,
                                const ITransport::RequestHandler& requestHandler,
                                const ITransport::NotificationHandler& notificationHandler,
                                const MethodFilter& allowMethod) {
    DispatchOutcome out;
    auto doc = ParseJSONValue(text);
    if (!doc) {
        LOG_WARN("{}: dropping malformed JSON from client {} ({} bytes)", ctx.transport, ctx.clientId, text.size());
        out.malformed = true;
        return out;
    }

    switch (ClassifyMessage(*doc)) {
        case MessageKind::Request: {
            JSONRPCRequest request;
            if (!request.FromValue(*doc)) {
                LOG_WARN("{}: request with unusable id or method", ctx.transport);
                out.reply = CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize();
                return out;
            }
            if (allowMethod && !allowMethod(request.method)) {
                LOG_WARN("{}: client {} may not call {}", ctx.transport, ctx.clientId, request.method);
                JSONValue::Object data;
                data["error"] = std::make_shared<JSONValue>("Insufficient permissions for " + request.method);
                out.reply = CreateErrorResponse(request.id, JSONRPCErrorCodes::AuthorizationError, "Permission denied",
                                                JSONValue{data})->Serialize();
                out.forbidden = true;
                return out;
            }
            std::unique_ptr<JSONRPCResponse> resp;
            try {
                resp = requestHandler ? requestHandler(request, ctx)
                                      : CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "No request handler");
            } catch (const std::exception& e) {
                LOG_ERROR("{}: request handler exception: {}", ctx.transport, e.what());
                resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
            }
            if (!resp) {
                resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "No response from handler");
            }
            resp->id = request.id;
            out.reply = resp->Serialize();
            return out;
        }
        case MessageKind::Notification: {
            auto note = std::make_unique<JSONRPCNotification>();
            if (!note->FromValue(*doc)) return out;
            if (allowMethod && !allowMethod(note->method)) {
                LOG_WARN("{}: dropping notification {} the client may not send", ctx.transport, note->method);
                out.forbidden = true;
                return out;
            }
            if (notificationHandler) {
                try {
                    notificationHandler(std::move(note), ctx);
                } catch (const std::exception& e) {
                    LOG_ERROR("{}: notification handler error: {}", ctx.transport, e.what());
                }
            }
            return out;
        }
        case MessageKind::Response:
            LOG_DEBUG("{}: ignoring unsolicited response from client {}", ctx.transport, ctx.clientId);
            return out;
        case MessageKind::Invalid:
            break;
    }
    if (const JSONValue* idv = FindMember(*doc, "id")) {
        JSONRPCId id = nullptr;
        if (auto s = std::get_if<std::string>(&idv->value)) id = *s;
        else if (auto n = std::get_if<int64_t>(&idv->value)) id = *n;
        out.reply = CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize();
        return out;
    }
    LOG_WARN("{}: dropping message that is not a JSON-RPC request", ctx.transport);
    return out;
}

} // namespace detail
} // namespace mcplease
