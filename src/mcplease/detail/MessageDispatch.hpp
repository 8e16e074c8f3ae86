//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: detail/MessageDispatch.hpp
// Purpose: Text-in/text-out dispatch of one inbound JSON message for the network transports.
//==========================================================================================================
#pragma once

#include <functional>
#include <optional>
#include <string>

#include "mcplease/Transport.h"

namespace mcplease {
namespace detail {

//==========================================================================================================
// DispatchOutcome
//   reply: Serialized response when the message was a request (or an answerable invalid message).
//   malformed: Input was not JSON; nothing was dispatched.
//   forbidden: allowMethod refused the method; reply carries AuthorizationError.
//==========================================================================================================
struct DispatchOutcome {
    std::optional<std::string> reply;
    bool malformed{false};
    bool forbidden{false};
};

// Returns false to refuse a method for the current caller.
using MethodFilter = std::function<bool(const std::string& method)>;

// Parses text, routes it to the request or notification handler and serializes the reply.
// Handler exceptions become InternalError responses.
DispatchOutcome DispatchMessage(const std::string& text,
                                const RequestContext& ctx,
                                const ITransport::RequestHandler& requestHandler,
                                const ITransport::NotificationHandler& notificationHandler,
                                const MethodFilter& allowMethod = {});

} // namespace detail
} // namespace mcplease
