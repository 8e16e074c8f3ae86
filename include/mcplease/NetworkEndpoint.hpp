//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NetworkEndpoint.hpp
// Purpose: Listen endpoint description shared by the SSE and WebSocket servers, plus URI parsing.
//==========================================================================================================
#pragma once

#include <string>
#include <unordered_map>

namespace mcplease {

//==========================================================================================================
// NetworkEndpoint
// Fields:
//   tls: true for the secure scheme variant (sses://, wss://); certFile/keyFile are then required.
//   address/port: Bind address and port ("0" selects an ephemeral port).
//   params: Remaining query parameters (unknown keys are kept for the caller).
//==========================================================================================================
struct NetworkEndpoint {
    bool tls{false};
    std::string address{"0.0.0.0"};
    std::string port;
    std::string certFile;
    std::string keyFile;
    std::unordered_map<std::string, std::string> params;
};

//==========================================================================================================
// ParseEndpointUri
// Purpose: Parses "<scheme>://host[:port][/path][?cert=..&key=..&k=v]" including "[v6]:port" hosts.
// Args:
//   config: The URI. The scheme may be omitted.
//   plainScheme/tlsScheme: Accepted scheme names, e.g. "sse"/"sses" or "ws"/"wss". "http"/"https" are
//                         accepted as aliases.
//   defaultPort: Used when the URI has no port.
// Throws:
//   std::invalid_argument for an unknown scheme, a non-numeric/out-of-range port, or TLS without cert/key.
//==========================================================================================================
NetworkEndpoint ParseEndpointUri(const std::string& config,
                                 const std::string& plainScheme,
                                 const std::string& tlsScheme,
                                 const std::string& defaultPort);

// True when port is all digits and within [0, 65535].
bool IsValidPort(const std::string& port);

} // namespace mcplease
