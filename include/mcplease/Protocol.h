//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol constants, method names and the tool descriptor shared by registry and handler.
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <array>
#include <string>
#include <vector>
#include <optional>

namespace mcplease {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Versions accepted by initialize; anything else is rejected with InvalidParams.
inline constexpr std::array<const char*, 1> SUPPORTED_PROTOCOL_VERSIONS = { PROTOCOL_VERSION };

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Server identity reported as serverInfo
struct Implementation {
    std::string name;
    std::string version;
    std::string description;

    Implementation() = default;
    Implementation(std::string name, std::string version, std::string description = {})
        : name(std::move(name)), version(std::move(version)), description(std::move(description)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool arguments

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

// { name, description, inputSchema } as listed by tools/list
JSONValue ToolToJSON(const Tool& tool);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

} // namespace mcplease
