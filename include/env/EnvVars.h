//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read configuration from environment variables with typed defaults.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <cstdint>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvIntOrDefault
// Purpose: Integer variant of GetEnvOrDefault. Unparsable or negative values yield defaultValue.
//==========================================================================================================
inline std::int64_t GetEnvIntOrDefault(const char* name, std::int64_t defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return defaultValue;
    }
    char* end = nullptr;
    const long long v = std::strtoll(raw.c_str(), &end, 10);
    if (end == raw.c_str() || *end != '\0' || v < 0) {
        return defaultValue;
    }
    return static_cast<std::int64_t>(v);
}

//==========================================================================================================
// GetEnvBoolOrDefault
// Purpose: Accepts 1/true/TRUE/yes as true and 0/false/FALSE/no as false.
//==========================================================================================================
inline bool GetEnvBoolOrDefault(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v == "1" || v == "true" || v == "TRUE" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "FALSE" || v == "no") return false;
    return defaultValue;
}
