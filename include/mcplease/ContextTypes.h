//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextTypes.h
// Purpose: Session context value types and their JSON form
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "mcplease/JSONRPCTypes.h"

namespace mcplease {

using WallClock = std::chrono::system_clock;

//==========================================================================================================
// ConversationEntry
// Fields:
//   role: "user", "assistant" or "system".
//   timestamp: Wall-clock time the entry was recorded (persisted).
//   order: Monotonic receive time of the originating request; positions the entry within the history.
//          Not persisted; entries loaded from disk sort before any new entry.
//==========================================================================================================
struct ConversationEntry {
    std::string role;
    std::string content;
    WallClock::time_point timestamp{};
    JSONValue metadata{JSONValue::Object{}};
    std::chrono::steady_clock::time_point order{};
};

//==========================================================================================================
// Context
// Purpose: One session's conversational and workspace state.
// Notes:
//   activeFiles is ordered least- to most-recently used; conversationHistory oldest first.
//==========================================================================================================
struct Context {
    std::string sessionId;
    std::optional<std::string> userId;
    std::optional<std::string> workspacePath;
    std::vector<std::string> activeFiles;
    std::vector<ConversationEntry> conversationHistory;
    JSONValue metadata{JSONValue::Object{}};
    WallClock::time_point createdAt{};
    WallClock::time_point lastAccessed{};
};

// ISO-8601 UTC with microseconds, e.g. "2025-01-31T08:15:00.000123Z".
std::string FormatIsoTime(WallClock::time_point tp);
// Accepts "YYYY-MM-DDTHH:MM:SS[.ffffff][Z]"; nullopt on anything else.
std::optional<WallClock::time_point> ParseIsoTime(const std::string& text);

JSONValue ConversationEntryToJSON(const ConversationEntry& entry);
std::optional<ConversationEntry> ConversationEntryFromJSON(const JSONValue& value);

// {session_id,user_id,workspace_path,active_files,conversation_history,metadata,created_at,last_accessed}
JSONValue ContextToJSON(const Context& context);
std::optional<Context> ContextFromJSON(const JSONValue& value);

} // namespace mcplease
