//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextTypes.cpp
// Purpose: Context <-> JSON conversion and ISO-8601 timestamps
//==========================================================================================================

#include <cstdio>
#include <ctime>
#include <format>

#include "mcplease/ContextTypes.h"

namespace mcplease {

std::string FormatIsoTime(WallClock::time_point tp) {
    return std::format("{:%FT%T}Z", std::chrono::floor<std::chrono::microseconds>(tp));
}

std::optional<WallClock::time_point> ParseIsoTime(const std::string& text) {
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0, consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
        return std::nullopt;
    }
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60) {
        return std::nullopt;
    }
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    const std::time_t secs = ::timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    std::size_t i = static_cast<std::size_t>(consumed);
    int64_t micros = 0;
    if (i < text.size() && text[i] == '.') {
        ++i;
        int digits = 0;
        while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
            if (digits < 6) { micros = micros * 10 + (text[i] - '0'); ++digits; }
            ++i;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 6; ++digits) micros *= 10;
    }
    if (i < text.size() && text[i] == 'Z') ++i;
    if (i != text.size()) {
        return std::nullopt;
    }
    return WallClock::from_time_t(secs) + std::chrono::microseconds(micros);
}

JSONValue ConversationEntryToJSON(const ConversationEntry& entry) {
    JSONValue::Object o;
    o["role"] = std::make_shared<JSONValue>(entry.role);
    o["content"] = std::make_shared<JSONValue>(entry.content);
    o["timestamp"] = std::make_shared<JSONValue>(FormatIsoTime(entry.timestamp));
    o["metadata"] = std::make_shared<JSONValue>(entry.metadata.IsObject() ? entry.metadata : JSONValue{JSONValue::Object{}});
    return JSONValue{o};
}

std::optional<ConversationEntry> ConversationEntryFromJSON(const JSONValue& value) {
    auto role = GetStringMember(value, "role");
    auto content = GetStringMember(value, "content");
    if (!role || !content) return std::nullopt;
    ConversationEntry e;
    e.role = std::move(*role);
    e.content = std::move(*content);
    if (auto ts = GetStringMember(value, "timestamp")) {
        if (auto tp = ParseIsoTime(*ts)) e.timestamp = *tp;
    }
    if (const JSONValue* md = FindMember(value, "metadata"); md && md->IsObject()) {
        e.metadata = *md;
    }
    return e;
}

JSONValue ContextToJSON(const Context& context) {
    auto optString = [](const std::optional<std::string>& s) {
        return s.has_value() ? std::make_shared<JSONValue>(*s) : std::make_shared<JSONValue>(nullptr);
    };
    JSONValue::Array files;
    for (const auto& f : context.activeFiles) files.push_back(std::make_shared<JSONValue>(f));
    JSONValue::Array history;
    for (const auto& e : context.conversationHistory) history.push_back(std::make_shared<JSONValue>(ConversationEntryToJSON(e)));

    JSONValue::Object o;
    o["session_id"] = std::make_shared<JSONValue>(context.sessionId);
    o["user_id"] = optString(context.userId);
    o["workspace_path"] = optString(context.workspacePath);
    o["active_files"] = std::make_shared<JSONValue>(std::move(files));
    o["conversation_history"] = std::make_shared<JSONValue>(std::move(history));
    o["metadata"] = std::make_shared<JSONValue>(context.metadata.IsObject() ? context.metadata : JSONValue{JSONValue::Object{}});
    o["created_at"] = std::make_shared<JSONValue>(FormatIsoTime(context.createdAt));
    o["last_accessed"] = std::make_shared<JSONValue>(FormatIsoTime(context.lastAccessed));
    return JSONValue{o};
}

std::optional<Context> ContextFromJSON(const JSONValue& value) {
    auto sessionId = GetStringMember(value, "session_id");
    if (!sessionId || sessionId->empty()) return std::nullopt;
    auto created = GetStringMember(value, "created_at");
    auto accessed = GetStringMember(value, "last_accessed");
    if (!created || !accessed) return std::nullopt;
    auto createdAt = ParseIsoTime(*created);
    auto lastAccessed = ParseIsoTime(*accessed);
    if (!createdAt || !lastAccessed) return std::nullopt;

    Context c;
    c.sessionId = std::move(*sessionId);
    c.userId = GetStringMember(value, "user_id");
    c.workspacePath = GetStringMember(value, "workspace_path");
    c.createdAt = *createdAt;
    c.lastAccessed = *lastAccessed;
    if (const JSONValue* files = FindMember(value, "active_files"); files && files->IsArray()) {
        for (const auto& f : std::get<JSONValue::Array>(files->value)) {
            if (f && f->IsString()) c.activeFiles.push_back(std::get<std::string>(f->value));
        }
    }
    if (const JSONValue* hist = FindMember(value, "conversation_history"); hist && hist->IsArray()) {
        for (const auto& h : std::get<JSONValue::Array>(hist->value)) {
            if (!h) continue;
            if (auto e = ConversationEntryFromJSON(*h)) c.conversationHistory.push_back(std::move(*e));
        }
    }
    if (const JSONValue* md = FindMember(value, "metadata"); md && md->IsObject()) {
        c.metadata = *md;
    }
    return c;
}

} // namespace mcplease
