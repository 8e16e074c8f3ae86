//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextStore.cpp
// Purpose: File-backed and in-memory context stores
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

#include "logging/Logger.h"
#include "mcplease/ContextStore.h"

namespace fs = std::filesystem;

namespace mcplease {

namespace {
std::atomic<uint64_t> gTempCounter{0};

std::optional<Context> decode(const std::string& text) {
    auto doc = ParseJSONValue(text);
    if (!doc.has_value()) return std::nullopt;
    return ContextFromJSON(*doc);
}

bool plainFileChar(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}
} // namespace

/////////////////////////////////////////// RecordIndex ///////////////////////////////////////////

void RecordIndex::Upsert(const std::string& id, WallClock::time_point lastAccessed,
                         const std::optional<std::string>& userId, uint64_t bytes) {
    (void)Erase(id);
    meta[id] = Meta{lastAccessed, userId, bytes};
    byAccess.insert({lastAccessed, id});
    if (userId) byUser[*userId].insert(id);
    totalBytes += bytes;
}

bool RecordIndex::Erase(const std::string& id) {
    auto it = meta.find(id);
    if (it == meta.end()) return false;
    byAccess.erase({it->second.lastAccessed, id});
    if (it->second.userId) {
        auto u = byUser.find(*it->second.userId);
        if (u != byUser.end()) {
            u->second.erase(id);
            if (u->second.empty()) byUser.erase(u);
        }
    }
    totalBytes -= it->second.bytes;
    meta.erase(it);
    return true;
}

std::vector<std::string> RecordIndex::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(meta.size());
    for (const auto& kv : meta) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::string> RecordIndex::OlderThan(WallClock::time_point cutoff) const {
    std::vector<std::string> ids;
    for (auto it = byAccess.begin(); it != byAccess.end() && it->first < cutoff; ++it) {
        ids.push_back(it->second);
    }
    return ids;
}

std::vector<std::string> RecordIndex::ForUser(const std::string& userId) const {
    auto it = byUser.find(userId);
    if (it == byUser.end()) return {};
    return {it->second.begin(), it->second.end()};
}

/////////////////////////////////////////// FileContextStore ///////////////////////////////////////////

FileContextStore::FileContextStore(fs::path dir) : directory(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("cannot create context directory " + directory.string() + ": " + ec.message());
    }
    scan();
    LOG_INFO("Context storage directory: {} ({} records)", directory.string(), index.Size());
}

fs::path FileContextStore::PathFor(const std::string& sessionId) const {
    static const char* hex = "0123456789ABCDEF";
    std::string name;
    name.reserve(sessionId.size() + 5);
    for (unsigned char c : sessionId) {
        if (plainFileChar(c)) {
            name.push_back(static_cast<char>(c));
        } else {
            name.push_back('%');
            name.push_back(hex[c >> 4]);
            name.push_back(hex[c & 0x0F]);
        }
    }
    return directory / (name + ".json");
}

void FileContextStore::scan() {
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& p = it->path();
        if (p.extension() != ".json") continue;
        uint64_t bytes = 0;
        auto ctx = loadFile(p, &bytes);
        if (!ctx.has_value()) continue;
        if (PathFor(ctx->sessionId).filename() != p.filename()) {
            LOG_WARN("Ignoring context file {}: it holds session {}", p.string(), ctx->sessionId);
            continue;
        }
        index.Upsert(ctx->sessionId, ctx->lastAccessed, ctx->userId, bytes);
    }
    if (ec) {
        LOG_ERROR("Failed to scan context directory {}: {}", directory.string(), ec.message());
    }
}

bool FileContextStore::Put(const Context& context) {
    const fs::path target = PathFor(context.sessionId);
    const fs::path tmp = target.string() + ".tmp." + std::to_string(::getpid()) + "." + std::to_string(gTempCounter.fetch_add(1));
    const std::string blob = SerializeJSONValue(ContextToJSON(context));
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            LOG_ERROR("Failed to open {} for writing", tmp.string());
            return false;
        }
        out << blob;
        out.flush();
        if (!out) {
            LOG_ERROR("Failed to write context {}", context.sessionId);
            std::error_code ec;
            fs::remove(tmp, ec);
            return false;
        }
    }
    std::lock_guard<std::mutex> lk(mtx);
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        LOG_ERROR("Failed to persist context {}: {}", context.sessionId, ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    index.Upsert(context.sessionId, context.lastAccessed, context.userId, blob.size());
    return true;
}

std::optional<Context> FileContextStore::loadFile(const fs::path& file, uint64_t* bytes) {
    std::ifstream in(file, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();
    if (bytes) *bytes = text.size();
    auto ctx = decode(text);
    if (!ctx.has_value()) {
        LOG_WARN("Ignoring unreadable context file {}", file.string());
    }
    return ctx;
}

std::optional<Context> FileContextStore::Get(const std::string& sessionId) {
    const fs::path file = PathFor(sessionId);
    std::error_code ec;
    if (!fs::exists(file, ec)) return std::nullopt;
    auto ctx = loadFile(file);
    if (ctx.has_value() && ctx->sessionId != sessionId) {
        LOG_WARN("Context file {} belongs to session {}, not {}", file.string(), ctx->sessionId, sessionId);
        return std::nullopt;
    }
    return ctx;
}

bool FileContextStore::Delete(const std::string& sessionId) {
    std::lock_guard<std::mutex> lk(mtx);
    std::error_code ec;
    bool removed = fs::remove(PathFor(sessionId), ec);
    if (ec) {
        LOG_ERROR("Failed to delete context {}: {}", sessionId, ec.message());
        return false;
    }
    (void)index.Erase(sessionId);
    return removed;
}

std::vector<std::string> FileContextStore::List() {
    std::lock_guard<std::mutex> lk(mtx);
    return index.Ids();
}

std::vector<std::string> FileContextStore::ListOlderThan(WallClock::time_point cutoff) {
    std::lock_guard<std::mutex> lk(mtx);
    return index.OlderThan(cutoff);
}

std::vector<std::string> FileContextStore::ListForUser(const std::string& userId) {
    std::lock_guard<std::mutex> lk(mtx);
    return index.ForUser(userId);
}

StoreStats FileContextStore::Stats() {
    StoreStats s;
    s.location = directory.string();
    std::lock_guard<std::mutex> lk(mtx);
    s.records = index.Size();
    s.totalBytes = index.TotalBytes();
    return s;
}

/////////////////////////////////////////// MemoryContextStore ///////////////////////////////////////////

bool MemoryContextStore::Put(const Context& context) {
    std::string blob = SerializeJSONValue(ContextToJSON(context));
    std::lock_guard<std::mutex> lk(mtx);
    index.Upsert(context.sessionId, context.lastAccessed, context.userId, blob.size());
    records[context.sessionId] = std::move(blob);
    return true;
}

std::optional<Context> MemoryContextStore::Get(const std::string& sessionId) {
    std::string blob;
    {
        std::lock_guard<std::mutex> lk(mtx);
        auto it = records.find(sessionId);
        if (it == records.end()) return std::nullopt;
        blob = it->second;
    }
    return decode(blob);
}

bool MemoryContextStore::Delete(const std::string& sessionId) {
    std::lock_guard<std::mutex> lk(mtx);
    (void)index.Erase(sessionId);
    return records.erase(sessionId) > 0;
}

std::vector<std::string> MemoryContextStore::List() {
    std::lock_guard<std::mutex> lk(mtx);
    return index.Ids();
}

std::vector<std::string> MemoryContextStore::ListOlderThan(WallClock::time_point cutoff) {
    std::lock_guard<std::mutex> lk(mtx);
    return index.OlderThan(cutoff);
}

std::vector<std::string> MemoryContextStore::ListForUser(const std::string& userId) {
    std::lock_guard<std::mutex> lk(mtx);
    return index.ForUser(userId);
}

StoreStats MemoryContextStore::Stats() {
    StoreStats s;
    s.location = "memory";
    std::lock_guard<std::mutex> lk(mtx);
    s.records = index.Size();
    s.totalBytes = index.TotalBytes();
    return s;
}

} // namespace mcplease
