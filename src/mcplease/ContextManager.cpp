//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextManager.cpp
// Purpose: Session context lifecycle over a write-through cache
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <iomanip>
#include <mutex>
#include <random>
#include <set>
#include <stdexcept>
#include <shared_mutex>
#include <sstream>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "logging/Logger.h"
#include "mcplease/ContextManager.h"

namespace mcplease {

namespace {
std::string makeSessionId() {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dis;
    std::ostringstream oss;
    oss << "mcp_session_" << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    return oss.str();
}
} // namespace

class ContextManager::Impl {
public:
    struct Entry {
        std::mutex mtx;
        Context ctx;
        bool removed{false};
    };
    using TimePoint = WallClock::time_point;

    std::shared_ptr<IContextStore> store;
    ContextManager::Options opts;

    // Lock order: Entry::mtx -> indexMutex -> accessMutex. Store calls that must agree with the cache
    // (miss loads, deletes) run under indexMutex.
    mutable std::shared_mutex indexMutex;
    std::unordered_map<std::string, std::shared_ptr<Entry>> cache;
    std::mutex accessMutex;
    std::set<std::pair<TimePoint, std::string>> byAccess;
    std::unordered_map<std::string, std::set<std::string>> byUser;

    std::atomic<bool> running{false};
    std::mutex reaperMutex;
    std::condition_variable_any reaperCv;
    std::jthread reaper;

    Impl(std::shared_ptr<IContextStore> s, ContextManager::Options o)
        : store(std::move(s)), opts(std::move(o)) {
        if (!store) {
            throw std::invalid_argument("ContextManager: store is null");
        }
        if (!opts.clock) {
            opts.clock = []() { return WallClock::now(); };
        }
        opts.maxHistory = std::max<std::size_t>(opts.maxHistory, 1);
        opts.maxActiveFiles = std::max<std::size_t>(opts.maxActiveFiles, 1);
    }

    TimePoint now() const { return opts.clock(); }

    bool expired(const Context& c, TimePoint t) const {
        return t - c.lastAccessed > opts.maxContextAge;
    }

    void persist(const Context& c) {
        if (!store->Put(c)) {
            LOG_WARN("Context {} could not be persisted; kept in memory only", c.sessionId);
        }
    }

    void indexAccess(const std::string& id, std::optional<TimePoint> previous, TimePoint current) {
        std::lock_guard<std::mutex> lk(accessMutex);
        if (previous) byAccess.erase({*previous, id});
        byAccess.insert({current, id});
    }

    void unindexAccess(const std::string& id, TimePoint at) {
        std::lock_guard<std::mutex> lk(accessMutex);
        byAccess.erase({at, id});
    }

    void indexUser(const std::string& id, const std::optional<std::string>& previous,
                   const std::optional<std::string>& current) {
        if (previous == current) return;
        std::lock_guard<std::mutex> lk(accessMutex);
        if (previous) {
            auto it = byUser.find(*previous);
            if (it != byUser.end()) {
                it->second.erase(id);
                if (it->second.empty()) byUser.erase(it);
            }
        }
        if (current) byUser[*current].insert(id);
    }

    std::shared_ptr<Entry> findCached(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lk(indexMutex);
        auto it = cache.find(id);
        return it == cache.end() ? nullptr : it->second;
    }

    // Cache first, then the store; a record found on disk is cached.
    std::shared_ptr<Entry> lookup(const std::string& id) {
        if (auto e = findCached(id)) return e;
        std::unique_lock<std::shared_mutex> lk(indexMutex);
        if (auto it = cache.find(id); it != cache.end()) return it->second;
        auto loaded = store->Get(id);
        if (!loaded.has_value()) return nullptr;
        auto e = std::make_shared<Entry>();
        e->ctx = std::move(*loaded);
        cache.emplace(id, e);
        indexAccess(id, std::nullopt, e->ctx.lastAccessed);
        indexUser(id, std::nullopt, e->ctx.userId);
        LOG_DEBUG("Loaded context {} from storage", id);
        return e;
    }

    // Caller holds entry.mtx. The cache slot and the stored record go together.
    void removeLocked(const std::string& id, Entry& entry) {
        entry.removed = true;
        {
            std::unique_lock<std::shared_mutex> lk(indexMutex);
            auto it = cache.find(id);
            if (it != cache.end() && it->second.get() != &entry) return; // replaced by Create
            if (it != cache.end()) cache.erase(it);
            (void)store->Delete(id);
        }
        unindexAccess(id, entry.ctx.lastAccessed);
        indexUser(id, entry.ctx.userId, std::nullopt);
    }

    // Runs fn on a live session after refreshing last_accessed, then writes through.
    template <class Fn>
    bool withLive(const std::string& id, Fn&& fn) {
        auto e = lookup(id);
        if (!e) return false;
        std::lock_guard<std::mutex> lk(e->mtx);
        if (e->removed) return false;
        const TimePoint t = now();
        if (expired(e->ctx, t)) {
            LOG_DEBUG("Context {} expired", id);
            removeLocked(id, *e);
            return false;
        }
        const TimePoint previous = e->ctx.lastAccessed;
        e->ctx.lastAccessed = t;
        indexAccess(id, previous, t);
        fn(e->ctx);
        persist(e->ctx);
        return true;
    }

    // Copy of a live session without touching last_accessed.
    std::optional<Context> peek(const std::string& id) {
        auto e = lookup(id);
        if (!e) return std::nullopt;
        std::lock_guard<std::mutex> lk(e->mtx);
        if (e->removed) return std::nullopt;
        if (expired(e->ctx, now())) {
            removeLocked(id, *e);
            return std::nullopt;
        }
        return e->ctx;
    }

    bool remove(const std::string& id) {
        auto e = lookup(id);
        if (!e) return false;
        std::lock_guard<std::mutex> lk(e->mtx);
        if (e->removed) return false;
        removeLocked(id, *e);
        return true;
    }

    // With replace=false an existing cached session wins and nullopt is returned.
    std::optional<Context> create(std::optional<std::string> sessionId, std::optional<std::string> userId,
                                  std::optional<std::string> workspacePath, std::optional<JSONValue> metadata,
                                  bool replace) {
        std::string id = sessionId.value_or(std::string());
        if (id.empty()) {
            do {
                id = makeSessionId();
            } while (findCached(id) || store->Get(id).has_value());
        }
        const TimePoint t = now();
        auto e = std::make_shared<Entry>();
        e->ctx.sessionId = id;
        e->ctx.userId = std::move(userId);
        e->ctx.workspacePath = std::move(workspacePath);
        if (metadata.has_value() && metadata->IsObject()) e->ctx.metadata = std::move(*metadata);
        e->ctx.createdAt = t;
        e->ctx.lastAccessed = t;

        Context created;
        {
            std::lock_guard<std::mutex> elk(e->mtx);
            std::shared_ptr<Entry> previous;
            {
                std::unique_lock<std::shared_mutex> lk(indexMutex);
                auto& slot = cache[id];
                if (slot && !replace) return std::nullopt;
                previous = std::move(slot);
                slot = e;
            }
            if (previous) {
                std::lock_guard<std::mutex> plk(previous->mtx);
                previous->removed = true;
                unindexAccess(id, previous->ctx.lastAccessed);
                indexUser(id, previous->ctx.userId, std::nullopt);
                LOG_INFO("Replacing existing context for session: {}", id);
            }
            indexAccess(id, std::nullopt, t);
            indexUser(id, std::nullopt, e->ctx.userId);
            persist(e->ctx);
            created = e->ctx;
        }
        LOG_INFO("Created context for session: {}", id);
        if (created.userId.has_value() && opts.maxContextsPerUser > 0) {
            (void)enforcePerUser(*created.userId, opts.maxContextsPerUser, id);
        }
        return created;
    }

    // Only the user's own sessions are read; records of other users stay on disk.
    std::vector<Context> listForUser(const std::string& userId) {
        std::unordered_set<std::string> ids;
        {
            std::lock_guard<std::mutex> lk(accessMutex);
            auto it = byUser.find(userId);
            if (it != byUser.end()) ids.insert(it->second.begin(), it->second.end());
        }
        for (auto& id : store->ListForUser(userId)) ids.insert(std::move(id));

        std::vector<Context> out;
        for (const auto& id : ids) {
            auto c = peek(id);
            if (c.has_value() && c->userId.has_value() && *c->userId == userId) out.push_back(std::move(*c));
        }
        std::sort(out.begin(), out.end(), [](const Context& a, const Context& b) { return a.lastAccessed > b.lastAccessed; });
        return out;
    }

    std::size_t enforcePerUser(const std::string& userId, std::size_t max, const std::string& keep) {
        auto contexts = listForUser(userId);
        if (contexts.size() <= max) return 0;
        if (!keep.empty()) {
            std::stable_partition(contexts.begin(), contexts.end(), [&](const Context& c) { return c.sessionId == keep; });
        }
        std::size_t removed = 0;
        for (std::size_t i = max; i < contexts.size(); ++i) {
            if (remove(contexts[i].sessionId)) ++removed;
        }
        if (removed > 0) {
            LOG_INFO("Removed {} contexts for user {} to enforce limits", removed, userId);
        }
        return removed;
    }

    std::size_t cleanupExpired() {
        const TimePoint t = now();
        const TimePoint cutoff = t - opts.maxContextAge;
        std::vector<std::string> candidates;
        {
            std::lock_guard<std::mutex> lk(accessMutex);
            for (auto it = byAccess.begin(); it != byAccess.end() && it->first < cutoff; ++it) {
                candidates.push_back(it->second);
            }
        }
        std::size_t removed = 0;
        for (const auto& id : candidates) {
            auto e = findCached(id);
            if (!e) continue;
            std::lock_guard<std::mutex> lk(e->mtx);
            if (!e->removed && expired(e->ctx, t)) {
                removeLocked(id, *e);
                ++removed;
            }
        }
        for (const auto& id : store->ListOlderThan(cutoff)) {
            std::unique_lock<std::shared_mutex> lk(indexMutex);
            if (cache.count(id) > 0) continue;
            if (store->Delete(id)) ++removed;
        }
        if (removed > 0) {
            LOG_INFO("Cleaned up {} expired contexts", removed);
        }
        return removed;
    }

    void reaperLoop(std::stop_token st) {
        std::unique_lock<std::mutex> lk(reaperMutex);
        while (!st.stop_requested()) {
            reaperCv.wait_for(lk, st, opts.cleanupInterval, []() { return false; });
            if (st.stop_requested()) break;
            lk.unlock();
            try {
                (void)cleanupExpired();
            } catch (const std::exception& e) {
                LOG_ERROR("Context cleanup failed: {}", e.what());
            }
            lk.lock();
        }
    }
};

ContextManager::ContextManager(std::shared_ptr<IContextStore> store, Options opts)
    : pImpl(std::make_unique<Impl>(std::move(store), std::move(opts))) {}

ContextManager::~ContextManager() {
    Stop();
}

void ContextManager::Start() {
    if (pImpl->running.exchange(true)) return;
    pImpl->reaper = std::jthread([impl = pImpl.get()](std::stop_token st) { impl->reaperLoop(st); });
    LOG_INFO("Context manager started (ttl {} min, cleanup every {} s)", pImpl->opts.maxContextAge.count(),
             pImpl->opts.cleanupInterval.count());
}

void ContextManager::Stop() {
    if (!pImpl->running.exchange(false)) return;
    pImpl->reaper.request_stop();
    if (pImpl->reaper.joinable()) pImpl->reaper.join();
    LOG_INFO("Context manager stopped");
}

bool ContextManager::IsRunning() const { return pImpl->running.load(); }

Context ContextManager::Create(std::optional<std::string> sessionId, std::optional<std::string> userId,
                               std::optional<std::string> workspacePath, std::optional<JSONValue> metadata) {
    return *pImpl->create(std::move(sessionId), std::move(userId), std::move(workspacePath), std::move(metadata), true);
}

Context ContextManager::GetOrCreate(const std::string& sessionId, std::optional<std::string> userId) {
    // A concurrent creator of the same id wins; retry the read in that case.
    for (int attempt = 0; attempt < 3; ++attempt) {
        if (auto existing = Get(sessionId)) return *existing;
        if (auto created = pImpl->create(sessionId, userId, std::nullopt, std::nullopt, false)) return *created;
    }
    LOG_WARN("Context {} kept changing while being created; replacing it", sessionId);
    return *pImpl->create(sessionId, std::move(userId), std::nullopt, std::nullopt, true);
}

std::optional<Context> ContextManager::Get(const std::string& sessionId) {
    std::optional<Context> out;
    (void)pImpl->withLive(sessionId, [&](Context& c) { out = c; });
    return out;
}

bool ContextManager::Update(const std::string& sessionId, const ContextUpdate& update) {
    const std::size_t maxFiles = pImpl->opts.maxActiveFiles;
    bool ok = pImpl->withLive(sessionId, [&](Context& c) {
        if (update.userId) {
            pImpl->indexUser(c.sessionId, c.userId, update.userId);
            c.userId = *update.userId;
        }
        if (update.workspacePath) c.workspacePath = *update.workspacePath;
        if (update.activeFiles) {
            c.activeFiles = *update.activeFiles;
            if (c.activeFiles.size() > maxFiles) {
                c.activeFiles.erase(c.activeFiles.begin(), c.activeFiles.end() - static_cast<std::ptrdiff_t>(maxFiles));
            }
        }
        if (update.metadata && update.metadata->IsObject()) c.metadata = *update.metadata;
    });
    if (ok) LOG_DEBUG("Updated context for session: {}", sessionId);
    return ok;
}

bool ContextManager::Clear(const std::string& sessionId) {
    bool ok = pImpl->withLive(sessionId, [](Context& c) {
        c.activeFiles.clear();
        c.conversationHistory.clear();
        c.metadata = JSONValue{JSONValue::Object{}};
    });
    if (ok) LOG_INFO("Cleared context data for session: {}", sessionId);
    return ok;
}

bool ContextManager::Delete(const std::string& sessionId) {
    bool ok = pImpl->remove(sessionId);
    if (ok) LOG_INFO("Deleted context for session: {}", sessionId);
    return ok;
}

bool ContextManager::AddConversationEntry(const std::string& sessionId, const std::string& role,
                                          const std::string& content, JSONValue metadata,
                                          std::optional<std::chrono::steady_clock::time_point> receivedAt) {
    ConversationEntry entry;
    entry.role = role;
    entry.content = content;
    entry.timestamp = pImpl->now();
    entry.metadata = metadata.IsObject() ? std::move(metadata) : JSONValue{JSONValue::Object{}};
    entry.order = receivedAt.value_or(std::chrono::steady_clock::now());
    const std::size_t maxHistory = pImpl->opts.maxHistory;
    return pImpl->withLive(sessionId, [&](Context& c) {
        auto& h = c.conversationHistory;
        auto pos = std::upper_bound(h.begin(), h.end(), entry.order,
                                    [](const auto& order, const ConversationEntry& e) { return order < e.order; });
        h.insert(pos, std::move(entry));
        if (h.size() > maxHistory) {
            h.erase(h.begin(), h.begin() + static_cast<std::ptrdiff_t>(h.size() - maxHistory));
        }
    });
}

bool ContextManager::AddActiveFile(const std::string& sessionId, const std::string& path) {
    const std::size_t maxFiles = pImpl->opts.maxActiveFiles;
    return pImpl->withLive(sessionId, [&](Context& c) {
        auto& f = c.activeFiles;
        f.erase(std::remove(f.begin(), f.end(), path), f.end());
        f.push_back(path);
        if (f.size() > maxFiles) {
            f.erase(f.begin(), f.begin() + static_cast<std::ptrdiff_t>(f.size() - maxFiles));
        }
    });
}

bool ContextManager::RemoveActiveFile(const std::string& sessionId, const std::string& path) {
    bool found = false;
    bool live = pImpl->withLive(sessionId, [&](Context& c) {
        auto& f = c.activeFiles;
        auto it = std::find(f.begin(), f.end(), path);
        if (it != f.end()) {
            f.erase(it);
            found = true;
        }
    });
    return live && found;
}

std::optional<std::vector<ConversationEntry>> ContextManager::GetConversationHistory(const std::string& sessionId,
                                                                                     std::size_t limit) {
    std::optional<std::vector<ConversationEntry>> out;
    (void)pImpl->withLive(sessionId, [&](Context& c) {
        const auto& h = c.conversationHistory;
        const std::size_t n = (limit == 0 || limit > h.size()) ? h.size() : limit;
        out.emplace(h.end() - static_cast<std::ptrdiff_t>(n), h.end());
    });
    return out;
}

std::vector<Context> ContextManager::ListForUser(const std::string& userId) {
    return pImpl->listForUser(userId);
}

// Store-only records are judged by the store's index and are not loaded.
std::vector<std::string> ContextManager::ListSessions() {
    std::vector<std::pair<std::string, std::shared_ptr<Impl::Entry>>> cached;
    {
        std::shared_lock<std::shared_mutex> lk(pImpl->indexMutex);
        cached.assign(pImpl->cache.begin(), pImpl->cache.end());
    }
    const auto t = pImpl->now();
    std::set<std::string> ids;
    std::unordered_set<std::string> seen;
    for (const auto& [id, e] : cached) {
        seen.insert(id);
        std::lock_guard<std::mutex> lk(e->mtx);
        if (!e->removed && !pImpl->expired(e->ctx, t)) ids.insert(id);
    }
    const auto stale = pImpl->store->ListOlderThan(t - pImpl->opts.maxContextAge);
    const std::unordered_set<std::string> staleSet(stale.begin(), stale.end());
    for (auto& id : pImpl->store->List()) {
        if (seen.count(id) == 0 && staleSet.count(id) == 0) ids.insert(std::move(id));
    }
    return {ids.begin(), ids.end()};
}

std::size_t ContextManager::CleanupExpired() {
    return pImpl->cleanupExpired();
}

std::size_t ContextManager::EnforcePerUserLimit(const std::string& userId, std::size_t max) {
    return pImpl->enforcePerUser(userId, max, std::string());
}

JSONValue ContextManager::Stats() {
    std::vector<std::shared_ptr<Impl::Entry>> entries;
    {
        std::shared_lock<std::shared_mutex> lk(pImpl->indexMutex);
        entries.reserve(pImpl->cache.size());
        for (const auto& kv : pImpl->cache) entries.push_back(kv.second);
    }
    const auto t = pImpl->now();
    std::size_t live = 0, conversations = 0, files = 0;
    int64_t under5 = 0, under15 = 0, under30 = 0, over30 = 0;
    std::unordered_set<std::string> users;
    for (const auto& e : entries) {
        std::lock_guard<std::mutex> lk(e->mtx);
        if (e->removed || pImpl->expired(e->ctx, t)) continue;
        ++live;
        conversations += e->ctx.conversationHistory.size();
        files += e->ctx.activeFiles.size();
        if (e->ctx.userId) users.insert(*e->ctx.userId);
        const auto age = t - e->ctx.lastAccessed;
        if (age < std::chrono::minutes(5)) ++under5;
        else if (age < std::chrono::minutes(15)) ++under15;
        else if (age < std::chrono::minutes(30)) ++under30;
        else ++over30;
    }
    const StoreStats ss = pImpl->store->Stats();

    auto num = [](auto v) { return std::make_shared<JSONValue>(static_cast<int64_t>(v)); };
    JSONValue::Object byAge;
    byAge["under_5_min"] = num(under5);
    byAge["5_to_15_min"] = num(under15);
    byAge["15_to_30_min"] = num(under30);
    byAge["over_30_min"] = num(over30);

    JSONValue::Object storage;
    storage["storage_dir"] = std::make_shared<JSONValue>(ss.location);
    storage["cached_contexts"] = num(entries.size());
    storage["disk_contexts"] = num(ss.records);
    storage["total_size_bytes"] = num(ss.totalBytes);

    JSONValue::Object o;
    o["total_contexts"] = num(live);
    o["active_users"] = num(users.size());
    o["total_conversations"] = num(conversations);
    o["total_active_files"] = num(files);
    o["average_conversation_length"] = std::make_shared<JSONValue>(
        live == 0 ? 0.0 : static_cast<double>(conversations) / static_cast<double>(live));
    o["contexts_by_age"] = std::make_shared<JSONValue>(std::move(byAge));
    o["max_context_age_minutes"] = num(pImpl->opts.maxContextAge.count());
    o["max_contexts_per_user"] = num(pImpl->opts.maxContextsPerUser);
    o["storage"] = std::make_shared<JSONValue>(std::move(storage));
    return JSONValue{o};
}

const ContextManager::Options& ContextManager::GetOptions() const {
    return pImpl->opts;
}

} // namespace mcplease
