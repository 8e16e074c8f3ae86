//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextManager.h
// Purpose: Per-session context lifecycle: bounded history/files, TTL expiry, two-tier storage, reaper
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplease/ContextStore.h"
#include "mcplease/ContextTypes.h"

namespace mcplease {

//==========================================================================================================
// ContextManagerOptions
// Fields:
//   maxContextAge: Idle time after which a context is treated as gone.
//   maxHistory / maxActiveFiles: Caps; inserting beyond them evicts the oldest element.
//   maxContextsPerUser: Applied whenever a context is created for a user.
//   cleanupInterval: Reaper period.
//   clock: Wall-clock source (injectable for tests).
//==========================================================================================================
struct ContextManagerOptions {
    std::chrono::minutes maxContextAge{30};
    std::size_t maxHistory{50};
    std::size_t maxActiveFiles{20};
    std::size_t maxContextsPerUser{10};
    std::chrono::seconds cleanupInterval{300};
    std::function<WallClock::time_point()> clock;
};

// Fields to replace in Update; absent fields are left alone.
struct ContextUpdate {
    std::optional<std::string> userId;
    std::optional<std::string> workspacePath;
    std::optional<std::vector<std::string>> activeFiles;
    std::optional<JSONValue> metadata;
};

//==========================================================================================================
// ContextManager
// Purpose: Thread-safe session store. The in-memory cache is authoritative for live sessions; every
//          mutation is written through to the IContextStore, and cache misses fall back to it.
// Concurrency:
//   Each session has its own mutex; operations on different sessions do not contend beyond a short
//   index lookup. Operations on one session are serialized, so bounded appends never lose updates.
//   A sorted index on last_accessed makes CleanupExpired proportional to the number of expired sessions.
//==========================================================================================================
class ContextManager {
public:
    using Options = ContextManagerOptions;

    explicit ContextManager(std::shared_ptr<IContextStore> store, Options opts = {});
    ~ContextManager();

    ContextManager(const ContextManager&) = delete;
    ContextManager& operator=(const ContextManager&) = delete;

    ///////////////////////////////////////// Lifecycle /////////////////////////////////////////
    // Starts/stops the background reaper. Stop waits for a sweep in progress to finish.
    void Start();
    void Stop();
    bool IsRunning() const;

    ///////////////////////////////////////// Sessions /////////////////////////////////////////
    //==========================================================================================================
    // Create
    // Purpose: Creates (or replaces) a session. An empty/absent id generates "mcp_session_<8 hex>".
    //          When userId is set, the user's oldest sessions beyond maxContextsPerUser are removed.
    //==========================================================================================================
    Context Create(std::optional<std::string> sessionId = std::nullopt,
                   std::optional<std::string> userId = std::nullopt,
                   std::optional<std::string> workspacePath = std::nullopt,
                   std::optional<JSONValue> metadata = std::nullopt);

    // Returns the live session or creates it with the given id.
    Context GetOrCreate(const std::string& sessionId, std::optional<std::string> userId = std::nullopt);

    // nullopt when missing or expired (an expired session is removed). Refreshes last_accessed.
    std::optional<Context> Get(const std::string& sessionId);

    bool Update(const std::string& sessionId, const ContextUpdate& update);
    // Empties history, active files and metadata; the session itself stays.
    bool Clear(const std::string& sessionId);
    bool Delete(const std::string& sessionId);

    ///////////////////////////////////////// Contents /////////////////////////////////////////
    //==========================================================================================================
    // AddConversationEntry
    // Args:
    //   receivedAt: Receive time of the originating request. The entry is placed after every entry with an
    //               earlier or equal receive time, so concurrent requests land in parse order.
    // Returns:
    //   false when the session does not exist (or expired).
    //==========================================================================================================
    bool AddConversationEntry(const std::string& sessionId,
                              const std::string& role,
                              const std::string& content,
                              JSONValue metadata = JSONValue{JSONValue::Object{}},
                              std::optional<std::chrono::steady_clock::time_point> receivedAt = std::nullopt);

    // Moves an already present file to the most-recent position.
    bool AddActiveFile(const std::string& sessionId, const std::string& path);
    bool RemoveActiveFile(const std::string& sessionId, const std::string& path);

    // Last `limit` entries (all when limit == 0); nullopt when the session does not exist.
    std::optional<std::vector<ConversationEntry>> GetConversationHistory(const std::string& sessionId, std::size_t limit = 0);

    ///////////////////////////////////////// Queries and maintenance /////////////////////////////////////////
    std::vector<Context> ListForUser(const std::string& userId);
    std::vector<std::string> ListSessions();

    // Removes expired sessions from cache and store. Returns the number removed.
    std::size_t CleanupExpired();

    // Keeps the `max` most recently accessed sessions of userId. Returns the number removed.
    std::size_t EnforcePerUserLimit(const std::string& userId, std::size_t max);

    //==========================================================================================================
    // Stats
    // Returns:
    //   {total_contexts, active_users, total_conversations, total_active_files, average_conversation_length,
    //    contexts_by_age, max_context_age_minutes, max_contexts_per_user,
    //    storage:{storage_dir, cached_contexts, disk_contexts, total_size_bytes}}
    //==========================================================================================================
    JSONValue Stats();

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplease
