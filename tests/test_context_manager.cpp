//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_context_manager.cpp
// Purpose: GoogleTests for session lifecycle, TTL expiry, bounded history/files, per-user caps, persistence
//==========================================================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "mcplease/ContextManager.h"

using namespace mcplease;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

// Manually advanced wall clock shared with the manager.
struct FakeClock {
    std::shared_ptr<std::atomic<int64_t>> nowSec = std::make_shared<std::atomic<int64_t>>(1735787045);

    std::function<WallClock::time_point()> Fn() const {
        auto p = nowSec;
        return [p]() { return WallClock::from_time_t(static_cast<std::time_t>(p->load())); };
    }
    void Advance(std::chrono::seconds s) { nowSec->fetch_add(s.count()); }
};

ContextManagerOptions optionsWith(const FakeClock& clock) {
    ContextManagerOptions o;
    o.clock = clock.Fn();
    return o;
}

// Holds every Delete long enough for another thread to race it.
class SlowDeleteStore : public MemoryContextStore {
public:
    bool Delete(const std::string& sessionId) override {
        deleting.store(true);
        std::this_thread::sleep_for(100ms);
        return MemoryContextStore::Delete(sessionId);
    }
    std::atomic<bool> deleting{false};
};

class CountingStore : public MemoryContextStore {
public:
    std::optional<Context> Get(const std::string& sessionId) override {
        gets.fetch_add(1);
        return MemoryContextStore::Get(sessionId);
    }
    std::atomic<int> gets{0};
};

Context storedContext(const std::string& id, std::optional<std::string> user, WallClock::time_point t) {
    Context c;
    c.sessionId = id;
    c.userId = std::move(user);
    c.createdAt = c.lastAccessed = t;
    return c;
}

} // namespace

TEST(ContextManager, CreateGeneratesIdAndPersists) {
    auto store = std::make_shared<MemoryContextStore>();
    ContextManager cm(store);
    Context c = cm.Create();
    EXPECT_EQ(c.sessionId.rfind("mcp_session_", 0), 0u);
    EXPECT_EQ(c.sessionId.size(), std::string("mcp_session_").size() + 8);
    EXPECT_EQ(c.createdAt, c.lastAccessed);
    EXPECT_TRUE(store->Get(c.sessionId).has_value());

    Context named = cm.Create(std::string("explicit"), std::string("u1"), std::string("/work"));
    EXPECT_EQ(named.sessionId, "explicit");
    EXPECT_EQ(named.workspacePath, std::optional<std::string>("/work"));
    EXPECT_EQ(cm.ListSessions().size(), 2u);
}

TEST(ContextManager, GetRefreshesLastAccessed) {
    FakeClock clock;
    ContextManager cm(std::make_shared<MemoryContextStore>(), optionsWith(clock));
    Context c = cm.Create(std::string("s"));
    clock.Advance(60s);
    auto got = cm.Get("s");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->lastAccessed, c.lastAccessed + 60s);
    EXPECT_EQ(got->createdAt, c.createdAt);
}

TEST(ContextManager, ExpiredSessionIsGoneAndRemoved) {
    FakeClock clock;
    auto store = std::make_shared<MemoryContextStore>();
    ContextManagerOptions o = optionsWith(clock);
    o.maxContextAge = 30min;
    ContextManager cm(store, o);
    (void)cm.Create(std::string("s"));

    clock.Advance(29min);
    EXPECT_TRUE(cm.Get("s").has_value()); // refreshes

    clock.Advance(31min);
    EXPECT_FALSE(cm.Get("s").has_value());
    EXPECT_FALSE(store->Get("s").has_value());
    EXPECT_FALSE(cm.AddConversationEntry("s", "user", "late"));
}

TEST(ContextManager, CleanupExpiredRemovesCachedAndStoredRecords) {
    FakeClock clock;
    auto store = std::make_shared<MemoryContextStore>();
    ContextManager cm(store, optionsWith(clock));
    (void)cm.Create(std::string("a"));
    (void)cm.Create(std::string("b"));

    // A record only present in storage (e.g. left by an earlier run)
    Context orphan;
    orphan.sessionId = "orphan";
    orphan.createdAt = orphan.lastAccessed = WallClock::from_time_t(1735787045);
    ASSERT_TRUE(store->Put(orphan));

    clock.Advance(20min);
    EXPECT_TRUE(cm.Get("b").has_value());
    clock.Advance(15min);

    EXPECT_EQ(cm.CleanupExpired(), 2u); // "a" and "orphan"
    EXPECT_EQ(cm.ListSessions(), std::vector<std::string>{"b"});
    EXPECT_EQ(cm.CleanupExpired(), 0u);
}

TEST(ContextManager, HistoryIsBoundedAndKeepsNewest) {
    ContextManagerOptions o;
    o.maxHistory = 50;
    ContextManager cm(std::make_shared<MemoryContextStore>(), o);
    (void)cm.Create(std::string("s"));
    const auto base = std::chrono::steady_clock::now();
    for (int i = 0; i < 60; ++i) {
        ASSERT_TRUE(cm.AddConversationEntry("s", "user", "msg " + std::to_string(i),
                                            JSONValue{JSONValue::Object{}}, base + std::chrono::milliseconds(i)));
    }
    auto history = cm.GetConversationHistory("s");
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(history->size(), 50u);
    EXPECT_EQ(history->front().content, "msg 10");
    EXPECT_EQ(history->back().content, "msg 59");

    auto last3 = cm.GetConversationHistory("s", 3);
    ASSERT_TRUE(last3.has_value());
    ASSERT_EQ(last3->size(), 3u);
    EXPECT_EQ(last3->front().content, "msg 57");
    EXPECT_FALSE(cm.GetConversationHistory("unknown").has_value());
}

TEST(ContextManager, HistoryOrderFollowsReceiveTime) {
    ContextManager cm(std::make_shared<MemoryContextStore>());
    (void)cm.Create(std::string("s"));
    const auto base = std::chrono::steady_clock::now();
    // Recorded out of order; receive time decides the position
    ASSERT_TRUE(cm.AddConversationEntry("s", "user", "second", JSONValue{JSONValue::Object{}}, base + 2ms));
    ASSERT_TRUE(cm.AddConversationEntry("s", "user", "first", JSONValue{JSONValue::Object{}}, base + 1ms));
    ASSERT_TRUE(cm.AddConversationEntry("s", "assistant", "third", JSONValue{JSONValue::Object{}}, base + 2ms));
    auto h = cm.GetConversationHistory("s");
    ASSERT_TRUE(h.has_value());
    ASSERT_EQ(h->size(), 3u);
    EXPECT_EQ((*h)[0].content, "first");
    EXPECT_EQ((*h)[1].content, "second");
    EXPECT_EQ((*h)[2].content, "third");
}

TEST(ContextManager, ActiveFilesBoundedAndDeduplicated) {
    ContextManager cm(std::make_shared<MemoryContextStore>());
    (void)cm.Create(std::string("s"));
    for (int i = 0; i < 25; ++i) {
        ASSERT_TRUE(cm.AddActiveFile("s", "file" + std::to_string(i) + ".py"));
    }
    auto c = cm.Get("s");
    ASSERT_TRUE(c.has_value());
    ASSERT_EQ(c->activeFiles.size(), 20u);
    EXPECT_EQ(c->activeFiles.front(), "file5.py");
    EXPECT_EQ(c->activeFiles.back(), "file24.py");

    // Re-adding moves the file to the most recent slot
    ASSERT_TRUE(cm.AddActiveFile("s", "file5.py"));
    c = cm.Get("s");
    EXPECT_EQ(c->activeFiles.size(), 20u);
    EXPECT_EQ(c->activeFiles.back(), "file5.py");
    EXPECT_EQ(c->activeFiles.front(), "file6.py");

    EXPECT_TRUE(cm.RemoveActiveFile("s", "file5.py"));
    EXPECT_FALSE(cm.RemoveActiveFile("s", "file5.py"));
    EXPECT_FALSE(cm.AddActiveFile("missing", "x"));
}

TEST(ContextManager, UpdateClearDelete) {
    ContextManager cm(std::make_shared<MemoryContextStore>());
    (void)cm.Create(std::string("s"));
    ASSERT_TRUE(cm.AddConversationEntry("s", "user", "hello"));
    ASSERT_TRUE(cm.AddActiveFile("s", "a.py"));

    ContextUpdate u;
    u.workspacePath = "/repo";
    u.metadata = *ParseJSONValue(R"({"editor":"vim"})");
    EXPECT_TRUE(cm.Update("s", u));
    auto c = cm.Get("s");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->workspacePath, std::optional<std::string>("/repo"));
    EXPECT_EQ(GetStringMember(c->metadata, "editor").value_or(""), "vim");
    EXPECT_FALSE(cm.Update("missing", u));

    EXPECT_TRUE(cm.Clear("s"));
    c = cm.Get("s");
    ASSERT_TRUE(c.has_value());
    EXPECT_TRUE(c->conversationHistory.empty());
    EXPECT_TRUE(c->activeFiles.empty());
    EXPECT_EQ(SerializeJSONValue(c->metadata), "{}");
    EXPECT_EQ(c->workspacePath, std::optional<std::string>("/repo"));

    EXPECT_TRUE(cm.Delete("s"));
    EXPECT_FALSE(cm.Delete("s"));
    EXPECT_FALSE(cm.Get("s").has_value());
}

TEST(ContextManager, EnforcePerUserLimitDropsLeastRecentlyAccessed) {
    FakeClock clock;
    ContextManager cm(std::make_shared<MemoryContextStore>(), optionsWith(clock));
    for (int i = 0; i < 7; ++i) {
        (void)cm.Create("u_" + std::to_string(i), std::string("carol"));
        clock.Advance(1s);
    }
    (void)cm.Create(std::string("other"), std::string("dave"));
    // Touch the oldest so it becomes the most recent
    ASSERT_TRUE(cm.Get("u_0").has_value());

    EXPECT_EQ(cm.EnforcePerUserLimit("carol", 5), 2u);
    auto remaining = cm.ListForUser("carol");
    ASSERT_EQ(remaining.size(), 5u);
    EXPECT_EQ(remaining.front().sessionId, "u_0");
    for (const auto& c : remaining) {
        EXPECT_NE(c.sessionId, "u_1");
        EXPECT_NE(c.sessionId, "u_2");
    }
    EXPECT_EQ(cm.ListForUser("dave").size(), 1u);
}

TEST(ContextManager, CreateAppliesPerUserCapAndKeepsNewSession) {
    FakeClock clock;
    ContextManagerOptions o = optionsWith(clock);
    o.maxContextsPerUser = 3;
    ContextManager cm(std::make_shared<MemoryContextStore>(), o);
    for (int i = 0; i < 5; ++i) {
        (void)cm.Create("s" + std::to_string(i), std::string("erin"));
        clock.Advance(1s);
    }
    auto sessions = cm.ListForUser("erin");
    ASSERT_EQ(sessions.size(), 3u);
    EXPECT_EQ(sessions[0].sessionId, "s4");
    EXPECT_EQ(sessions[1].sessionId, "s3");
    EXPECT_EQ(sessions[2].sessionId, "s2");
}

TEST(ContextManager, UpdateMovesSessionBetweenUsers) {
    ContextManager cm(std::make_shared<MemoryContextStore>());
    (void)cm.Create(std::string("s"), std::string("gina"));
    ContextUpdate u;
    u.userId = "hank";
    ASSERT_TRUE(cm.Update("s", u));
    EXPECT_TRUE(cm.ListForUser("gina").empty());
    auto hank = cm.ListForUser("hank");
    ASSERT_EQ(hank.size(), 1u);
    EXPECT_EQ(hank[0].sessionId, "s");
}

TEST(ContextManager, ListForUserReadsOnlyThatUsersRecords) {
    FakeClock clock;
    auto store = std::make_shared<CountingStore>();
    const auto t = WallClock::from_time_t(static_cast<std::time_t>(clock.nowSec->load()));
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(store->Put(storedContext("other_" + std::to_string(i), std::string("ivan"), t)));
    }
    ASSERT_TRUE(store->Put(storedContext("mine", std::string("judy"), t)));
    ASSERT_TRUE(store->Put(storedContext("stale", std::string("judy"), t - 2h)));

    ContextManager cm(store, optionsWith(clock));
    auto judy = cm.ListForUser("judy");
    ASSERT_EQ(judy.size(), 1u);
    EXPECT_EQ(judy[0].sessionId, "mine");
    EXPECT_EQ(store->gets.load(), 2); // "mine" and "stale"

    const int before = store->gets.load();
    auto sessions = cm.ListSessions();
    EXPECT_EQ(sessions.size(), 21u);
    EXPECT_EQ(std::count(sessions.begin(), sessions.end(), "stale"), 0);
    EXPECT_EQ(store->gets.load(), before);
}

TEST(ContextManager, LookupDuringDeleteDoesNotRestoreSession) {
    auto store = std::make_shared<SlowDeleteStore>();
    ContextManager cm(store);
    (void)cm.Create(std::string("s"));

    std::thread deleter([&cm]() { EXPECT_TRUE(cm.Delete("s")); });
    while (!store->deleting.load()) std::this_thread::sleep_for(1ms);
    EXPECT_FALSE(cm.Get("s").has_value());
    deleter.join();

    EXPECT_FALSE(cm.Get("s").has_value());
    EXPECT_TRUE(cm.ListSessions().empty());
    EXPECT_FALSE(store->Get("s").has_value());
    EXPECT_FALSE(cm.AddConversationEntry("s", "user", "late"));
}

TEST(ContextManager, GetOrCreateIsSafeUnderConcurrency) {
    ContextManager cm(std::make_shared<MemoryContextStore>());
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&cm, i]() {
            (void)cm.GetOrCreate("shared");
            EXPECT_TRUE(cm.AddConversationEntry("shared", "user", "call " + std::to_string(i)));
        });
    }
    for (auto& t : threads) t.join();
    auto h = cm.GetConversationHistory("shared");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->size(), 8u);
    EXPECT_EQ(cm.ListSessions().size(), 1u);
}

TEST(ContextManager, StatsReportsCountsAndStorage) {
    ContextManager cm(std::make_shared<MemoryContextStore>());
    (void)cm.Create(std::string("a"), std::string("u1"));
    (void)cm.Create(std::string("b"), std::string("u2"));
    ASSERT_TRUE(cm.AddConversationEntry("a", "user", "x"));
    ASSERT_TRUE(cm.AddConversationEntry("a", "user", "y"));
    ASSERT_TRUE(cm.AddActiveFile("b", "f.py"));

    JSONValue s = cm.Stats();
    EXPECT_EQ(GetIntMember(s, "total_contexts").value_or(-1), 2);
    EXPECT_EQ(GetIntMember(s, "active_users").value_or(-1), 2);
    EXPECT_EQ(GetIntMember(s, "total_conversations").value_or(-1), 2);
    EXPECT_EQ(GetIntMember(s, "total_active_files").value_or(-1), 1);
    EXPECT_EQ(GetIntMember(s, "max_context_age_minutes").value_or(-1), 30);
    const JSONValue* avg = FindMember(s, "average_conversation_length");
    ASSERT_NE(avg, nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>(avg->value), 1.0);
    const JSONValue* byAge = FindMember(s, "contexts_by_age");
    ASSERT_NE(byAge, nullptr);
    EXPECT_EQ(GetIntMember(*byAge, "under_5_min").value_or(-1), 2);
    const JSONValue* storage = FindMember(s, "storage");
    ASSERT_NE(storage, nullptr);
    EXPECT_EQ(GetStringMember(*storage, "storage_dir").value_or(""), "memory");
    EXPECT_EQ(GetIntMember(*storage, "disk_contexts").value_or(-1), 2);
}

TEST(ContextManager, SessionsSurviveRestartThroughFileStore) {
    const fs::path dir = fs::temp_directory_path() / ("mcplease_cm_restart_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    {
        ContextManager cm(std::make_shared<FileContextStore>(dir));
        (void)cm.Create(std::string("persist"), std::string("frank"));
        ASSERT_TRUE(cm.AddConversationEntry("persist", "user", "Called tool: code_completion"));
        ASSERT_TRUE(cm.AddActiveFile("persist", "main.py"));
    }
    {
        ContextManager cm(std::make_shared<FileContextStore>(dir));
        auto c = cm.Get("persist");
        ASSERT_TRUE(c.has_value());
        EXPECT_EQ(c->userId, std::optional<std::string>("frank"));
        ASSERT_EQ(c->conversationHistory.size(), 1u);
        EXPECT_EQ(c->conversationHistory[0].content, "Called tool: code_completion");
        EXPECT_EQ(c->activeFiles, std::vector<std::string>{"main.py"});
        // Entries appended after a restart still land at the end
        ASSERT_TRUE(cm.AddConversationEntry("persist", "assistant", "done"));
        auto h = cm.GetConversationHistory("persist");
        ASSERT_TRUE(h.has_value());
        EXPECT_EQ(h->back().content, "done");
        EXPECT_EQ(cm.ListForUser("frank").size(), 1u);
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(ContextManager, ReaperRunsInBackground) {
    FakeClock clock;
    ContextManagerOptions o = optionsWith(clock);
    o.cleanupInterval = 1s;
    auto store = std::make_shared<MemoryContextStore>();
    ContextManager cm(store, o);
    (void)cm.Create(std::string("s"));
    clock.Advance(31min);
    cm.Start();
    EXPECT_TRUE(cm.IsRunning());
    // Only the reaper touches the store here
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!store->List().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(50ms);
    }
    cm.Stop();
    EXPECT_FALSE(cm.IsRunning());
    EXPECT_TRUE(store->List().empty());
}
