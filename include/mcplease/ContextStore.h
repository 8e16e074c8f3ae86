//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextStore.h
// Purpose: Durable persistence backends for session contexts
//==========================================================================================================

#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcplease/ContextTypes.h"

namespace mcplease {

struct StoreStats {
    std::string location;
    std::size_t records{0};
    uint64_t totalBytes{0};
};

//==========================================================================================================
// IContextStore
// Purpose: Key -> record store keyed by session id. Implementations must be thread-safe; writes to the
//          same key from different threads leave one complete record (last writer wins).
//==========================================================================================================
class IContextStore {
public:
    virtual ~IContextStore() = default;

    virtual bool Put(const Context& context) = 0;
    virtual std::optional<Context> Get(const std::string& sessionId) = 0;
    virtual bool Delete(const std::string& sessionId) = 0;
    virtual std::vector<std::string> List() = 0;
    // Session ids whose last_accessed is before cutoff.
    virtual std::vector<std::string> ListOlderThan(WallClock::time_point cutoff) = 0;
    // Session ids whose user_id equals userId.
    virtual std::vector<std::string> ListForUser(const std::string& userId) = 0;
    virtual StoreStats Stats() = 0;
};

//==========================================================================================================
// RecordIndex
// Purpose: Per-record metadata kept beside a store so listing by age or user never reads the records.
//          Not synchronized; the owning store guards it.
//==========================================================================================================
class RecordIndex {
public:
    void Upsert(const std::string& id, WallClock::time_point lastAccessed,
                const std::optional<std::string>& userId, uint64_t bytes);
    bool Erase(const std::string& id);

    std::vector<std::string> Ids() const;
    std::vector<std::string> OlderThan(WallClock::time_point cutoff) const;
    std::vector<std::string> ForUser(const std::string& userId) const;
    std::size_t Size() const { return meta.size(); }
    uint64_t TotalBytes() const { return totalBytes; }

private:
    struct Meta {
        WallClock::time_point lastAccessed;
        std::optional<std::string> userId;
        uint64_t bytes{0};
    };
    std::unordered_map<std::string, Meta> meta;
    std::set<std::pair<WallClock::time_point, std::string>> byAccess;
    std::unordered_map<std::string, std::set<std::string>> byUser;
    uint64_t totalBytes{0};
};

//==========================================================================================================
// FileContextStore
// Purpose: One JSON file per session in a directory. The file name is the session id with every byte
//          outside [A-Za-z0-9._-] written as %XX, plus ".json", so distinct ids never share a file.
//          Writes go to a temporary file which is then renamed into place.
//          The directory is scanned once on construction to build the index; afterwards the index
//          follows Put/Delete, so the directory must not be shared by two live stores.
//==========================================================================================================
class FileContextStore : public IContextStore {
public:
    explicit FileContextStore(std::filesystem::path directory);

    bool Put(const Context& context) override;
    std::optional<Context> Get(const std::string& sessionId) override;
    bool Delete(const std::string& sessionId) override;
    std::vector<std::string> List() override;
    std::vector<std::string> ListOlderThan(WallClock::time_point cutoff) override;
    std::vector<std::string> ListForUser(const std::string& userId) override;
    StoreStats Stats() override;

    std::filesystem::path PathFor(const std::string& sessionId) const;
    const std::filesystem::path& Directory() const { return directory; }

private:
    void scan();
    std::optional<Context> loadFile(const std::filesystem::path& file, uint64_t* bytes = nullptr);

    std::filesystem::path directory;
    std::mutex mtx;
    RecordIndex index;
};

// In-process store; nothing survives a restart.
class MemoryContextStore : public IContextStore {
public:
    bool Put(const Context& context) override;
    std::optional<Context> Get(const std::string& sessionId) override;
    bool Delete(const std::string& sessionId) override;
    std::vector<std::string> List() override;
    std::vector<std::string> ListOlderThan(WallClock::time_point cutoff) override;
    std::vector<std::string> ListForUser(const std::string& userId) override;
    StoreStats Stats() override;

private:
    std::mutex mtx;
    std::unordered_map<std::string, std::string> records;
    RecordIndex index;
};

} // namespace mcplease
