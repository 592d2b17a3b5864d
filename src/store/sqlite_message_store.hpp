#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chat/sequencer.hpp"
#include "store/message_store.hpp"
#include "sqlite3.h"

namespace klatsch::store {

// SQLite backed store. The database is the source of truth; an in-memory copy
// of all events is rebuilt from it on open and serves replay reads.
class SqliteMessageStore : public MessageStore {
public:
    using Clock = std::function<std::int64_t()>;

    // Opens (creating if needed) the database at db_path. The path ":memory:"
    // opens a transient database. Throws StorageUnavailable on failure.
    explicit SqliteMessageStore(std::filesystem::path db_path, Clock clock = {});
    ~SqliteMessageStore() override;

    SqliteMessageStore(const SqliteMessageStore&) = delete;
    SqliteMessageStore& operator=(const SqliteMessageStore&) = delete;

    InsertResult InsertIfAbsent(const klatsch::chat::Message& message) override;
    std::vector<klatsch::chat::Event> ListAll() const override;
    std::vector<klatsch::chat::Event> EventsSince(std::uint64_t last_sequence) const override;
    std::optional<klatsch::chat::Event> Find(const std::string& message_id) const override;
    std::size_t Size() const override;
    std::uint64_t LastSequence() const override;

    const std::filesystem::path& Path() const { return db_path_; }

private:
    void Open();
    void EnsureSchema();
    void LoadEvents();
    std::vector<klatsch::chat::Event> QueryAll() const;
    void Exec(const std::string& sql);
    void Rollback();
    std::string LastError() const;

    std::filesystem::path db_path_;
    Clock clock_;
    sqlite3* db_ = nullptr;
    klatsch::chat::Sequencer sequencer_;
    std::vector<klatsch::chat::Event> events_;
    std::unordered_map<std::string, std::size_t> index_by_id_;
    mutable std::mutex mutex_;
};

}  // namespace klatsch::store
