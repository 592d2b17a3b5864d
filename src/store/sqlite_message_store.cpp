#include "store/sqlite_message_store.hpp"

#include <utility>

#include "chat/chat_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace klatsch::store {
namespace {

constexpr const char* kInMemoryPath = ":memory:";

// Finalizes the prepared statement on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool Ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    sqlite3_stmt* Get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

klatsch::chat::Event ReadEventRow(sqlite3_stmt* stmt) {
    // Text may contain NUL bytes, so the length comes from sqlite.
    auto text = [stmt](int column) {
        const auto* value = sqlite3_column_text(stmt, column);
        const auto length = sqlite3_column_bytes(stmt, column);
        return value ? std::string(reinterpret_cast<const char*>(value), static_cast<std::size_t>(length))
                     : std::string();
    };
    klatsch::chat::Event event{};
    event.sequence = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 0));
    event.message.id = text(1);
    event.message.sender = text(2);
    event.message.content = text(3);
    event.timestamp_ms = sqlite3_column_int64(stmt, 4);
    return event;
}

bool BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    return sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT)
        == SQLITE_OK;
}

}  // namespace

SqliteMessageStore::SqliteMessageStore(std::filesystem::path db_path, Clock clock)
    : db_path_(std::move(db_path))
    , clock_(clock ? std::move(clock) : Clock(&klatsch::utils::NowMs)) {
    Open();
    try {
        EnsureSchema();
        LoadEvents();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteMessageStore::~SqliteMessageStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

InsertResult SqliteMessageStore::InsertIfAbsent(const klatsch::chat::Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_by_id_.find(message.id);
    if (it != index_by_id_.end()) {
        return InsertResult{events_[it->second], false};
    }

    const auto reservation = sequencer_.Reserve(clock_());
    klatsch::chat::Event event{};
    event.sequence = reservation.sequence;
    event.message = message;
    event.timestamp_ms = reservation.timestamp_ms;

    Exec("BEGIN IMMEDIATE;");
    {
        Statement stmt(db_,
            "INSERT INTO events(sequence, message_id, sender, content, timestamp_ms) "
            "VALUES(?, ?, ?, ?, ?);");
        if (!stmt.Ok()) {
            const auto error = LastError();
            Rollback();
            throw klatsch::chat::StorageUnavailable("failed to prepare insert: " + error);
        }
        const bool bound =
            sqlite3_bind_int64(stmt.Get(), 1, static_cast<sqlite3_int64>(event.sequence)) == SQLITE_OK
            && BindText(stmt.Get(), 2, message.id)
            && BindText(stmt.Get(), 3, message.sender)
            && BindText(stmt.Get(), 4, message.content)
            && sqlite3_bind_int64(stmt.Get(), 5, static_cast<sqlite3_int64>(event.timestamp_ms)) == SQLITE_OK;
        if (!bound) {
            const auto error = LastError();
            Rollback();
            throw klatsch::chat::StorageUnavailable("failed to bind message: " + error);
        }
        if (sqlite3_step(stmt.Get()) != SQLITE_DONE) {
            const auto error = LastError();
            Rollback();
            throw klatsch::chat::StorageUnavailable("failed to insert message: " + error);
        }
    }
    try {
        Exec("COMMIT;");
    } catch (const klatsch::chat::StorageUnavailable&) {
        Rollback();
        throw;
    }

    sequencer_.Commit(reservation);
    index_by_id_.emplace(message.id, events_.size());
    events_.push_back(event);
    return InsertResult{std::move(event), true};
}

std::vector<klatsch::chat::Event> SqliteMessageStore::ListAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueryAll();
}

std::vector<klatsch::chat::Event> SqliteMessageStore::EventsSince(std::uint64_t last_sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    // Sequences are gap-free from 1, so sequence n lives at index n - 1.
    if (last_sequence >= events_.size()) {
        return {};
    }
    return std::vector<klatsch::chat::Event>(
        events_.begin() + static_cast<std::ptrdiff_t>(last_sequence), events_.end());
}

std::optional<klatsch::chat::Event> SqliteMessageStore::Find(const std::string& message_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_by_id_.find(message_id);
    if (it == index_by_id_.end()) {
        return std::nullopt;
    }
    return events_[it->second];
}

std::size_t SqliteMessageStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::uint64_t SqliteMessageStore::LastSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequencer_.LastSequence();
}

void SqliteMessageStore::Open() {
    const bool in_memory = db_path_ == kInMemoryPath;
    if (!in_memory && db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        const auto error = db_ ? std::string(sqlite3_errmsg(db_)) : std::string("out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        throw klatsch::chat::StorageUnavailable(
            "failed to open sqlite db " + db_path_.string() + ": " + error);
    }
    sqlite3_busy_timeout(db_, 5000);
}

void SqliteMessageStore::EnsureSchema() {
    if (db_path_ != kInMemoryPath) {
        Exec("PRAGMA journal_mode=WAL;");
    }
    Exec("CREATE TABLE IF NOT EXISTS events ("
         "sequence INTEGER PRIMARY KEY,"
         "message_id TEXT UNIQUE NOT NULL,"
         "sender TEXT NOT NULL,"
         "content TEXT NOT NULL,"
         "timestamp_ms INTEGER NOT NULL"
         ");");
}

void SqliteMessageStore::LoadEvents() {
    events_ = QueryAll();
    index_by_id_.clear();
    for (std::size_t i = 0; i < events_.size(); ++i) {
        if (events_[i].sequence != i + 1) {
            throw klatsch::chat::StorageUnavailable(
                "sequence gap in " + db_path_.string() + " at position " + std::to_string(i + 1));
        }
        index_by_id_.emplace(events_[i].message.id, i);
    }
    if (events_.empty()) {
        sequencer_.ResumeFrom(0, 0);
    } else {
        sequencer_.ResumeFrom(events_.back().sequence, events_.back().timestamp_ms);
    }
    klatsch::utils::Log({klatsch::utils::LogLevel::kInfo, "store", "history loaded",
        {{"path", db_path_.string()}, {"events", std::to_string(events_.size())}}});
}

std::vector<klatsch::chat::Event> SqliteMessageStore::QueryAll() const {
    std::vector<klatsch::chat::Event> events;
    Statement stmt(db_,
        "SELECT sequence, message_id, sender, content, timestamp_ms "
        "FROM events ORDER BY sequence ASC;");
    if (!stmt.Ok()) {
        throw klatsch::chat::StorageUnavailable("failed to query events: " + LastError());
    }
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.Get())) == SQLITE_ROW) {
        events.push_back(ReadEventRow(stmt.Get()));
    }
    if (rc != SQLITE_DONE) {
        throw klatsch::chat::StorageUnavailable("failed to read events: " + LastError());
    }
    return events;
}

void SqliteMessageStore::Exec(const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw klatsch::chat::StorageUnavailable("sqlite exec error: " + message);
    }
}

void SqliteMessageStore::Rollback() {
    if (sqlite3_get_autocommit(db_) != 0) {
        return;
    }
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        klatsch::utils::LogError("store", std::string("rollback failed: ") + (err ? err : "unknown"));
        sqlite3_free(err);
    }
}

std::string SqliteMessageStore::LastError() const {
    return db_ ? std::string(sqlite3_errmsg(db_)) : std::string("database not open");
}

}  // namespace klatsch::store
