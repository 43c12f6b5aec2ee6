#pragma once

#include "Types.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward-declare sqlite3 so we don't leak its header into consumers.
struct sqlite3;

namespace rune {

/// Append-only log of completed transcriptions.
///
/// Uses SQLite in WAL mode; each append is its own IMMEDIATE transaction.
/// Records are never updated once written.  `list()` returns insertion
/// order; reverse-chronological presentation is up to the caller.
///
/// Every failure to reach the database is RuneError(storage_unavailable).
class HistoryStore {
public:
    /// Construct with an explicit database file path.
    explicit HistoryStore(std::string db_path);
    ~HistoryStore();

    // Non-copyable.
    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    /// Open (or create) the database and its schema.
    void open();
    void close();
    bool is_open() const;

    /// Persist a record.  The id is always assigned by storage; an empty
    /// timestamp is filled with the current UTC time.
    /// @throws RuneError(invalid_argument) for empty text.
    /// @return the record as stored.
    TranscriptionRecord append(const TranscriptionRecord& record,
                               const std::string& session_id = {});

    /// Like append(), but `confirm` runs after the row is written and
    /// before the transaction commits.  If it returns false the row is
    /// rolled back and nullopt returned.  `confirm` is called with the
    /// store's lock held and must not call back into the store.
    std::optional<TranscriptionRecord> append_if(const TranscriptionRecord& record,
                                                 const std::string& session_id,
                                                 const std::function<bool()>& confirm);

    std::vector<TranscriptionRecord> list() const;
    std::optional<TranscriptionRecord> get(int64_t id) const;
    std::size_t count() const;

    const std::string& path() const { return db_path_; }

    /// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ".
    static std::string now_iso8601();

private:
    void create_tables();
    void require_open() const;
    TranscriptionRecord insert_locked(const TranscriptionRecord& record,
                                      const std::string& session_id);

    std::string        db_path_;
    sqlite3*           db_ = nullptr;
    mutable std::mutex mu_;
};

} // namespace rune
