#include "HistoryStore.hpp"

#include "Errors.hpp"
#include "Log.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <system_error>
#include <utility>

#include <sqlite3.h>

namespace rune {

namespace {

constexpr const char* kTag = "history";

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    std::string msg = what;
    if (db) {
        msg += ": ";
        msg += sqlite3_errmsg(db);
    }
    throw RuneError(ErrorCode::storage_unavailable, msg);
}

// ---------------------------------------------------------------------------
// RAII helper for SQLite transactions
// ---------------------------------------------------------------------------

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
            fail(db_, "Could not begin transaction");
        }
    }
    void commit() {
        if (!committed_) {
            if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
                fail(db_, "Could not commit");
            }
            committed_ = true;
        }
    }
    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

// ---------------------------------------------------------------------------
// RAII helper for SQLite prepared statements
// ---------------------------------------------------------------------------

class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
            fail(db, "Could not prepare statement");
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    operator sqlite3_stmt*() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

TranscriptionRecord read_row(sqlite3_stmt* stmt) {
    TranscriptionRecord r;
    r.id = sqlite3_column_int64(stmt, 0);
    const char* ts = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    r.timestamp = ts ? ts : "";
    if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
        r.audio_path = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
    }
    const char* t = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
    r.text = t ? t : "";
    return r;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

HistoryStore::HistoryStore(std::string db_path)
    : db_path_(std::move(db_path)) {}

HistoryStore::~HistoryStore() {
    close();
}

// ---------------------------------------------------------------------------
// open / close / is_open
// ---------------------------------------------------------------------------

void HistoryStore::open() {
    std::lock_guard<std::mutex> lock(mu_);

    if (db_) return;   // already open

    if (db_path_.empty()) {
        throw RuneError(ErrorCode::storage_unavailable, "History database path is empty");
    }

    // Ensure parent directory exists.
    auto parent = std::filesystem::path(db_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw RuneError(ErrorCode::storage_unavailable,
                            "Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = "Cannot open history database '" + db_path_ + "'";
        if (db_) {
            msg += ": ";
            msg += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw RuneError(ErrorCode::storage_unavailable, msg);
    }

    try {
        // WAL for crash safety and readers that do not block the writer.
        if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr) != SQLITE_OK) {
            fail(db_, "Cannot enable WAL");
        }
        create_tables();
    } catch (const RuneError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    log::info(kTag, "opened " + db_path_);
}

void HistoryStore::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool HistoryStore::is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return db_ != nullptr;
}

void HistoryStore::require_open() const {
    if (!db_) {
        throw RuneError(ErrorCode::storage_unavailable, "History database is not open");
    }
}

// ---------------------------------------------------------------------------
// create_tables
// ---------------------------------------------------------------------------

void HistoryStore::create_tables() {
    const char* sql = R"SQL(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL,
            audio_path TEXT,
            text TEXT NOT NULL,
            session_id TEXT
        );
    )SQL";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = "Cannot create schema";
        if (err) {
            msg += ": ";
            msg += err;
            sqlite3_free(err);
        }
        throw RuneError(ErrorCode::storage_unavailable, msg);
    }
}

// ---------------------------------------------------------------------------
// append
// ---------------------------------------------------------------------------

TranscriptionRecord HistoryStore::append(const TranscriptionRecord& record,
                                         const std::string& session_id) {
    if (record.text.empty()) {
        throw RuneError(ErrorCode::invalid_argument, "Refusing to store an empty transcript");
    }

    std::lock_guard<std::mutex> lock(mu_);
    require_open();

    Transaction txn(db_);
    TranscriptionRecord stored = insert_locked(record, session_id);
    txn.commit();
    return stored;
}

std::optional<TranscriptionRecord> HistoryStore::append_if(const TranscriptionRecord& record,
                                                           const std::string& session_id,
                                                           const std::function<bool()>& confirm) {
    if (record.text.empty()) {
        throw RuneError(ErrorCode::invalid_argument, "Refusing to store an empty transcript");
    }

    std::lock_guard<std::mutex> lock(mu_);
    require_open();

    Transaction txn(db_);
    TranscriptionRecord stored = insert_locked(record, session_id);
    if (confirm && !confirm()) {
        log::debug(kTag, "append withdrawn before commit");
        return std::nullopt;
    }
    txn.commit();
    return stored;
}

// Requires mu_ and an open transaction.
TranscriptionRecord HistoryStore::insert_locked(const TranscriptionRecord& record,
                                                const std::string& session_id) {
    TranscriptionRecord stored = record;
    if (stored.timestamp.empty()) stored.timestamp = now_iso8601();

    const char* sql =
        "INSERT INTO transcriptions (timestamp, audio_path, text, session_id) "
        "VALUES (?, ?, ?, ?)";
    Statement stmt(db_, sql);

    sqlite3_bind_text(stmt, 1, stored.timestamp.c_str(), -1, SQLITE_TRANSIENT);
    if (stored.audio_path) {
        sqlite3_bind_text(stmt, 2, stored.audio_path->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    sqlite3_bind_text(stmt, 3, stored.text.c_str(), -1, SQLITE_TRANSIENT);
    if (session_id.empty()) {
        sqlite3_bind_null(stmt, 4);
    } else {
        sqlite3_bind_text(stmt, 4, session_id.c_str(), -1, SQLITE_TRANSIENT);
    }

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        fail(db_, "Could not append transcription");
    }
    stored.id = sqlite3_last_insert_rowid(db_);
    return stored;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::vector<TranscriptionRecord> HistoryStore::list() const {
    std::lock_guard<std::mutex> lock(mu_);
    require_open();

    std::vector<TranscriptionRecord> results;
    Statement stmt(db_,
        "SELECT id, timestamp, audio_path, text FROM transcriptions ORDER BY id ASC");

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        results.push_back(read_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        fail(db_, "Could not list transcriptions");
    }
    return results;
}

std::optional<TranscriptionRecord> HistoryStore::get(int64_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    require_open();

    Statement stmt(db_,
        "SELECT id, timestamp, audio_path, text FROM transcriptions WHERE id = ?");
    sqlite3_bind_int64(stmt, 1, id);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return read_row(stmt);
    if (rc != SQLITE_DONE) fail(db_, "Could not read transcription");
    return std::nullopt;
}

std::size_t HistoryStore::count() const {
    std::lock_guard<std::mutex> lock(mu_);
    require_open();

    Statement stmt(db_, "SELECT COUNT(*) FROM transcriptions");
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        fail(db_, "Could not count transcriptions");
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
}

// ---------------------------------------------------------------------------
// Utility
// ---------------------------------------------------------------------------

std::string HistoryStore::now_iso8601() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms  = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t secs = system_clock::to_time_t(now);

    std::tm utc{};
    gmtime_r(&secs, &utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(ms));
    return buf;
}

} // namespace rune
