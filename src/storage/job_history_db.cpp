#include "job_history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

JobRecord JobRecord::from_result(const std::string& media_file, const TranscriptionResult& result,
                                 double processing_time) {
    JobRecord r;
    r.media_file = media_file;
    r.state = "done";
    r.method = result.stats.method;
    r.duration_s = result.duration_s;
    r.processing_time = processing_time;
    r.total_chunks = static_cast<int64_t>(result.stats.total_chunks);
    r.successful_chunks = static_cast<int64_t>(result.stats.successful_chunks);
    r.failed_chunks = static_cast<int64_t>(result.stats.failed_chunks);
    r.dropped_chunks = static_cast<int64_t>(result.stats.dropped_chunks);
    r.word_count = static_cast<int64_t>(result.word_count);
    return r;
}

JobRecord JobRecord::from_error(const std::string& media_file, const JobError& error,
                                double processing_time) {
    JobRecord r;
    r.media_file = media_file;
    r.state = "failed";
    r.processing_time = processing_time;
    r.error = std::string(to_string(error.kind)) + ": " + error.message;
    return r;
}

JobHistoryDb::JobHistoryDb() = default;

JobHistoryDb::~JobHistoryDb() {
    close();
}

bool JobHistoryDb::open(const std::string& path) {
    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO jobs (media_file, state, method, duration, processing_time, "
        "total_chunks, successful_chunks, failed_chunks, dropped_chunks, word_count, error) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, media_file, state, method, duration, processing_time, "
        "total_chunks, successful_chunks, failed_chunks, dropped_chunks, word_count, error "
        "FROM jobs ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void JobHistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool JobHistoryDb::insert(const JobRecord& r) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, r.media_file.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, r.state.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(3, r.method);
    sqlite3_bind_double(insert_stmt_, 4, r.duration_s);
    sqlite3_bind_double(insert_stmt_, 5, r.processing_time);
    sqlite3_bind_int64(insert_stmt_, 6, r.total_chunks);
    sqlite3_bind_int64(insert_stmt_, 7, r.successful_chunks);
    sqlite3_bind_int64(insert_stmt_, 8, r.failed_chunks);
    sqlite3_bind_int64(insert_stmt_, 9, r.dropped_chunks);
    sqlite3_bind_int64(insert_stmt_, 10, r.word_count);
    bind_nullable(11, r.error);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<JobRecord> JobHistoryDb::recent(int limit) {
    std::vector<JobRecord> records;
    if (!recent_stmt_) return records;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        JobRecord r;
        r.id = sqlite3_column_int64(recent_stmt_, 0);
        r.timestamp = get_text(recent_stmt_, 1);
        r.media_file = get_text(recent_stmt_, 2);
        r.state = get_text(recent_stmt_, 3);
        r.method = get_text(recent_stmt_, 4);
        r.duration_s = sqlite3_column_double(recent_stmt_, 5);
        r.processing_time = sqlite3_column_double(recent_stmt_, 6);
        r.total_chunks = sqlite3_column_int64(recent_stmt_, 7);
        r.successful_chunks = sqlite3_column_int64(recent_stmt_, 8);
        r.failed_chunks = sqlite3_column_int64(recent_stmt_, 9);
        r.dropped_chunks = sqlite3_column_int64(recent_stmt_, 10);
        r.word_count = sqlite3_column_int64(recent_stmt_, 11);
        r.error = get_text(recent_stmt_, 12);
        records.push_back(std::move(r));
    }

    return records;
}

bool JobHistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS jobs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            media_file TEXT NOT NULL,
            state TEXT NOT NULL,
            method TEXT,
            duration REAL,
            processing_time REAL,
            total_chunks INTEGER,
            successful_chunks INTEGER,
            failed_chunks INTEGER,
            dropped_chunks INTEGER,
            word_count INTEGER,
            error TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
