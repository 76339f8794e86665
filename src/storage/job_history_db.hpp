#pragma once

#include "pipeline/types.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

// Metadata of one finished job. The transcript itself is not kept.
struct JobRecord {
    int64_t id = 0;
    std::string timestamp;
    std::string media_file;
    std::string state; // "done" or "failed"
    std::string method;
    double duration_s = 0.0;
    double processing_time = 0.0;
    int64_t total_chunks = 0;
    int64_t successful_chunks = 0;
    int64_t failed_chunks = 0;
    int64_t dropped_chunks = 0;
    int64_t word_count = 0;
    std::string error;

    static JobRecord from_result(const std::string& media_file, const TranscriptionResult& result,
                                 double processing_time);
    static JobRecord from_error(const std::string& media_file, const JobError& error,
                                double processing_time);
};

class JobHistoryDb {
public:
    JobHistoryDb();
    ~JobHistoryDb();

    JobHistoryDb(const JobHistoryDb&) = delete;
    JobHistoryDb& operator=(const JobHistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const JobRecord& record);

    std::vector<JobRecord> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
