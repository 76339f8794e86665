#pragma once

#include "types.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

// Owns the temporary chunk files of one job and deletes them when released
// or destroyed, whichever comes first. Deletion is best-effort: failures are
// logged and never escalated.
class ChunkCleaner {
public:
    ChunkCleaner() = default;
    ~ChunkCleaner();

    ChunkCleaner(const ChunkCleaner&) = delete;
    ChunkCleaner& operator=(const ChunkCleaner&) = delete;

    // Directory created for this job; removed after its files if it is empty.
    void own_directory(const std::string& dir);

    void track(const std::string& path);
    void adopt(const std::vector<ChunkSpec>& chunks);

    // Deletes everything tracked so far. Returns the number of files removed.
    size_t release();

    size_t tracked() const;
    size_t warnings() const { return warnings_; }

private:
    mutable std::mutex mu_;
    std::vector<std::string> files_;
    std::string dir_;
    size_t warnings_ = 0;
};
