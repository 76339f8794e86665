#include "chunk_cleaner.hpp"

#include <algorithm>
#include <filesystem>
#include <print>

namespace fs = std::filesystem;

ChunkCleaner::~ChunkCleaner() {
    release();
}

void ChunkCleaner::own_directory(const std::string& dir) {
    std::lock_guard lock(mu_);
    dir_ = dir;
}

void ChunkCleaner::track(const std::string& path) {
    std::lock_guard lock(mu_);
    if (std::find(files_.begin(), files_.end(), path) == files_.end()) {
        files_.push_back(path);
    }
}

void ChunkCleaner::adopt(const std::vector<ChunkSpec>& chunks) {
    for (const auto& c : chunks) {
        track(c.path);
    }
}

size_t ChunkCleaner::release() {
    std::lock_guard lock(mu_);

    size_t removed = 0;
    for (const auto& path : files_) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            removed++;
        } else if (ec) {
            std::println(stderr, "cleanup: warning: failed to delete {}: {}", path, ec.message());
            warnings_++;
        }
    }
    files_.clear();

    std::error_code ec;
    if (!dir_.empty() && fs::exists(dir_, ec)) {
        if (fs::is_empty(dir_, ec)) {
            fs::remove(dir_, ec);
        }
        if (ec) {
            std::println(stderr, "cleanup: warning: failed to remove {}: {}", dir_, ec.message());
            warnings_++;
        }
    }
    dir_.clear();

    return removed;
}

size_t ChunkCleaner::tracked() const {
    std::lock_guard lock(mu_);
    return files_.size();
}
