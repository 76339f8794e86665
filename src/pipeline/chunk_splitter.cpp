#include "chunk_splitter.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

ChunkSplitter::ChunkSplitter(MediaTool& tool)
    : tool_(tool) {}

size_t ChunkSplitter::chunk_count(double total_s, double chunk_s) {
    if (!(total_s > 0.0) || !(chunk_s > 0.0)) return 0;
    return static_cast<size_t>(std::ceil(total_s / chunk_s));
}

std::string ChunkSplitter::chunk_filename(size_t index, const std::string& extension) {
    return std::format("chunk_{:03}.{}", index, extension);
}

std::vector<ChunkSpec> ChunkSplitter::plan(double total_s, double chunk_s,
                                           const std::string& out_dir,
                                           const std::string& extension) {
    size_t n = chunk_count(total_s, chunk_s);
    std::vector<ChunkSpec> chunks;
    chunks.reserve(n);

    for (size_t i = 0; i < n; i++) {
        double start = static_cast<double>(i) * chunk_s;
        chunks.push_back(ChunkSpec{
            .index = i,
            .path = (fs::path(out_dir) / chunk_filename(i, extension)).string(),
            .start_offset_s = start,
            .duration_s = std::min(chunk_s, total_s - start),
            .byte_size = 0,
        });
    }
    return chunks;
}

std::expected<std::vector<ChunkSpec>, JobError>
ChunkSplitter::split(const std::string& path, double total_s, double chunk_s,
                     const std::string& out_dir, ChunkCleaner& cleaner,
                     std::stop_token stop) {
    if (!(total_s > 0.0) || !(chunk_s > 0.0)) {
        return std::unexpected(JobError{
            JobErrorKind::Split,
            std::format("invalid split: total {}s, chunk {}s", total_s, chunk_s)});
    }

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        return std::unexpected(JobError{
            JobErrorKind::Split, "cannot create chunk directory " + out_dir + ": " + ec.message()});
    }

    auto planned = plan(total_s, chunk_s, out_dir, tool_.output_extension());
    std::vector<ChunkSpec> chunks;
    chunks.reserve(planned.size());

    for (auto& spec : planned) {
        if (stop.stop_requested()) {
            return std::unexpected(JobError{JobErrorKind::Cancelled, "cancelled while splitting"});
        }

        // Track before extracting so a partial file is cleaned up too
        cleaner.track(spec.path);

        auto res = tool_.extract_segment(path, spec.start_offset_s, spec.duration_s, spec.path,
                                         stop);
        if (!res && stop.stop_requested()) {
            fs::remove(spec.path, ec);
            return std::unexpected(JobError{JobErrorKind::Cancelled, "cancelled while splitting"});
        }
        if (!res) {
            std::println(stderr, "split: chunk {}/{} failed, dropping: {}",
                         spec.index + 1, planned.size(), res.error());
            fs::remove(spec.path, ec);
            continue;
        }

        auto size = fs::file_size(spec.path, ec);
        if (ec || size == 0) {
            std::println(stderr, "split: chunk {}/{} produced no output, dropping",
                         spec.index + 1, planned.size());
            fs::remove(spec.path, ec);
            continue;
        }

        spec.byte_size = static_cast<uint64_t>(size);
        chunks.push_back(std::move(spec));
    }

    if (chunks.empty()) {
        return std::unexpected(JobError{
            JobErrorKind::Split,
            std::format("no chunks created out of {} planned", planned.size())});
    }

    return chunks;
}
