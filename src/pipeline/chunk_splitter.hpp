#pragma once

#include "chunk_cleaner.hpp"
#include "media/media_tool.hpp"
#include "types.hpp"

#include <cstddef>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

class ChunkSplitter {
public:
    explicit ChunkSplitter(MediaTool& tool);

    // ceil(total / chunk); 0 for non-positive arguments.
    static size_t chunk_count(double total_s, double chunk_s);

    // Planned layout: chunk i covers [i * chunk_s, min((i + 1) * chunk_s, total_s)).
    // Paths are filled in, byte sizes are not.
    static std::vector<ChunkSpec> plan(double total_s, double chunk_s, const std::string& out_dir,
                                       const std::string& extension);

    static std::string chunk_filename(size_t index, const std::string& extension);

    // Extracts every planned chunk into out_dir. Each produced file is handed to
    // `cleaner` as soon as it exists. A chunk whose extraction fails is dropped;
    // an empty result is a Split error.
    std::expected<std::vector<ChunkSpec>, JobError>
        split(const std::string& path, double total_s, double chunk_s,
              const std::string& out_dir, ChunkCleaner& cleaner,
              std::stop_token stop = {});

private:
    MediaTool& tool_;
};
