#pragma once

#include "media_tool.hpp"
#include "pipeline/types.hpp"

#include <expected>
#include <string>

// Determines total media duration. A probe failure means the input itself is
// unusable, so it is never retried.
class DurationProber {
public:
    explicit DurationProber(MediaTool& tool);

    std::expected<double, JobError> probe(const std::string& path);

    // Byte size only; InvalidInput if the file is missing or not a regular file.
    static std::expected<uint64_t, JobError> file_size(const std::string& path);

private:
    MediaTool& tool_;
};
