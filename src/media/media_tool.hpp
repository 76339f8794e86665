#pragma once

#include <expected>
#include <stop_token>
#include <string>

// External media tooling: duration inspection and segment extraction.
class MediaTool {
public:
    virtual ~MediaTool() = default;

    // Total media duration in seconds.
    virtual std::expected<double, std::string> probe_duration(const std::string& path) = 0;

    // Writes a standalone, re-encoded audio file covering [start_s, start_s + duration_s).
    // A stop request abandons the extraction.
    virtual std::expected<void, std::string>
        extract_segment(const std::string& path, double start_s, double duration_s,
                        const std::string& out_path, std::stop_token stop) = 0;

    // File extension (without dot) of files written by extract_segment.
    virtual std::string output_extension() const = 0;
};
