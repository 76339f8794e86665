#include "duration_prober.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

DurationProber::DurationProber(MediaTool& tool)
    : tool_(tool) {}

std::expected<double, JobError> DurationProber::probe(const std::string& path) {
    auto duration = tool_.probe_duration(path);
    if (!duration) {
        std::println(stderr, "probe: {}: {}", path, duration.error());
        return std::unexpected(JobError{JobErrorKind::MediaProbe, duration.error()});
    }
    return *duration;
}

std::expected<uint64_t, JobError> DurationProber::file_size(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(JobError{JobErrorKind::InvalidInput,
                                        "media file not found: " + path});
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected(JobError{JobErrorKind::InvalidInput,
                                        "cannot stat " + path + ": " + ec.message()});
    }
    return static_cast<uint64_t>(size);
}
