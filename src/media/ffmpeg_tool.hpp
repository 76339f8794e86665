#pragma once

#include "media_tool.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

struct FfmpegOptions {
    std::string ffmpeg = "ffmpeg";
    std::string ffprobe = "ffprobe";
    uint32_t sample_rate = 16000;
    std::string bitrate = "64k";
    std::string format = "mp3";
};

class FfmpegTool : public MediaTool {
public:
    explicit FfmpegTool(FfmpegOptions options = {});

    std::expected<double, std::string> probe_duration(const std::string& path) override;

    std::expected<void, std::string>
        extract_segment(const std::string& path, double start_s, double duration_s,
                        const std::string& out_path, std::stop_token stop) override;

    std::string output_extension() const override { return options_.format; }

    std::vector<std::string> probe_command(const std::string& path) const;
    std::vector<std::string> extract_command(const std::string& path, double start_s,
                                             double duration_s,
                                             const std::string& out_path) const;

    // Parses `ffprobe -show_entries format=duration -of json` output.
    static std::expected<double, std::string> parse_probe_output(const std::string& json_text);

private:
    FfmpegOptions options_;
};
