#include "ffmpeg_tool.hpp"
#include "process.hpp"

#include <format>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Last non-empty line of a tool's stderr, for error messages.
std::string last_line(const std::string& text) {
    auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return {};
    auto start = text.find_last_of('\n', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return text.substr(start, end - start + 1);
}

} // namespace

FfmpegTool::FfmpegTool(FfmpegOptions options)
    : options_(std::move(options)) {}

std::vector<std::string> FfmpegTool::probe_command(const std::string& path) const {
    return {options_.ffprobe, "-v", "error",
            "-show_entries", "format=duration",
            "-of", "json", path};
}

std::vector<std::string> FfmpegTool::extract_command(const std::string& path, double start_s,
                                                     double duration_s,
                                                     const std::string& out_path) const {
    return {options_.ffmpeg, "-y",
            "-ss", std::format("{:.3f}", start_s),
            "-t", std::format("{:.3f}", duration_s),
            "-i", path,
            "-vn",                                  // audio only
            "-ac", "1",                             // mono
            "-ar", std::to_string(options_.sample_rate),
            "-b:a", options_.bitrate,
            "-loglevel", "error",
            out_path};
}

std::expected<double, std::string> FfmpegTool::parse_probe_output(const std::string& json_text) {
    try {
        auto j = json::parse(json_text);
        if (!j.contains("format") || !j["format"].contains("duration")) {
            return std::unexpected("ffprobe output has no format.duration");
        }

        // ffprobe prints the duration as a string
        auto& d = j["format"]["duration"];
        double duration = 0.0;
        if (d.is_string()) {
            duration = std::stod(d.get<std::string>());
        } else if (d.is_number()) {
            duration = d.get<double>();
        } else {
            return std::unexpected("ffprobe duration has unexpected type");
        }

        if (!(duration > 0.0)) {
            return std::unexpected(std::format("ffprobe reported non-positive duration {}", duration));
        }
        return duration;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("failed to parse ffprobe output: ") + e.what());
    } catch (const std::logic_error& e) {
        // std::stod: invalid_argument / out_of_range
        return std::unexpected(std::string("failed to parse ffprobe duration: ") + e.what());
    }
}

std::expected<double, std::string> FfmpegTool::probe_duration(const std::string& path) {
    auto res = run_process(probe_command(path));
    if (!res) {
        return std::unexpected(res.error());
    }
    if (res->exit_code == kExecFailedCode) {
        return std::unexpected(options_.ffprobe + " not found (is ffmpeg installed?)");
    }
    if (res->exit_code != 0) {
        return std::unexpected(std::format("{} exited with code {}: {}", options_.ffprobe,
                                           res->exit_code, last_line(res->err)));
    }
    return parse_probe_output(res->out);
}

std::expected<void, std::string>
FfmpegTool::extract_segment(const std::string& path, double start_s, double duration_s,
                            const std::string& out_path, std::stop_token stop) {
    auto res = run_process(extract_command(path, start_s, duration_s, out_path), stop);
    if (!res) {
        return std::unexpected(res.error());
    }
    if (res->exit_code == kExecFailedCode) {
        return std::unexpected(options_.ffmpeg + " not found (is ffmpeg installed?)");
    }
    if (res->exit_code != 0) {
        return std::unexpected(std::format("{} exited with code {}: {}", options_.ffmpeg,
                                           res->exit_code, last_line(res->err)));
    }
    return {};
}
