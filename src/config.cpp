#include "config.hpp"

#include "platform/paths.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>
#include <type_traits>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Reads a positive number into `out`; anything else keeps the default.
// Integer fields need a whole value of at least 1 that fits the field.
template <typename T>
void read_positive(const json& section, const char* key, T& out, const char* where) {
    if (!section.contains(key)) return;
    auto v = section[key].get<double>();
    if constexpr (std::is_integral_v<T>) {
        // max() + 1 is a power of two, so exact as a double even for uint64_t
        const double limit = static_cast<double>(std::numeric_limits<T>::max()) + 1.0;
        if (!(v >= 1) || !(v < limit) || v != std::floor(v)) {
            std::println(stderr, "config: {}.{} must be a whole number in [1, {}], keeping {}",
                         where, key, std::numeric_limits<T>::max(), out);
            return;
        }
    } else if (!(v > 0)) {
        std::println(stderr, "config: {}.{} must be positive, keeping {}", where, key, out);
        return;
    }
    out = static_cast<T>(v);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) cfg.backend.type = b["type"].get<std::string>();
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("api_format")) cfg.backend.api_format = b["api_format"].get<std::string>();
            if (b.contains("model")) cfg.backend.model = b["model"].get<std::string>();
            if (b.contains("language")) cfg.backend.language = b["language"].get<std::string>();
            if (b.contains("api_key")) cfg.backend.api_key = b["api_key"].get<std::string>();
            read_positive(b, "timeout_seconds", cfg.backend.timeout_seconds, "backend");
        }

        if (j.contains("chunking")) {
            auto& c = j["chunking"];
            read_positive(c, "size_threshold_bytes", cfg.chunking.size_threshold_bytes, "chunking");
            read_positive(c, "chunk_duration_seconds", cfg.chunking.chunk_duration_seconds, "chunking");
            if (c.contains("work_dir")) cfg.chunking.work_dir = c["work_dir"].get<std::string>();
        }

        if (j.contains("dispatch")) {
            auto& d = j["dispatch"];
            read_positive(d, "max_concurrency", cfg.dispatch.max_concurrency, "dispatch");
            read_positive(d, "max_retries", cfg.dispatch.max_retries, "dispatch");
            // Zero base means retry without waiting
            if (d.contains("backoff_base_seconds")) {
                auto v = d["backoff_base_seconds"].get<double>();
                if (v < 0) {
                    std::println(stderr, "config: dispatch.backoff_base_seconds must not be negative");
                } else {
                    cfg.dispatch.backoff_base_seconds = v;
                }
            }
        }

        if (j.contains("media")) {
            auto& m = j["media"];
            if (m.contains("ffmpeg")) cfg.media.ffmpeg = m["ffmpeg"].get<std::string>();
            if (m.contains("ffprobe")) cfg.media.ffprobe = m["ffprobe"].get<std::string>();
            read_positive(m, "sample_rate", cfg.media.sample_rate, "media");
            if (m.contains("bitrate")) cfg.media.bitrate = m["bitrate"].get<std::string>();
            if (m.contains("format")) cfg.media.format = m["format"].get<std::string>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("path")) cfg.history.path = h["path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
