#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "cs_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.backend.type == "lan");
        REQUIRE(cfg.backend.api_format == "openai");
        REQUIRE(cfg.backend.model == "whisper-1");
        REQUIRE(cfg.backend.language.empty());
        REQUIRE(cfg.chunking.size_threshold_bytes == 24ull * 1024 * 1024);
        REQUIRE(cfg.chunking.chunk_duration_seconds == 600.0);
        REQUIRE(cfg.dispatch.max_concurrency == 8);
        REQUIRE(cfg.dispatch.max_retries == 3);
        REQUIRE(cfg.dispatch.backoff_base_seconds == 2.0);
        REQUIRE(cfg.media.sample_rate == 16000);
        REQUIRE(cfg.media.bitrate == "64k");
        REQUIRE(cfg.history.enabled);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "backend": {
                "type": "lan",
                "url": "http://10.0.0.1:9090",
                "api_format": "whisper.cpp",
                "model": "large-v3",
                "language": "pl",
                "api_key": "secret",
                "timeout_seconds": 60
            },
            "chunking": {
                "size_threshold_bytes": 1048576,
                "chunk_duration_seconds": 300,
                "work_dir": "/var/tmp/cs"
            },
            "dispatch": { "max_concurrency": 4, "max_retries": 5, "backoff_base_seconds": 1.5 },
            "media": { "ffmpeg": "/opt/ffmpeg", "ffprobe": "/opt/ffprobe",
                       "sample_rate": 22050, "bitrate": "48k", "format": "ogg" },
            "history": { "enabled": false, "path": "/tmp/jobs.db" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.backend.api_format == "whisper.cpp");
        REQUIRE(cfg.backend.model == "large-v3");
        REQUIRE(cfg.backend.language == "pl");
        REQUIRE(cfg.backend.api_key == "secret");
        REQUIRE(cfg.backend.timeout_seconds == 60);
        REQUIRE(cfg.chunking.size_threshold_bytes == 1048576);
        REQUIRE(cfg.chunking.chunk_duration_seconds == 300.0);
        REQUIRE(cfg.chunking.work_dir == "/var/tmp/cs");
        REQUIRE(cfg.dispatch.max_concurrency == 4);
        REQUIRE(cfg.dispatch.max_retries == 5);
        REQUIRE(cfg.dispatch.backoff_base_seconds == 1.5);
        REQUIRE(cfg.media.ffmpeg == "/opt/ffmpeg");
        REQUIRE(cfg.media.ffprobe == "/opt/ffprobe");
        REQUIRE(cfg.media.sample_rate == 22050);
        REQUIRE(cfg.media.bitrate == "48k");
        REQUIRE(cfg.media.format == "ogg");
        REQUIRE_FALSE(cfg.history.enabled);
        REQUIRE(cfg.history.path == "/tmp/jobs.db");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "dispatch": { "max_concurrency": 2 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.dispatch.max_concurrency == 2);
        // Other fields retain defaults
        REQUIRE(cfg.dispatch.max_retries == 3);
        REQUIRE(cfg.chunking.chunk_duration_seconds == 600.0);
        REQUIRE(cfg.backend.url == "https://api.openai.com");
    }

    SECTION("RejectsNonPositiveValues") {
        TmpFile f(R"({
            "chunking": { "chunk_duration_seconds": 0 },
            "dispatch": { "max_concurrency": -3, "max_retries": 0, "backoff_base_seconds": -1 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.chunking.chunk_duration_seconds == 600.0);
        REQUIRE(cfg.dispatch.max_concurrency == 8);
        REQUIRE(cfg.dispatch.max_retries == 3);
        REQUIRE(cfg.dispatch.backoff_base_seconds == 2.0);
    }

    SECTION("RejectsFractionalAndOversizedCounts") {
        TmpFile f(R"({
            "backend": { "timeout_seconds": 1e12 },
            "chunking": { "size_threshold_bytes": 0.5 },
            "dispatch": { "max_concurrency": 0.5, "max_retries": 2.5 },
            "media": { "sample_rate": 5e9 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.timeout_seconds == 300);
        REQUIRE(cfg.chunking.size_threshold_bytes == 24ull * 1024 * 1024);
        REQUIRE(cfg.dispatch.max_concurrency == 8);
        REQUIRE(cfg.dispatch.max_retries == 3);
        REQUIRE(cfg.media.sample_rate == 16000);
    }

    SECTION("FractionalDurationAllowed") {
        TmpFile f(R"({ "chunking": { "chunk_duration_seconds": 90.5 } })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.chunking.chunk_duration_seconds == 90.5);
    }

    SECTION("ZeroBackoffAllowed") {
        TmpFile f(R"({ "dispatch": { "backoff_base_seconds": 0 } })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.dispatch.backoff_base_seconds == 0.0);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.backend.type == "lan");
        REQUIRE(cfg.dispatch.max_concurrency == 8);
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "dispatch": { "max_concurrency": 2 }, "backend": { "url": 42 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.dispatch.max_concurrency == 8);
        REQUIRE(cfg.backend.url == "https://api.openai.com");
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/cs_test_nonexistent_config_file.json");
        REQUIRE(cfg.backend.type == "lan");
        REQUIRE(cfg.chunking.chunk_duration_seconds == 600.0);
    }
}
