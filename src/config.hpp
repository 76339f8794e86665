#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Backend {
        std::string type = "lan";
        std::string url = "https://api.openai.com";
        std::string api_format = "openai"; // "openai" or "whisper.cpp"
        std::string model = "whisper-1";
        std::string language;              // empty: let the service detect
        std::string api_key;
        uint32_t timeout_seconds = 300;
    } backend;

    struct Chunking {
        // Safe margin below the 25 MB upload limit
        uint64_t size_threshold_bytes = 24ull * 1024 * 1024;
        double chunk_duration_seconds = 600.0;
        std::string work_dir; // empty: system temp directory
    } chunking;

    struct Dispatch {
        uint32_t max_concurrency = 8;
        uint32_t max_retries = 3;
        double backoff_base_seconds = 2.0;
    } dispatch;

    struct Media {
        std::string ffmpeg = "ffmpeg";
        std::string ffprobe = "ffprobe";
        uint32_t sample_rate = 16000;
        std::string bitrate = "64k";
        std::string format = "mp3";
    } media;

    struct History {
        bool enabled = true;
        std::string path; // empty: <data dir>/jobs.db
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};
