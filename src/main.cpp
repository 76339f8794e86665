#include "config.hpp"
#include "media/ffmpeg_tool.hpp"
#include "pipeline/result_json.hpp"
#include "pipeline/transcription_job.hpp"
#include "platform/paths.hpp"
#include "storage/job_history_db.hpp"
#include "whisper/lan_backend.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <poll.h>
#include <print>
#include <signal.h>
#include <stop_token>
#include <string>
#include <sys/signalfd.h>
#include <thread>
#include <unistd.h>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command>", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  transcribe <file>     Transcribe an audio/video file");
    std::println(stderr, "  history [--limit N]   Show recent jobs");
    std::println(stderr, "Options:");
    std::println(stderr, "  -v, --verbose         Enable verbose logging");
    std::println(stderr, "  -c, --config PATH     Config file path");
    std::println(stderr, "  --chunk-minutes N     Chunk duration in minutes");
    std::println(stderr, "  --concurrency K       Maximum requests in flight");
    std::println(stderr, "  --retries R           Attempts per chunk");
    std::println(stderr, "  --text                Print the transcript instead of JSON");
    std::println(stderr, "  -h, --help            Show this help");
}

std::string history_path(const Config& config) {
    if (!config.history.path.empty()) return config.history.path;
    auto data = platform::data_dir();
    if (!data.empty()) return data + "/jobs.db";
    return "/tmp/chunkscribe/jobs.db";
}

// Turns SIGINT/SIGTERM into a stop request. The signals must already be
// blocked in every thread so that only the signalfd sees them.
class SignalWatcher {
public:
    SignalWatcher(const sigset_t& mask, std::stop_source target)
        : target_(std::move(target)) {
        fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
        if (fd_ < 0) {
            std::println(stderr, "signalfd failed: {}", std::strerror(errno));
            return;
        }
        thread_ = std::jthread([this](std::stop_token stop) { watch(stop); });
    }

    ~SignalWatcher() {
        thread_.request_stop();
        if (thread_.joinable()) thread_.join();
        if (fd_ >= 0) ::close(fd_);
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void watch(std::stop_token stop) {
        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        while (!stop.stop_requested()) {
            int n = ::poll(&pfd, 1, 200);
            if (n <= 0) continue;

            signalfd_siginfo info;
            if (::read(fd_, &info, sizeof(info)) == sizeof(info)) {
                std::println(stderr, "Received signal {}, cancelling", info.ssi_signo);
                target_.request_stop();
            }
        }
    }

    std::stop_source target_;
    int fd_ = -1;
    std::jthread thread_;
};

int cmd_history(const Config& config, int limit) {
    JobHistoryDb db;
    if (!db.open(history_path(config))) {
        return kExitFailure;
    }
    for (const auto& r : db.recent(limit)) {
        std::println("[{}] {} {} {}", r.timestamp, r.state, r.method.empty() ? "-" : r.method,
                     r.media_file);
        if (r.state == "done") {
            std::println("  {:.1f}s audio, {}/{} chunks, {} words, {:.1f}s processing",
                         r.duration_s, r.successful_chunks, r.total_chunks, r.word_count,
                         r.processing_time);
        } else {
            std::println("  {}", r.error);
        }
    }
    return 0;
}

int cmd_transcribe(const Config& config, const std::string& file, bool verbose, bool text_only) {
    if (config.backend.type != "lan") {
        std::println(stderr, "Unknown backend type: {}", config.backend.type);
        return kExitFailure;
    }

    FfmpegTool tool(FfmpegOptions{
        .ffmpeg = config.media.ffmpeg,
        .ffprobe = config.media.ffprobe,
        .sample_rate = config.media.sample_rate,
        .bitrate = config.media.bitrate,
        .format = config.media.format,
    });
    LanBackend backend(config.backend);

    JobRequest request{
        .media_path = file,
        .size_threshold_bytes = config.chunking.size_threshold_bytes,
        .chunk_duration_seconds = config.chunking.chunk_duration_seconds,
        .work_dir = config.chunking.work_dir,
        .dispatch = DispatchOptions{
            .max_concurrency = config.dispatch.max_concurrency,
            .max_retries = static_cast<int>(config.dispatch.max_retries),
            .backoff_base_seconds = config.dispatch.backoff_base_seconds,
            .verbose = verbose,
        },
    };

    // Block before any worker thread exists so they all inherit the mask
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    std::stop_source cancel;
    SignalWatcher watcher(mask, cancel);

    auto start = std::chrono::steady_clock::now();
    TranscriptionJob job(tool, backend, verbose);
    auto result = job.run(request, cancel.get_token());
    double processing_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (config.history.enabled) {
        JobHistoryDb db;
        if (db.open(history_path(config))) {
            auto media = std::filesystem::path(file).filename().string();
            auto record = result ? JobRecord::from_result(media, *result, processing_s)
                                 : JobRecord::from_error(media, result.error(), processing_s);
            if (!db.insert(record)) {
                std::println(stderr, "Warning: job not recorded in history");
            }
        } else {
            std::println(stderr, "Warning: job history DB failed to open, history disabled");
        }
    }

    if (!result) {
        std::println(stderr, "Error ({}): {}", to_string(result.error().kind), result.error().message);
        return result.error().kind == JobErrorKind::Cancelled ? kExitCancelled : kExitFailure;
    }

    if (result->partial()) {
        std::println(stderr, "Warning: partial transcript ({} failed, {} dropped of {} chunks)",
                     result->stats.failed_chunks, result->stats.dropped_chunks,
                     result->stats.total_chunks + result->stats.dropped_chunks);
    }

    if (text_only) {
        std::println("{}", result->full_transcript);
    } else {
        std::println("{}", to_json(*result).dump(2));
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool text_only = false;
    std::string config_path;
    std::string command;
    std::string file;
    int limit = 10;
    double chunk_minutes = 0.0;
    int concurrency = 0;
    int retries = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--chunk-minutes" && i + 1 < argc) {
            chunk_minutes = std::atof(argv[++i]);
        } else if (arg == "--concurrency" && i + 1 < argc) {
            concurrency = std::atoi(argv[++i]);
        } else if (arg == "--retries" && i + 1 < argc) {
            retries = std::atoi(argv[++i]);
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--text") {
            text_only = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else if (file.empty()) {
            file = arg;
        } else {
            std::println(stderr, "Unexpected argument: {}", arg);
            usage(argv[0]);
            return kExitUsage;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    if (chunk_minutes > 0.0) config.chunking.chunk_duration_seconds = chunk_minutes * 60.0;
    if (concurrency > 0) config.dispatch.max_concurrency = static_cast<uint32_t>(concurrency);
    if (retries > 0) config.dispatch.max_retries = static_cast<uint32_t>(retries);
    if (config.backend.api_key.empty()) {
        const char* key = std::getenv("OPENAI_API_KEY");
        if (key) config.backend.api_key = key;
    }

    if (command == "transcribe") {
        if (file.empty()) {
            std::println(stderr, "transcribe: missing input file");
            usage(argv[0]);
            return kExitUsage;
        }
        if (verbose) {
            std::println(stderr, "[chunkscribe] backend: {} @ {}", config.backend.api_format,
                         config.backend.url);
        }
        return cmd_transcribe(config, file, verbose, text_only);
    }
    if (command == "history") {
        return cmd_history(config, limit);
    }

    if (command.empty()) {
        usage(argv[0]);
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
    }
    return kExitUsage;
}
