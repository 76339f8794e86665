#include <catch2/catch_test_macros.hpp>

#include "media/duration_prober.hpp"
#include "media/ffmpeg_tool.hpp"
#include "media/process.hpp"
#include "test_fakes.hpp"

#include <chrono>
#include <signal.h>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("run_process", "[media]") {

    SECTION("CapturesStdout") {
        auto res = run_process({"sh", "-c", "echo hello; echo oops >&2"});
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->out == "hello\n");
        REQUIRE(res->err == "oops\n");
    }

    SECTION("NonZeroExit") {
        auto res = run_process({"sh", "-c", "exit 3"});
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 3);
    }

    SECTION("MissingProgram") {
        auto res = run_process({"cs-test-definitely-not-a-program"});
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == kExecFailedCode);
    }

    SECTION("ChildStartsWithSignalsUnblocked") {
        sigset_t blocked;
        sigemptyset(&blocked);
        sigaddset(&blocked, SIGINT);
        sigaddset(&blocked, SIGTERM);
        sigset_t previous;
        pthread_sigmask(SIG_BLOCK, &blocked, &previous);

        auto res = run_process({"grep", "SigBlk", "/proc/self/status"});
        pthread_sigmask(SIG_SETMASK, &previous, nullptr);

        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->out.find("0000000000000000") != std::string::npos);
    }

    SECTION("StopTerminatesChild") {
        std::stop_source stop;
        std::jthread canceller([&] {
            std::this_thread::sleep_for(50ms);
            stop.request_stop();
        });

        auto start = std::chrono::steady_clock::now();
        auto res = run_process({"sleep", "30"}, stop.get_token());
        REQUIRE(std::chrono::steady_clock::now() - start < 10s);
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 128 + SIGTERM);
    }

    SECTION("EmptyArgv") {
        auto res = run_process({});
        REQUIRE_FALSE(res.has_value());
    }
}

TEST_CASE("FfmpegTool", "[media]") {

    SECTION("ParseStringDuration") {
        auto d = FfmpegTool::parse_probe_output(R"({"format": {"duration": "4200.123000"}})");
        REQUIRE(d.has_value());
        REQUIRE(*d == 4200.123);
    }

    SECTION("ParseNumericDuration") {
        auto d = FfmpegTool::parse_probe_output(R"({"format": {"duration": 61.5}})");
        REQUIRE(d.has_value());
        REQUIRE(*d == 61.5);
    }

    SECTION("RejectsMissingOrBadDuration") {
        REQUIRE_FALSE(FfmpegTool::parse_probe_output(R"({"format": {}})").has_value());
        REQUIRE_FALSE(FfmpegTool::parse_probe_output(R"({"format": {"duration": "N/A"}})").has_value());
        REQUIRE_FALSE(FfmpegTool::parse_probe_output(R"({"format": {"duration": "0"}})").has_value());
        REQUIRE_FALSE(FfmpegTool::parse_probe_output("garbage").has_value());
    }

    SECTION("ExtractCommand") {
        FfmpegTool tool(FfmpegOptions{.ffmpeg = "/usr/bin/ffmpeg", .bitrate = "32k"});
        auto cmd = tool.extract_command("in.mp4", 600.0, 300.5, "/tmp/chunk_001.mp3");
        REQUIRE(cmd == std::vector<std::string>{
            "/usr/bin/ffmpeg", "-y", "-ss", "600.000", "-t", "300.500", "-i", "in.mp4",
            "-vn", "-ac", "1", "-ar", "16000", "-b:a", "32k", "-loglevel", "error",
            "/tmp/chunk_001.mp3"});
    }

    SECTION("ProbeCommand") {
        FfmpegTool tool;
        auto cmd = tool.probe_command("in.mp4");
        REQUIRE(cmd.front() == "ffprobe");
        REQUIRE(cmd.back() == "in.mp4");
    }

    SECTION("MissingBinaryReported") {
        FfmpegTool tool(FfmpegOptions{.ffprobe = "cs-test-no-ffprobe"});
        auto d = tool.probe_duration("in.mp4");
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error().find("not found") != std::string::npos);
    }
}

TEST_CASE("DurationProber", "[media]") {
    fakes::TmpDir tmp("prober");
    fakes::FakeMediaTool tool;
    DurationProber prober(tool);
    auto media = fakes::make_media_file(tmp.path, "talk.wav", 10000);

    SECTION("SizeAndDuration") {
        tool.duration = 123.0;
        auto size = DurationProber::file_size(media);
        REQUIRE(size.has_value());
        REQUIRE(*size == 10000);
        auto duration = prober.probe(media);
        REQUIRE(duration.has_value());
        REQUIRE(*duration == 123.0);
    }

    SECTION("DurationFailureIsMediaError") {
        tool.probe_fails = true;
        auto duration = prober.probe(media);
        REQUIRE_FALSE(duration.has_value());
        REQUIRE(duration.error().kind == JobErrorKind::MediaProbe);
    }

    SECTION("MissingFileIsInvalidInput") {
        auto size = DurationProber::file_size((tmp.path / "missing.wav").string());
        REQUIRE_FALSE(size.has_value());
        REQUIRE(size.error().kind == JobErrorKind::InvalidInput);
    }
}
