#pragma once

#include "chunk_cleaner.hpp"
#include "dispatcher.hpp"
#include "media/media_tool.hpp"
#include "types.hpp"
#include "whisper/backend.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>

enum class JobState { Planned, Splitting, Dispatching, Merging, Cleanup, Done, Failed };

const char* to_string(JobState state);

struct JobRequest {
    std::string media_path;
    uint64_t size_threshold_bytes = 24ull * 1024 * 1024;
    double chunk_duration_seconds = 600.0;
    std::string work_dir; // parent of the job's chunk directory; empty: system temp
    DispatchOptions dispatch;
};

// Runs one transcription job end to end:
//   Planned -> Splitting -> Dispatching -> Merging -> Cleanup -> Done
// or -> Cleanup -> Failed. Small inputs go straight to Dispatching with a
// single direct call and have nothing to clean up.
class TranscriptionJob {
public:
    using StateObserver = std::function<void(JobState)>;

    TranscriptionJob(MediaTool& tool, TranscriptionBackend& backend, bool verbose = false);

    TranscriptionJob(const TranscriptionJob&) = delete;
    TranscriptionJob& operator=(const TranscriptionJob&) = delete;

    void set_state_observer(StateObserver observer) { observer_ = std::move(observer); }

    std::expected<TranscriptionResult, JobError> run(const JobRequest& request,
                                                     std::stop_token stop = {});

    JobState state() const { return state_; }

    // Peak concurrent workers of the last run.
    size_t peak_in_flight() const { return peak_in_flight_; }

private:
    std::expected<TranscriptionResult, JobError>
        run_direct(const MediaFile& media, const JobRequest& request, std::stop_token stop);

    std::expected<TranscriptionResult, JobError>
        run_chunked(MediaFile media, const JobRequest& request, ChunkCleaner& cleaner,
                    std::stop_token stop);

    void transition(JobState next);
    void log(const std::string& msg);

    MediaTool& tool_;
    TranscriptionBackend& backend_;
    bool verbose_;
    JobState state_ = JobState::Planned;
    StateObserver observer_;
    size_t peak_in_flight_ = 0;
};
