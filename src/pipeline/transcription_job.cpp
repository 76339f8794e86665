#include "transcription_job.hpp"

#include "chunk_splitter.hpp"
#include "media/duration_prober.hpp"
#include "platform/paths.hpp"
#include "result_merger.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

const char* to_string(JobState state) {
    switch (state) {
        case JobState::Planned: return "planned";
        case JobState::Splitting: return "splitting";
        case JobState::Dispatching: return "dispatching";
        case JobState::Merging: return "merging";
        case JobState::Cleanup: return "cleanup";
        case JobState::Done: return "done";
        case JobState::Failed: return "failed";
    }
    return "unknown";
}

TranscriptionJob::TranscriptionJob(MediaTool& tool, TranscriptionBackend& backend, bool verbose)
    : tool_(tool), backend_(backend), verbose_(verbose) {}

std::expected<TranscriptionResult, JobError>
TranscriptionJob::run(const JobRequest& request, std::stop_token stop) {
    peak_in_flight_ = 0;
    transition(JobState::Planned);

    auto size = DurationProber::file_size(request.media_path);
    if (!size) {
        transition(JobState::Failed);
        return std::unexpected(size.error());
    }

    MediaFile media{.path = request.media_path, .byte_size = *size, .duration_s = 0.0};
    log(std::format("{}: {:.2f} MB", media.path, static_cast<double>(media.byte_size) / (1024.0 * 1024.0)));

    if (!Dispatcher::needs_chunking(media.byte_size, request.size_threshold_bytes)) {
        auto result = run_direct(media, request, stop);
        transition(result ? JobState::Done : JobState::Failed);
        return result;
    }

    std::expected<TranscriptionResult, JobError> result;
    {
        // Released on every path out of this scope, including exceptions
        ChunkCleaner cleaner;
        result = run_chunked(std::move(media), request, cleaner, stop);

        transition(JobState::Cleanup);
        size_t removed = cleaner.release();
        log(std::format("removed {} chunk files", removed));
    }

    transition(result ? JobState::Done : JobState::Failed);
    return result;
}

std::expected<TranscriptionResult, JobError>
TranscriptionJob::run_direct(const MediaFile& media, const JobRequest& request,
                             std::stop_token stop) {
    log(std::format("size within {} bytes, single direct call", request.size_threshold_bytes));
    transition(JobState::Dispatching);

    // The input file stands in as the only chunk; it is not ours to delete.
    std::vector<ChunkSpec> chunks{ChunkSpec{
        .index = 0,
        .path = media.path,
        .start_offset_s = 0.0,
        .duration_s = media.duration_s,
        .byte_size = media.byte_size,
    }};

    Dispatcher dispatcher(backend_, request.dispatch);
    auto outcomes = dispatcher.dispatch(chunks, stop);
    peak_in_flight_ = dispatcher.peak_in_flight();
    if (!outcomes) return std::unexpected(outcomes.error());

    transition(JobState::Merging);
    double duration = 0.0;
    if (auto* s = std::get_if<ChunkSuccess>(&outcomes->front().result)) {
        duration = s->duration_s;
    }

    auto result = merge_outcomes(MergeInput{
        .chunks = std::move(chunks),
        .outcomes = std::move(*outcomes),
        .total_duration_s = duration,
        .chunk_duration_s = duration,
        .planned_chunks = 1,
        .method = "single",
        .check_layout = false,
    });
    if (result) {
        result->audio_file = fs::path(media.path).filename().string();
    }
    return result;
}

std::expected<TranscriptionResult, JobError>
TranscriptionJob::run_chunked(MediaFile media, const JobRequest& request, ChunkCleaner& cleaner,
                              std::stop_token stop) {
    log(std::format("size over {} bytes, splitting", request.size_threshold_bytes));
    transition(JobState::Splitting);

    DurationProber prober(tool_);
    auto duration = prober.probe(media.path);
    if (!duration) return std::unexpected(duration.error());
    media.duration_s = *duration;

    auto job_dir = platform::make_job_dir(request.work_dir);
    if (job_dir.empty()) {
        return std::unexpected(JobError{JobErrorKind::Split, "cannot create chunk directory"});
    }
    cleaner.own_directory(job_dir);

    const double chunk_s = request.chunk_duration_seconds;
    size_t planned = ChunkSplitter::chunk_count(media.duration_s, chunk_s);
    log(std::format("duration {:.1f}s, {} chunks of {:.0f}s", media.duration_s, planned, chunk_s));

    ChunkSplitter splitter(tool_);
    auto chunks = splitter.split(media.path, media.duration_s, chunk_s, job_dir, cleaner, stop);
    if (!chunks) return std::unexpected(chunks.error());
    cleaner.adopt(*chunks);
    if (chunks->size() < planned) {
        std::println(stderr, "job: {} of {} chunks could not be extracted",
                     planned - chunks->size(), planned);
    }

    transition(JobState::Dispatching);
    Dispatcher dispatcher(backend_, request.dispatch);
    auto outcomes = dispatcher.dispatch(*chunks, stop);
    peak_in_flight_ = dispatcher.peak_in_flight();
    if (!outcomes) return std::unexpected(outcomes.error());

    transition(JobState::Merging);
    auto result = merge_outcomes(MergeInput{
        .chunks = std::move(*chunks),
        .outcomes = std::move(*outcomes),
        .total_duration_s = media.duration_s,
        .chunk_duration_s = chunk_s,
        .planned_chunks = planned,
        .method = "parallel",
        .check_layout = true,
    });
    if (!result) return result;

    result->audio_file = fs::path(media.path).filename().string();
    if (result->partial()) {
        std::println(stderr, "job: partial transcript, {} of {} chunks failed",
                     result->stats.failed_chunks, result->stats.total_chunks);
    }
    log(std::format("merged {} segments, {} words", result->segments.size(), result->word_count));
    return result;
}

void TranscriptionJob::transition(JobState next) {
    state_ = next;
    log(std::string("state: ") + to_string(next));
    if (observer_) observer_(next);
}

void TranscriptionJob::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[chunkscribe] {}", msg);
    }
}
