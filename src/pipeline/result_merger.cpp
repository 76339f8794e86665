#include "result_merger.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <map>

namespace {

constexpr double kTimeEpsilon = 1e-6;

bool near(double a, double b) {
    return std::fabs(a - b) <= kTimeEpsilon * std::max(1.0, std::fabs(b));
}

JobError layout_error(std::string msg) {
    return JobError{JobErrorKind::Split, "invalid chunk layout: " + std::move(msg)};
}

} // namespace

std::expected<void, JobError> validate_layout(const MergeInput& input) {
    const auto& chunks = input.chunks;
    if (chunks.empty()) {
        return std::unexpected(layout_error("no chunks"));
    }
    if (input.outcomes.size() != chunks.size()) {
        return std::unexpected(layout_error(std::format(
            "{} outcomes for {} chunks", input.outcomes.size(), chunks.size())));
    }

    const double total = input.total_duration_s;
    const double step = input.chunk_duration_s;
    if (!(step > 0.0) || !(total > 0.0)) {
        return std::unexpected(layout_error(std::format("total {}s, chunk {}s", total, step)));
    }

    for (size_t i = 0; i < chunks.size(); i++) {
        const auto& c = chunks[i];
        if (input.planned_chunks > 0 && c.index >= input.planned_chunks) {
            return std::unexpected(layout_error(std::format(
                "chunk index {} beyond {} planned", c.index, input.planned_chunks)));
        }
        if (!near(c.start_offset_s, static_cast<double>(c.index) * step)) {
            return std::unexpected(layout_error(std::format(
                "chunk {} starts at {}s, expected {}s", c.index, c.start_offset_s,
                static_cast<double>(c.index) * step)));
        }
        double expected_duration = std::min(step, total - c.start_offset_s);
        if (!(c.duration_s > 0.0) || !near(c.duration_s, expected_duration)) {
            return std::unexpected(layout_error(std::format(
                "chunk {} lasts {}s, expected {}s", c.index, c.duration_s, expected_duration)));
        }

        if (i == 0) continue;
        const auto& prev = chunks[i - 1];
        if (c.index <= prev.index) {
            return std::unexpected(layout_error(std::format(
                "chunk {} follows chunk {}", c.index, prev.index)));
        }
        double prev_end = prev.start_offset_s + prev.duration_s;
        if (prev_end > c.start_offset_s + kTimeEpsilon) {
            return std::unexpected(layout_error(std::format(
                "chunk {} overlaps chunk {}", c.index, prev.index)));
        }
        // A gap is only legitimate where the splitter dropped chunks
        if (c.index == prev.index + 1 && !near(prev_end, c.start_offset_s)) {
            return std::unexpected(layout_error(std::format(
                "gap between chunk {} and chunk {}", prev.index, c.index)));
        }
    }

    std::map<size_t, size_t> seen;
    for (const auto& o : input.outcomes) {
        seen[o.index]++;
    }
    for (const auto& c : chunks) {
        auto it = seen.find(c.index);
        if (it == seen.end() || it->second != 1) {
            return std::unexpected(layout_error(std::format(
                "chunk {} has {} outcomes", c.index, it == seen.end() ? 0 : it->second)));
        }
    }

    return {};
}

std::expected<TranscriptionResult, JobError> merge_outcomes(MergeInput input) {
    if (input.check_layout) {
        auto valid = validate_layout(input);
        if (!valid) return std::unexpected(valid.error());
    } else if (input.outcomes.size() != input.chunks.size()) {
        return std::unexpected(layout_error(std::format(
            "{} outcomes for {} chunks", input.outcomes.size(), input.chunks.size())));
    }

    // Order is chunk index, never completion order
    std::sort(input.outcomes.begin(), input.outcomes.end(),
              [](const ChunkOutcome& a, const ChunkOutcome& b) { return a.index < b.index; });

    TranscriptionResult result;
    result.duration_s = input.total_duration_s;
    result.stats.method = input.method;
    result.stats.chunk_duration_minutes = input.chunk_duration_s / 60.0;
    result.stats.total_chunks = input.chunks.size();
    if (input.planned_chunks > input.chunks.size()) {
        result.stats.dropped_chunks = input.planned_chunks - input.chunks.size();
    }

    int64_t next_id = 0;
    for (size_t i = 0; i < input.outcomes.size(); i++) {
        auto& outcome = input.outcomes[i];
        const auto& chunk = input.chunks[i];

        ChunkDetail detail{.index = outcome.index, .attempts = outcome.attempts};

        if (auto* failure = std::get_if<ChunkFailure>(&outcome.result)) {
            detail.error = failure->kind;
            result.stats.chunk_details.push_back(detail);
            result.stats.failed_chunks++;
            result.stats.failures.push_back(ChunkFailureSummary{
                .index = outcome.index,
                .kind = failure->kind,
                .message = failure->message,
            });
            continue;
        }

        auto& success = std::get<ChunkSuccess>(outcome.result);
        detail.succeeded = true;
        detail.word_count = success.word_count;
        detail.duration_s = success.duration_s;
        result.stats.chunk_details.push_back(detail);
        result.stats.successful_chunks++;
        result.word_count += success.word_count;

        for (auto& seg : success.segments) {
            seg.id = next_id++;
            seg.start += chunk.start_offset_s;
            seg.end += chunk.start_offset_s;
            result.segments.push_back(std::move(seg));
        }

        if (!success.text.empty()) {
            if (!result.full_transcript.empty()) result.full_transcript += ' ';
            result.full_transcript += success.text;
        }
    }

    if (result.stats.successful_chunks == 0) {
        return std::unexpected(JobError{
            JobErrorKind::AllChunksFailed,
            std::format("all {} chunks failed", result.stats.total_chunks)});
    }

    return result;
}
