#pragma once

#include "whisper/backend.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

struct MediaFile {
    std::string path;
    uint64_t byte_size = 0;
    double duration_s = 0.0;
};

// One time-bounded slice of the source recording, materialized on disk.
struct ChunkSpec {
    size_t index = 0;
    std::string path;
    double start_offset_s = 0.0;
    double duration_s = 0.0;
    uint64_t byte_size = 0;
};

struct ChunkSuccess {
    std::string text;
    std::vector<Segment> segments; // chunk-relative times
    size_t word_count = 0;
    double duration_s = 0.0;
};

struct ChunkFailure {
    TranscriptionErrorKind kind = TranscriptionErrorKind::ServerError;
    std::string message;
};

struct ChunkOutcome {
    size_t index = 0;
    int attempts = 0;
    std::variant<ChunkSuccess, ChunkFailure> result;

    bool succeeded() const { return std::holds_alternative<ChunkSuccess>(result); }
};

struct ChunkFailureSummary {
    size_t index = 0;
    TranscriptionErrorKind kind = TranscriptionErrorKind::ServerError;
    std::string message;
};

// Per-chunk line of the stats. Words and duration are set for a chunk that
// succeeded, error for one that did not.
struct ChunkDetail {
    size_t index = 0;
    int attempts = 0;
    bool succeeded = false;
    size_t word_count = 0;
    double duration_s = 0.0;
    TranscriptionErrorKind error = TranscriptionErrorKind::ServerError;
};

struct ChunkingStats {
    size_t total_chunks = 0;
    size_t successful_chunks = 0;
    size_t failed_chunks = 0;
    size_t dropped_chunks = 0;
    std::string method = "single"; // "single" or "parallel"
    double chunk_duration_minutes = 0.0;
    std::vector<ChunkFailureSummary> failures;
    std::vector<ChunkDetail> chunk_details; // one per surviving chunk, index order
};

struct TranscriptionResult {
    std::string full_transcript;
    std::vector<Segment> segments; // absolute times, chunk order
    double duration_s = 0.0;
    size_t word_count = 0;
    ChunkingStats stats;
    std::string audio_file;

    bool partial() const { return stats.failed_chunks > 0 || stats.dropped_chunks > 0; }
};

enum class JobErrorKind { InvalidInput, MediaProbe, Split, AllChunksFailed, Cancelled };

struct JobError {
    JobErrorKind kind = JobErrorKind::InvalidInput;
    std::string message;
};

const char* to_string(JobErrorKind kind);

// Whitespace-delimited word count.
size_t count_words(const std::string& text);

// Strips leading and trailing whitespace.
std::string trim(const std::string& text);
