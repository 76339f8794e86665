#pragma once

#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

struct Segment {
    int64_t id = 0;
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

struct RawTranscript {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
    std::vector<Segment> segments;
};

enum class TranscriptionErrorKind {
    RateLimited,
    Timeout,
    ServerError,
    InvalidInput,
    AuthError,
    Cancelled,
};

struct TranscriptionError {
    TranscriptionErrorKind kind = TranscriptionErrorKind::ServerError;
    std::string message;

    bool retryable() const {
        return kind == TranscriptionErrorKind::RateLimited ||
               kind == TranscriptionErrorKind::Timeout ||
               kind == TranscriptionErrorKind::ServerError;
    }
};

const char* to_string(TranscriptionErrorKind kind);

class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;

    // Transcribes one audio file. Must be safe to call from several threads at once.
    // A stop request aborts the call with TranscriptionErrorKind::Cancelled.
    virtual std::expected<RawTranscript, TranscriptionError>
        transcribe(const std::string& audio_path, std::stop_token stop) = 0;
};
