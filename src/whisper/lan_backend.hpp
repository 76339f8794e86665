#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <expected>
#include <string>

// HTTP transcription backend for an OpenAI-compatible endpoint
// (/v1/audio/transcriptions) or a whisper.cpp server (/inference).
class LanBackend : public TranscriptionBackend {
public:
    explicit LanBackend(Config::Backend config);
    ~LanBackend() override;

    LanBackend(const LanBackend&) = delete;
    LanBackend& operator=(const LanBackend&) = delete;

    std::expected<RawTranscript, TranscriptionError>
        transcribe(const std::string& audio_path, std::stop_token stop) override;

    std::string endpoint() const;

    // Maps an HTTP status >= 400 to an error kind.
    static TranscriptionErrorKind classify_http_status(long status);

    // Parses a verbose_json transcription response.
    static std::expected<RawTranscript, TranscriptionError> parse_response(const std::string& body);

    // Best-effort error message from an error response body.
    static std::string error_message(const std::string& body);

private:
    Config::Backend config_;
};
