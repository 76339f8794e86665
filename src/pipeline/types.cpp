#include "types.hpp"

#include <sstream>

const char* to_string(TranscriptionErrorKind kind) {
    switch (kind) {
        case TranscriptionErrorKind::RateLimited: return "rate_limited";
        case TranscriptionErrorKind::Timeout: return "timeout";
        case TranscriptionErrorKind::ServerError: return "server_error";
        case TranscriptionErrorKind::InvalidInput: return "invalid_input";
        case TranscriptionErrorKind::AuthError: return "auth_error";
        case TranscriptionErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(JobErrorKind kind) {
    switch (kind) {
        case JobErrorKind::InvalidInput: return "invalid_input";
        case JobErrorKind::MediaProbe: return "media_probe";
        case JobErrorKind::Split: return "split";
        case JobErrorKind::AllChunksFailed: return "all_chunks_failed";
        case JobErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

size_t count_words(const std::string& text) {
    std::istringstream in(text);
    size_t n = 0;
    std::string word;
    while (in >> word) ++n;
    return n;
}

std::string trim(const std::string& text) {
    auto start_pos = text.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = text.find_last_not_of(" \t\n\r");
    return text.substr(start_pos, end_pos - start_pos + 1);
}
