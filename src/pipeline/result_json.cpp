#include "result_json.hpp"

nlohmann::json to_json(const Segment& segment) {
    return {
        {"id", segment.id},
        {"start", segment.start},
        {"end", segment.end},
        {"text", segment.text},
    };
}

nlohmann::json to_json(const TranscriptionResult& result) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& s : result.segments) {
        segments.push_back(to_json(s));
    }

    nlohmann::json failures = nlohmann::json::array();
    for (const auto& f : result.stats.failures) {
        failures.push_back({
            {"index", f.index},
            {"error", to_string(f.kind)},
            {"message", f.message},
        });
    }

    nlohmann::json details = nlohmann::json::array();
    for (const auto& d : result.stats.chunk_details) {
        nlohmann::json entry = {{"chunk", d.index}, {"attempts", d.attempts}};
        if (d.succeeded) {
            entry["words"] = d.word_count;
            entry["duration"] = d.duration_s;
        } else {
            entry["error"] = to_string(d.error);
        }
        details.push_back(std::move(entry));
    }

    return {
        {"full_transcript", result.full_transcript},
        {"segments", std::move(segments)},
        {"duration_seconds", result.duration_s},
        {"word_count", result.word_count},
        {"partial", result.partial()},
        {"chunking_stats", {
            {"total_chunks", result.stats.total_chunks},
            {"successful_chunks", result.stats.successful_chunks},
            {"failed_chunks", result.stats.failed_chunks},
            {"dropped_chunks", result.stats.dropped_chunks},
            {"method", result.stats.method},
            {"chunk_duration_minutes", result.stats.chunk_duration_minutes},
            {"failures", std::move(failures)},
            {"chunk_details", std::move(details)},
        }},
        {"audio_file", result.audio_file},
    };
}
