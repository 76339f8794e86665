#include "lan_backend.hpp"

#include <chrono>
#include <curl/curl.h>
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Aborts the transfer once the job is cancelled.
static int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

static TranscriptionErrorKind classify_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_ABORTED_BY_CALLBACK:
            return TranscriptionErrorKind::Cancelled;
        case CURLE_OPERATION_TIMEDOUT:
            return TranscriptionErrorKind::Timeout;
        case CURLE_READ_ERROR:
        case CURLE_FILE_COULDNT_READ_FILE:
            return TranscriptionErrorKind::InvalidInput;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return TranscriptionErrorKind::InvalidInput;
        default:
            // Connection resets, DNS hiccups and the like are worth another try
            return TranscriptionErrorKind::ServerError;
    }
}

LanBackend::LanBackend(Config::Backend config)
    : config_(std::move(config)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::string LanBackend::endpoint() const {
    std::string base = config_.url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    if (config_.api_format == "openai") {
        return base + "/v1/audio/transcriptions";
    }
    return base + "/inference";
}

TranscriptionErrorKind LanBackend::classify_http_status(long status) {
    if (status == 429) return TranscriptionErrorKind::RateLimited;
    if (status == 408 || status == 504) return TranscriptionErrorKind::Timeout;
    if (status >= 500) return TranscriptionErrorKind::ServerError;
    if (status == 401 || status == 403) return TranscriptionErrorKind::AuthError;
    return TranscriptionErrorKind::InvalidInput;
}

std::string LanBackend::error_message(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("error")) {
            auto& e = j["error"];
            if (e.is_string()) return e.get<std::string>();
            if (e.is_object() && e.contains("message")) return e["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // not JSON; fall through to the raw body
    }
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

std::expected<RawTranscript, TranscriptionError> LanBackend::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (!j.contains("text")) {
            if (j.contains("error")) {
                return std::unexpected(TranscriptionError{
                    TranscriptionErrorKind::ServerError, "server error: " + error_message(body)});
            }
            return std::unexpected(TranscriptionError{
                TranscriptionErrorKind::InvalidInput, "unexpected response: " + error_message(body)});
        }

        RawTranscript tr;
        tr.text = j["text"].get<std::string>();
        if (j.contains("duration") && j["duration"].is_number()) {
            tr.duration_s = j["duration"].get<double>();
        }

        if (j.contains("segments") && j["segments"].is_array()) {
            int64_t next_id = 0;
            for (auto& s : j["segments"]) {
                Segment seg;
                seg.id = s.value("id", next_id);
                seg.start = s.value("start", 0.0);
                seg.end = s.value("end", seg.start);
                seg.text = s.value("text", "");
                next_id = seg.id + 1;
                tr.segments.push_back(std::move(seg));
            }
        }

        return tr;
    } catch (const json::exception& e) {
        return std::unexpected(TranscriptionError{
            TranscriptionErrorKind::InvalidInput, std::string("JSON parse error: ") + e.what()});
    }
}

std::expected<RawTranscript, TranscriptionError>
LanBackend::transcribe(const std::string& audio_path, std::stop_token stop) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(audio_path, ec)) {
        return std::unexpected(TranscriptionError{
            TranscriptionErrorKind::InvalidInput, "audio file not found: " + audio_path});
    }

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(TranscriptionError{
            TranscriptionErrorKind::ServerError, "curl_easy_init failed"});
    }

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    CURLcode file_rc = curl_mime_filedata(part, audio_path.c_str());

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "verbose_json", CURL_ZERO_TERMINATED);

    if (config_.api_format == "openai") {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, config_.model.c_str(), CURL_ZERO_TERMINATED);

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "timestamp_granularities[]");
        curl_mime_data(part, "segment", CURL_ZERO_TERMINATED);
    } else {
        // whisper.cpp server format
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "temperature");
        curl_mime_data(part, "0.0", CURL_ZERO_TERMINATED);
    }

    if (!config_.language.empty()) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, config_.language.c_str(), CURL_ZERO_TERMINATED);
    }

    if (file_rc != CURLE_OK) {
        curl_mime_free(mime);
        curl_easy_cleanup(curl);
        return std::unexpected(TranscriptionError{
            TranscriptionErrorKind::InvalidInput,
            std::string("cannot attach ") + audio_path + ": " + curl_easy_strerror(file_rc)});
    }

    curl_slist* headers = nullptr;
    if (!config_.api_key.empty()) {
        std::string auth = "Authorization: Bearer " + config_.api_key;
        headers = curl_slist_append(headers, auth.c_str());
    }

    std::string response_body;
    auto url = endpoint();

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    // Several workers run requests at once; no signals for timeouts
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res != CURLE_OK) {
        return std::unexpected(TranscriptionError{
            classify_curl_error(res), std::string("curl error: ") + curl_easy_strerror(res)});
    }

    if (status >= 400) {
        return std::unexpected(TranscriptionError{
            classify_http_status(status),
            "HTTP " + std::to_string(status) + ": " + error_message(response_body)});
    }

    auto parsed = parse_response(response_body);
    if (parsed) {
        parsed->processing_s = processing_s;
    }
    return parsed;
}
