#include "dispatcher.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <format>
#include <mutex>
#include <print>
#include <system_error>
#include <thread>

namespace {

// Sleeps for `delay` unless stop is requested first. Returns false on stop.
bool interruptible_sleep(std::chrono::duration<double> delay, std::stop_token stop) {
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_lock lock(mu);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

ChunkFailure cancelled_failure() {
    return ChunkFailure{TranscriptionErrorKind::Cancelled, "cancelled"};
}

} // namespace

Dispatcher::Dispatcher(TranscriptionBackend& backend, DispatchOptions options)
    : backend_(backend), options_(options) {
    if (options_.max_concurrency == 0) options_.max_concurrency = 1;
    if (options_.max_retries < 1) options_.max_retries = 1;
}

bool Dispatcher::needs_chunking(uint64_t byte_size, uint64_t size_threshold) {
    return byte_size > size_threshold;
}

std::chrono::duration<double> Dispatcher::backoff_delay(double base_seconds, int attempt) {
    if (base_seconds <= 0.0) return std::chrono::duration<double>(0.0);
    return std::chrono::duration<double>(std::pow(base_seconds, attempt));
}

ChunkOutcome Dispatcher::transcribe_chunk(const ChunkSpec& chunk, std::stop_token stop) {
    ChunkOutcome outcome{.index = chunk.index, .attempts = 0, .result = cancelled_failure()};

    for (int attempt = 1; attempt <= options_.max_retries; attempt++) {
        if (stop.stop_requested()) {
            outcome.result = cancelled_failure();
            return outcome;
        }

        outcome.attempts = attempt;
        auto res = backend_.transcribe(chunk.path, stop);
        if (res) {
            auto text = trim(res->text);
            ChunkSuccess success{
                .text = text,
                .segments = std::move(res->segments),
                .word_count = count_words(text),
                .duration_s = res->duration_s,
            };
            log(std::format("chunk {} done: {} words, attempt {}, {:.1f}s", chunk.index,
                            success.word_count, attempt, res->processing_s));
            outcome.result = std::move(success);
            return outcome;
        }

        const auto& err = res.error();
        outcome.result = ChunkFailure{err.kind, err.message};

        if (err.kind == TranscriptionErrorKind::Cancelled) {
            return outcome;
        }
        if (!err.retryable()) {
            std::println(stderr, "dispatch: chunk {} failed ({}), not retrying: {}",
                         chunk.index, to_string(err.kind), err.message);
            return outcome;
        }
        if (attempt == options_.max_retries) {
            std::println(stderr, "dispatch: chunk {} failed after {} attempts ({}): {}",
                         chunk.index, attempt, to_string(err.kind), err.message);
            return outcome;
        }

        auto delay = backoff_delay(options_.backoff_base_seconds, attempt);
        std::println(stderr, "dispatch: chunk {} attempt {}/{} failed ({}), retrying in {:.1f}s",
                     chunk.index, attempt, options_.max_retries, to_string(err.kind),
                     delay.count());
        if (!interruptible_sleep(delay, stop)) {
            outcome.result = cancelled_failure();
            return outcome;
        }
    }

    return outcome;
}

std::expected<std::vector<ChunkOutcome>, JobError>
Dispatcher::dispatch(const std::vector<ChunkSpec>& chunks, std::stop_token stop) {
    peak_in_flight_.store(0);
    if (chunks.empty()) {
        return std::unexpected(JobError{JobErrorKind::AllChunksFailed, "no chunks to transcribe"});
    }

    // Internal source so that workers share one token regardless of who cancels.
    std::stop_source cancel;
    std::stop_callback forward(stop, [&cancel] { cancel.request_stop(); });

    // One slot per chunk; each worker writes only its own slot.
    std::vector<ChunkOutcome> slots(chunks.size());
    for (size_t i = 0; i < chunks.size(); i++) {
        slots[i] = ChunkOutcome{.index = chunks[i].index, .attempts = 0,
                                .result = cancelled_failure()};
    }

    std::atomic<size_t> next{0};
    std::atomic<size_t> in_flight{0};
    auto work = [&](std::stop_token token) {
        while (!token.stop_requested()) {
            size_t i = next.fetch_add(1);
            if (i >= chunks.size()) return;

            size_t now = ++in_flight;
            size_t prev = peak_in_flight_.load();
            while (now > prev && !peak_in_flight_.compare_exchange_weak(prev, now)) {}

            log(std::format("chunk {} started ({} in flight)", chunks[i].index, now));
            slots[i] = transcribe_chunk(chunks[i], token);
            --in_flight;
        }
    };

    const size_t pool_size = std::min(options_.max_concurrency, chunks.size());
    {
        std::vector<std::jthread> workers;
        workers.reserve(pool_size);
        for (size_t w = 0; w < pool_size; w++) {
            try {
                workers.emplace_back([&work, token = cancel.get_token()] { work(token); });
            } catch (const std::system_error& e) {
                // Run with the workers we have
                std::println(stderr, "dispatch: could not start worker {}/{}: {}",
                             w + 1, pool_size, e.what());
                break;
            }
        }
        if (workers.empty()) {
            return std::unexpected(JobError{JobErrorKind::AllChunksFailed,
                                            "no transcription worker could be started"});
        }
        // jthread destructors join every worker here
    }

    if (cancel.stop_requested()) {
        return std::unexpected(JobError{JobErrorKind::Cancelled, "cancelled while transcribing"});
    }

    size_t succeeded = 0;
    for (const auto& o : slots) {
        if (o.succeeded()) succeeded++;
    }
    if (succeeded == 0) {
        return std::unexpected(JobError{
            JobErrorKind::AllChunksFailed,
            std::format("all {} chunks failed", chunks.size())});
    }

    return slots;
}

void Dispatcher::log(const std::string& msg) {
    if (options_.verbose) {
        std::println(stderr, "[chunkscribe] {}", msg);
    }
}
