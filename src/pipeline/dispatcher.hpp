#pragma once

#include "types.hpp"
#include "whisper/backend.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <vector>

struct DispatchOptions {
    size_t max_concurrency = 8;
    int max_retries = 3;              // total attempts per chunk
    double backoff_base_seconds = 2.0;
    bool verbose = false;
};

class Dispatcher {
public:
    Dispatcher(TranscriptionBackend& backend, DispatchOptions options);

    // True when the file has to be split before it can be sent.
    static bool needs_chunking(uint64_t byte_size, uint64_t size_threshold);

    // Delay before the attempt following failed attempt `attempt` (1-based).
    static std::chrono::duration<double> backoff_delay(double base_seconds, int attempt);

    // Transcribes every chunk on a pool of min(max_concurrency, chunks) workers,
    // each taking the next unclaimed chunk. Returns one outcome per chunk, in
    // the order of `chunks`, however the workers finished.
    // AllChunksFailed if none succeeded, Cancelled if stop was requested.
    std::expected<std::vector<ChunkOutcome>, JobError>
        dispatch(const std::vector<ChunkSpec>& chunks, std::stop_token stop = {});

    // One chunk with retry and backoff. Never throws; failures become outcomes.
    ChunkOutcome transcribe_chunk(const ChunkSpec& chunk, std::stop_token stop);

    // Highest number of concurrently running workers seen by the last dispatch().
    size_t peak_in_flight() const { return peak_in_flight_.load(); }

private:
    void log(const std::string& msg);

    TranscriptionBackend& backend_;
    DispatchOptions options_;
    std::atomic<size_t> peak_in_flight_{0};
};
