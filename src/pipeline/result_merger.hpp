#pragma once

#include "types.hpp"

#include <expected>
#include <string>
#include <vector>

struct MergeInput {
    std::vector<ChunkSpec> chunks;     // surviving chunks, index order
    std::vector<ChunkOutcome> outcomes; // one per chunk, any order
    double total_duration_s = 0.0;
    double chunk_duration_s = 0.0;
    size_t planned_chunks = 0;          // before the splitter dropped any
    std::string method = "parallel";
    bool check_layout = true;           // off for the direct, unsplit path
};

// Checks that the chunk layout is index-ordered and gap/overlap free apart
// from indices the splitter dropped. A violation is a Split error.
std::expected<void, JobError> validate_layout(const MergeInput& input);

// Reassembles chunk outcomes, by chunk index, into one transcript with
// absolute segment times. Failed chunks are counted but contribute nothing.
// AllChunksFailed if no chunk succeeded.
std::expected<TranscriptionResult, JobError> merge_outcomes(MergeInput input);
