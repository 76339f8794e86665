#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_random.hpp>

#include "pipeline/chunk_splitter.hpp"
#include "pipeline/result_merger.hpp"

#include <algorithm>
#include <random>

namespace {

ChunkOutcome success(size_t index, const std::string& text) {
    return ChunkOutcome{
        .index = index,
        .attempts = 1,
        .result = ChunkSuccess{
            .text = text,
            .segments = {
                Segment{.id = 0, .start = 0.0, .end = 2.0, .text = "first"},
                Segment{.id = 1, .start = 2.0, .end = 5.0, .text = "second"},
            },
            .word_count = count_words(text),
            .duration_s = 5.0,
        },
    };
}

ChunkOutcome failure(size_t index) {
    return ChunkOutcome{
        .index = index,
        .attempts = 3,
        .result = ChunkFailure{TranscriptionErrorKind::ServerError, "HTTP 503"},
    };
}

MergeInput make_input(double total, double step) {
    MergeInput in;
    in.chunks = ChunkSplitter::plan(total, step, "/tmp/cs_merge", "mp3");
    in.total_duration_s = total;
    in.chunk_duration_s = step;
    in.planned_chunks = in.chunks.size();
    return in;
}

} // namespace

TEST_CASE("ResultMerger", "[merger]") {

    SECTION("ShiftsSegmentsByChunkOffset") {
        auto in = make_input(1500.0, 600.0);
        in.outcomes = {success(0, "a b"), success(1, "c"), success(2, "d e f")};

        auto result = merge_outcomes(in);
        REQUIRE(result.has_value());
        REQUIRE(result->segments.size() == 6);
        REQUIRE(result->segments[2].start == 600.0);
        REQUIRE(result->segments[3].end == 605.0);
        REQUIRE(result->segments[5].start == 1202.0);
        for (size_t i = 0; i < result->segments.size(); i++) {
            REQUIRE(result->segments[i].id == static_cast<int64_t>(i));
        }
        REQUIRE(result->full_transcript == "a b c d e f");
        REQUIRE(result->word_count == 6);
        REQUIRE(result->duration_s == 1500.0);
        REQUIRE(result->stats.method == "parallel");
        REQUIRE(result->stats.chunk_duration_minutes == 10.0);
        REQUIRE_FALSE(result->partial());
    }

    SECTION("OrderIsChunkIndexNotCompletion") {
        auto in = make_input(1800.0, 600.0);
        in.outcomes = {success(2, "third"), success(0, "first"), success(1, "second")};

        auto result = merge_outcomes(in);
        REQUIRE(result.has_value());
        REQUIRE(result->full_transcript == "first second third");
    }

    SECTION("FailedChunkLeavesPartialResult") {
        auto in = make_input(4200.0, 600.0);
        for (size_t i = 0; i < 7; i++) {
            in.outcomes.push_back(i == 3 ? failure(i) : success(i, "w" + std::to_string(i)));
        }

        auto result = merge_outcomes(in);
        REQUIRE(result.has_value());
        REQUIRE(result->partial());
        REQUIRE(result->stats.total_chunks == 7);
        REQUIRE(result->stats.successful_chunks == 6);
        REQUIRE(result->stats.failed_chunks == 1);
        REQUIRE(result->stats.failures.size() == 1);
        REQUIRE(result->stats.failures[0].index == 3);
        REQUIRE(result->full_transcript == "w0 w1 w2 w4 w5 w6");
        REQUIRE(result->segments.size() == 12);
        // Chunk 4 keeps its own offset despite the missing chunk 3
        REQUIRE(result->segments[6].start == 2400.0);
    }

    SECTION("ChunkDetailsPerChunk") {
        auto in = make_input(1800.0, 600.0);
        in.outcomes = {success(2, "x y z"), failure(1), success(0, "a b")};

        auto result = merge_outcomes(in);
        REQUIRE(result.has_value());
        const auto& details = result->stats.chunk_details;
        REQUIRE(details.size() == 3);

        REQUIRE(details[0].index == 0);
        REQUIRE(details[0].succeeded);
        REQUIRE(details[0].word_count == 2);
        REQUIRE(details[0].duration_s == 5.0);
        REQUIRE(details[0].attempts == 1);

        REQUIRE(details[1].index == 1);
        REQUIRE_FALSE(details[1].succeeded);
        REQUIRE(details[1].error == TranscriptionErrorKind::ServerError);
        REQUIRE(details[1].attempts == 3);

        REQUIRE(details[2].word_count == 3);
    }

    SECTION("DroppedChunkCountsAsPartial") {
        auto in = make_input(1800.0, 600.0);
        in.chunks.erase(in.chunks.begin() + 1);
        in.outcomes = {success(0, "a"), success(2, "c")};

        auto result = merge_outcomes(in);
        REQUIRE(result.has_value());
        REQUIRE(result->stats.dropped_chunks == 1);
        REQUIRE(result->stats.total_chunks == 2);
        REQUIRE(result->partial());
        REQUIRE(result->segments[2].start == 1200.0);
    }

    SECTION("AllFailed") {
        auto in = make_input(1200.0, 600.0);
        in.outcomes = {failure(0), failure(1)};

        auto result = merge_outcomes(in);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == JobErrorKind::AllChunksFailed);
    }

    SECTION("EmptyTextAddsNoSeparator") {
        auto in = make_input(1800.0, 600.0);
        in.outcomes = {success(0, "a"), success(1, ""), success(2, "c")};

        auto result = merge_outcomes(in);
        REQUIRE(result.has_value());
        REQUIRE(result->full_transcript == "a c");
    }

    SECTION("SingleMethodSkipsLayoutCheck") {
        MergeInput in;
        in.chunks = {ChunkSpec{.index = 0, .path = "/tmp/talk.mp3"}};
        in.outcomes = {success(0, "hello there")};
        in.total_duration_s = 5.0;
        in.chunk_duration_s = 5.0;
        in.planned_chunks = 1;
        in.method = "single";
        in.check_layout = false;

        auto result = merge_outcomes(in);
        REQUIRE(result.has_value());
        REQUIRE(result->stats.method == "single");
        REQUIRE(result->stats.total_chunks == 1);
        REQUIRE(result->segments[1].start == 2.0);
    }
}

TEST_CASE("ResultMerger layout validation", "[merger]") {
    auto in = make_input(1800.0, 600.0);
    in.outcomes = {success(0, "a"), success(1, "b"), success(2, "c")};

    SECTION("ValidLayout") {
        REQUIRE(validate_layout(in).has_value());
    }

    SECTION("WrongOffset") {
        in.chunks[1].start_offset_s = 610.0;
        auto r = merge_outcomes(in);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == JobErrorKind::Split);
    }

    SECTION("Overlap") {
        in.chunks[0].duration_s = 700.0;
        REQUIRE_FALSE(validate_layout(in).has_value());
    }

    SECTION("OutOfOrderChunks") {
        std::swap(in.chunks[1], in.chunks[2]);
        REQUIRE_FALSE(validate_layout(in).has_value());
    }

    SECTION("DuplicateOutcome") {
        in.outcomes[2] = success(1, "again");
        REQUIRE_FALSE(validate_layout(in).has_value());
    }

    SECTION("OutcomeCountMismatch") {
        in.outcomes.pop_back();
        auto r = merge_outcomes(in);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == JobErrorKind::Split);
    }

    SECTION("IndexBeyondPlan") {
        in.planned_chunks = 2;
        REQUIRE_FALSE(validate_layout(in).has_value());
    }
}

TEST_CASE("Merged segments are time ordered", "[merger]") {
    auto seed = GENERATE(take(20, random(1u, 1000000u)));
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> total_dist(30.0, 20000.0);
    std::uniform_real_distribution<double> step_dist(10.0, 900.0);

    double total = total_dist(rng);
    double step = step_dist(rng);
    auto in = make_input(total, step);
    for (const auto& c : in.chunks) {
        in.outcomes.push_back(success(c.index, "x"));
    }
    std::shuffle(in.outcomes.begin(), in.outcomes.end(), rng);

    auto result = merge_outcomes(in);
    REQUIRE(result.has_value());
    REQUIRE(result->stats.successful_chunks == in.chunks.size());
    for (size_t i = 1; i < result->segments.size(); i++) {
        REQUIRE(result->segments[i].start >= result->segments[i - 1].start);
    }
}
