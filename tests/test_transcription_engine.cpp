#include <catch2/catch_test_macros.hpp>

#include "engine/transcription_engine.hpp"
#include "test_support.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace testing_support;

namespace {

ChunkingOptions fixed(double chunk, double overlap) {
    return ChunkingOptions{.chunk_seconds = chunk, .overlap_seconds = overlap, .vad = false};
}

} // namespace

TEST_CASE("TranscriptionEngine", "[engine]") {
    GridModel model;

    SECTION("OverlappingChunksCoverWholeClip") {
        auto audio = indexed_audio(65.0);
        TranscriptionEngine engine(fixed(40.0, 5.0), InferenceOptions{});

        std::vector<std::pair<int, int>> progress;
        auto result = engine.transcribe(audio, model, EngineHooks{
            .progress = [&](int done, int total) { progress.emplace_back(done, total); },
        });

        REQUIRE(result.has_value());
        REQUIRE(result->duration_s == 65.0);
        REQUIRE(result->segments.size() == 13);
        REQUIRE(result->segments.front().start == 0.0);
        REQUIRE(result->segments.back().end == 65.0);
        for (size_t i = 0; i < result->segments.size(); ++i) {
            const auto& s = result->segments[i];
            REQUIRE(s.index == static_cast<int>(i));
            REQUIRE(s.text == "w" + std::to_string(i * 5));
            if (i > 0) REQUIRE(s.start == result->segments[i - 1].end);
        }
        REQUIRE(result->text.starts_with("w0 w5 w10"));
        REQUIRE(result->text.ends_with("w55 w60"));

        std::vector<std::pair<int, int>> expected = {{1, 2}, {2, 2}};
        REQUIRE(progress == expected);
        REQUIRE(model.calls.load() == 2);
    }

    SECTION("EmptyAudioSucceeds") {
        AudioStream audio;
        TranscriptionEngine engine(ChunkingOptions{}, InferenceOptions{});
        bool progressed = false;

        auto result = engine.transcribe(audio, model, EngineHooks{
            .progress = [&](int, int) { progressed = true; },
        });
        REQUIRE(result.has_value());
        REQUIRE(result->segments.empty());
        REQUIRE(result->text.empty());
        REQUIRE(result->duration_s == 0.0);
        REQUIRE_FALSE(progressed);
        REQUIRE(model.calls.load() == 0);
    }

    SECTION("FailedChunkRetriedAtHalfSize") {
        auto audio = indexed_audio(65.0);
        model.fail_when = [](std::span<const float> pcm) { return pcm.size() > 30 * 16000; };
        TranscriptionEngine engine(fixed(40.0, 5.0), InferenceOptions{});

        std::vector<std::string> logs;
        auto result = engine.transcribe(audio, model, EngineHooks{
            .log = [&](const std::string& msg) { logs.push_back(msg); },
        });

        REQUIRE(result.has_value());
        REQUIRE(result->segments.size() == 13);
        REQUIRE(is_well_ordered(result->segments, 65.0));
        REQUIRE(model.calls.load() == 4);
        REQUIRE(logs.size() == 1);
    }

    SECTION("SegmentScoresSurviveReconciliation") {
        auto audio = indexed_audio(65.0);
        TranscriptionEngine engine(fixed(40.0, 5.0), InferenceOptions{});

        auto result = engine.transcribe(audio, model);
        REQUIRE(result.has_value());
        for (const auto& s : result->segments) {
            REQUIRE(s.avg_logprob == -s.start / 100.0);
        }
        REQUIRE(result->detected_language.empty());
    }

    SECTION("FirstDetectedLanguageWins") {
        auto audio = indexed_audio(65.0);
        model.detects = "fr";
        TranscriptionEngine engine(fixed(40.0, 5.0), InferenceOptions{.language = "auto"});

        auto result = engine.transcribe(audio, model);
        REQUIRE(result.has_value());
        REQUIRE(result->detected_language == "fr");
        REQUIRE(result->language_probability == 0.75);
    }

    SECTION("GivenLanguageIsNotDetected") {
        auto audio = indexed_audio(10.0);
        model.detects = "fr";
        TranscriptionEngine engine(fixed(40.0, 5.0), InferenceOptions{.language = "en"});

        auto result = engine.transcribe(audio, model);
        REQUIRE(result.has_value());
        REQUIRE(result->detected_language.empty());
    }

    SECTION("RetryFailureIsInferenceError") {
        auto audio = indexed_audio(20.0);
        model.fail_when = [](std::span<const float>) { return true; };
        TranscriptionEngine engine(fixed(30.0, 2.0), InferenceOptions{});

        auto result = engine.transcribe(audio, model);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Inference);
        REQUIRE(result.error().message.find("chunk 1/1") != std::string::npos);
    }

    SECTION("CancelledBetweenChunks") {
        auto audio = indexed_audio(65.0);
        TranscriptionEngine engine(fixed(15.0, 2.0), InferenceOptions{});

        int completed = 0;
        int planned = 0;
        auto result = engine.transcribe(audio, model, EngineHooks{
            .progress = [&](int done, int total) { completed = done; planned = total; },
            .cancelled = [&] { return completed >= 2; },
        });

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Cancelled);
        REQUIRE(planned == 5);
        REQUIRE(completed == 2);
        REQUIRE(model.calls.load() == 2);
    }
}
