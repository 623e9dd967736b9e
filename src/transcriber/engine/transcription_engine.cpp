#include "transcription_engine.hpp"

#include <algorithm>
#include <format>

TranscriptionEngine::TranscriptionEngine(ChunkingOptions chunking, InferenceOptions inference)
    : chunking_(std::move(chunking)), inference_(std::move(inference)) {}

Result<ChunkReading> TranscriptionEngine::run_chunk(const AudioStream& audio, const SpeechModel& model,
                                                    const Chunk& chunk, TranscriptResult& result) const {
    auto local = model.transcribe(audio.slice(chunk.begin, chunk.end), inference_);
    if (!local) return std::unexpected(local.error());

    // The first chunk that names a language speaks for the whole stream.
    if (result.detected_language.empty() && !local->language.empty()) {
        result.detected_language = local->language;
        result.language_probability = local->language_probability;
    }

    ChunkReading reading;
    reading.start = static_cast<double>(chunk.begin) / audio.sample_rate;
    reading.end = static_cast<double>(chunk.end) / audio.sample_rate;
    reading.segments.reserve(local->segments.size());
    for (auto& ls : local->segments) {
        reading.segments.push_back(Segment{
            .start = reading.start + ls.start,
            .end = reading.start + ls.end,
            .text = std::move(ls.text),
            .avg_logprob = ls.avg_logprob,
            .no_speech_prob = ls.no_speech_prob,
            .compression_ratio = ls.compression_ratio,
        });
    }
    return reading;
}

Result<TranscriptResult> TranscriptionEngine::transcribe(const AudioStream& audio, const SpeechModel& model,
                                                         const EngineHooks& hooks) const {
    auto log = [&hooks](const std::string& msg) {
        if (hooks.log) hooks.log(msg);
    };

    TranscriptResult result;
    result.duration_s = audio.duration();

    auto chunks = plan_chunks(audio, chunking_);
    const int total = static_cast<int>(chunks.size());
    const size_t overlap = static_cast<size_t>(std::max(0.0, chunking_.overlap_seconds) * audio.sample_rate);

    std::vector<ChunkReading> readings;
    readings.reserve(chunks.size());

    for (int i = 0; i < total; ++i) {
        if (hooks.cancelled && hooks.cancelled()) {
            return fail(ErrorKind::Cancelled, std::format("cancelled after {} of {} chunks", i, total));
        }

        const Chunk& chunk = chunks[i];
        auto reading = run_chunk(audio, model, chunk, result);
        if (reading) {
            readings.push_back(std::move(*reading));
        } else {
            log(std::format("Chunk {}/{} failed ({}), retrying at half size",
                            i + 1, total, describe(reading.error())));
            for (const auto& part : split_chunk(chunk, overlap)) {
                auto retry = run_chunk(audio, model, part, result);
                if (!retry) {
                    return fail(ErrorKind::Inference,
                                std::format("chunk {}/{} ({:.2f}s-{:.2f}s) failed after retry: {}",
                                            i + 1, total,
                                            static_cast<double>(chunk.begin) / audio.sample_rate,
                                            static_cast<double>(chunk.end) / audio.sample_rate,
                                            retry.error().message));
                }
                readings.push_back(std::move(*retry));
            }
        }

        if (hooks.progress) hooks.progress(i + 1, total);
    }

    result.segments = reconcile(std::move(readings), result.duration_s);
    if (!is_well_ordered(result.segments, result.duration_s)) {
        return fail(ErrorKind::Inference, "segment ordering invariant violated");
    }

    for (const auto& s : result.segments) {
        if (!result.text.empty()) result.text += ' ';
        result.text += s.text;
    }
    return result;
}
