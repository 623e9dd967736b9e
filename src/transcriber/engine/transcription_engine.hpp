#pragma once

#include "audio/audio_stream.hpp"
#include "chunk_planner.hpp"
#include "errors.hpp"
#include "job.hpp"
#include "model/speech_model.hpp"
#include "reconcile.hpp"

#include <functional>
#include <string>

struct EngineHooks {
    // Called after each planned chunk completes: (completed, total).
    std::function<void(int, int)> progress;
    // Consulted before each chunk; true stops the run with CancelledError.
    std::function<bool()> cancelled;
    std::function<void(const std::string&)> log;
};

class TranscriptionEngine {
public:
    TranscriptionEngine(ChunkingOptions chunking, InferenceOptions inference);

    // Chunks run strictly one after another. The returned result carries
    // segments, text and duration; metadata is left to the caller.
    Result<TranscriptResult> transcribe(const AudioStream& audio, const SpeechModel& model,
                                        const EngineHooks& hooks = {}) const;

private:
    Result<ChunkReading> run_chunk(const AudioStream& audio, const SpeechModel& model,
                                   const Chunk& chunk, TranscriptResult& result) const;

    ChunkingOptions chunking_;
    InferenceOptions inference_;
};
