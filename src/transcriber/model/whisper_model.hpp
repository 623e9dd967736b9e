#pragma once

#include "job.hpp"
#include "speech_model.hpp"

#include <memory>
#include <string>

struct whisper_context;

// whisper.cpp context bound to one device. The context holds only weights;
// every transcribe() call allocates its own decoder state.
class WhisperModel : public SpeechModel {
public:
    static Result<std::shared_ptr<WhisperModel>> load(const std::string& path, const ResolvedConfig& cfg);

    ~WhisperModel() override;

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    Result<LocalTranscript>
        transcribe(std::span<const float> pcm, const InferenceOptions& opts) const override;

    // ggml/whisper info and debug output; warnings and errors are always shown.
    static void set_verbose(bool verbose);

private:
    explicit WhisperModel(whisper_context* ctx);

    whisper_context* ctx_;
};
