#pragma once

#include "errors.hpp"

#include <memory>
#include <span>
#include <string>
#include <vector>

// A segment as read by the model, in seconds relative to the start of the
// samples it was given.
struct LocalSegment {
    double start = 0.0;
    double end = 0.0;
    std::string text;

    double avg_logprob = 0.0;        // mean token log probability
    double no_speech_prob = 0.0;
    double compression_ratio = 1.0;  // text bytes over deflated bytes
};

// Everything one call heard. language is set only when the model picked it.
struct LocalTranscript {
    std::vector<LocalSegment> segments;
    std::string language;
    double language_probability = 0.0;
};

struct InferenceOptions {
    std::string language = "en";  // "auto" lets the model detect it
    int beam_size = 5;
    int threads = 0;
};

class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    // Must be safe to call concurrently; implementations keep per-call state.
    virtual Result<LocalTranscript>
        transcribe(std::span<const float> pcm, const InferenceOptions& opts) const = 0;
};

using ModelHandle = std::shared_ptr<const SpeechModel>;
