#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct TranscriptionJob {
    std::string input_path;
    std::string model = "small";
    std::string language = "en";
    std::string device = "auto";
    std::optional<std::string> precision;
    std::string output_dir = "output";

    int beam_size = 5;
    bool vad = true;
    bool keep_wav = false;
};

// The concrete (device, precision) pair a job runs with.
struct ResolvedConfig {
    std::string device;     // "cpu", "cuda:0", "metal:0", ...
    std::string precision;  // "f16", "q8_0", ...
    bool accelerated = false;
    int gpu_ordinal = -1;   // index among all GPU devices, -1 for cpu

    bool operator==(const ResolvedConfig&) const = default;
};

struct Segment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
    int index = 0;

    double avg_logprob = 0.0;
    double no_speech_prob = 0.0;
    double compression_ratio = 1.0;
};

struct TranscriptMetadata {
    std::string model;
    std::string language;
    std::string device;
    std::string precision;
    int beam_size = 5;
    bool vad = true;
};

struct TranscriptResult {
    std::vector<Segment> segments;
    std::string text;
    double duration_s = 0.0;
    // Set when the language was detected rather than given.
    std::string detected_language;
    double language_probability = 0.0;
    TranscriptMetadata metadata;
};
