#pragma once

#include "audio/audio_stream.hpp"

#include <cstddef>
#include <vector>

// Sample range [begin, end) submitted to the model as one inference call.
struct Chunk {
    size_t begin = 0;
    size_t end = 0;

    size_t size() const { return end - begin; }
};

struct ChunkingOptions {
    double chunk_seconds = 30.0;     // below one second counts as one second
    double overlap_seconds = 2.0;
    bool vad = true;
    double vad_search_seconds = 3.0;
    float silence_threshold = 0.01f;  // RMS below which a frame counts as silence
};

// Covers [0, samples) with chunks in increasing order. Consecutive chunks
// overlap by overlap_seconds, except where vad found a silent frame to cut at,
// in which case they abut at that frame.
std::vector<Chunk> plan_chunks(const AudioStream& audio, const ChunkingOptions& opts);

// Fixed-length re-plan of one chunk at half its size, used to retry a failed chunk.
std::vector<Chunk> split_chunk(const Chunk& chunk, size_t overlap_samples);
