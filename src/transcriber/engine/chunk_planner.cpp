#include "chunk_planner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

static constexpr double kFrameSeconds = 0.02;
static constexpr double kMinChunkSeconds = 1.0;

static float frame_rms(const AudioStream& audio, size_t begin, size_t len) {
    double sum = 0.0;
    for (size_t i = begin; i < begin + len; ++i) {
        double s = audio.samples[i];
        sum += s * s;
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(len)));
}

// Start of the quietest frame in [lo, hi), or hi if the window holds no full frame.
static size_t quietest_frame(const AudioStream& audio, size_t lo, size_t hi, size_t frame,
                             float& rms_out) {
    size_t best = hi;
    rms_out = std::numeric_limits<float>::max();
    for (size_t pos = lo; pos + frame <= hi; pos += frame) {
        float rms = frame_rms(audio, pos, frame);
        // Later frames win ties so chunks stay as long as possible.
        if (rms <= rms_out) {
            rms_out = rms;
            best = pos;
        }
    }
    return best;
}

std::vector<Chunk> plan_chunks(const AudioStream& audio, const ChunkingOptions& opts) {
    std::vector<Chunk> chunks;
    const size_t total = audio.samples.size();
    if (total == 0) return chunks;

    const double rate = audio.sample_rate;
    const size_t chunk_len = std::max<size_t>(
        1, static_cast<size_t>(std::max(kMinChunkSeconds, opts.chunk_seconds) * rate));
    // Overlap is kept well below the chunk length so every step makes progress.
    const size_t overlap = std::min(static_cast<size_t>(std::max(0.0, opts.overlap_seconds) * rate),
                                    chunk_len / 2);
    const size_t search = static_cast<size_t>(std::max(0.0, opts.vad_search_seconds) * rate);
    const size_t frame = std::max<size_t>(1, static_cast<size_t>(kFrameSeconds * rate));

    size_t begin = 0;
    for (;;) {
        size_t nominal_end = begin + chunk_len;
        if (nominal_end >= total) {
            chunks.push_back(Chunk{.begin = begin, .end = total});
            break;
        }

        size_t end = nominal_end;
        size_t step_back = overlap;

        if (opts.vad && search > 0) {
            size_t lo = std::max(begin + chunk_len / 2, nominal_end > search ? nominal_end - search : 0);
            float rms = 0.0f;
            size_t quiet = quietest_frame(audio, lo, nominal_end, frame, rms);
            if (quiet < nominal_end && rms < opts.silence_threshold) {
                end = quiet + frame / 2;
                step_back = 0;
            }
        }

        chunks.push_back(Chunk{.begin = begin, .end = end});
        begin = end - step_back;
    }
    return chunks;
}

std::vector<Chunk> split_chunk(const Chunk& chunk, size_t overlap_samples) {
    size_t half = chunk.size() / 2;
    if (half == 0) return {chunk};

    size_t overlap = std::min(overlap_samples, half / 2);
    std::vector<Chunk> parts;
    parts.push_back(Chunk{.begin = chunk.begin, .end = chunk.begin + half});
    parts.push_back(Chunk{.begin = chunk.begin + half - overlap, .end = chunk.end});
    return parts;
}
