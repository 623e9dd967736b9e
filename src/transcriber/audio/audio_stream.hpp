#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Mono float PCM in [-1, 1] at a fixed sample rate.
struct AudioStream {
    std::vector<float> samples;
    uint32_t sample_rate = 16000;

    double duration() const {
        if (sample_rate == 0) return 0.0;
        return static_cast<double>(samples.size()) / sample_rate;
    }

    std::span<const float> slice(size_t begin, size_t end) const {
        if (end > samples.size()) end = samples.size();
        if (begin > end) begin = end;
        return std::span<const float>(samples).subspan(begin, end - begin);
    }
};
