#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// RIFF/WAVE encode and decode for the 16-bit PCM files the decoder produces.
namespace wav {

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

struct Decoded {
    std::vector<float> samples;  // mono, [-1, 1]
    uint32_t sample_rate = 0;
};

// Accepts PCM16 and float32, any channel count (downmixed by averaging).
// Chunks other than "fmt " and "data" are skipped.
inline std::expected<Decoded, std::string> decode(std::span<const uint8_t> bytes) {
    auto r16 = [&bytes](size_t pos) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto r32 = [&bytes](size_t pos) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };
    auto tag = [&bytes](size_t pos, const char* t) {
        return std::memcmp(bytes.data() + pos, t, 4) == 0;
    };

    if (bytes.size() < 12 || !tag(0, "RIFF") || !tag(8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint16_t bits = 0;
    uint32_t sample_rate = 0;
    bool have_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t size = r32(pos + 4);
        size_t body = pos + 8;

        if (tag(pos, "fmt ")) {
            if (size < 16 || body + 16 > bytes.size()) {
                return std::unexpected("truncated fmt chunk");
            }
            format = r16(body);
            channels = r16(body + 2);
            sample_rate = r32(body + 4);
            bits = r16(body + 14);
            // WAVE_FORMAT_EXTENSIBLE carries the real format in the subformat GUID.
            if (format == 0xFFFE && size >= 26 && body + 26 <= bytes.size()) {
                format = r16(body + 24);
            }
            have_fmt = true;
        } else if (tag(pos, "data")) {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            if (channels == 0) return std::unexpected("zero channels");

            // Streams written to a pipe carry a placeholder size; trust the file length.
            size_t avail = bytes.size() - body;
            size_t data_size = std::min<size_t>(size, avail);

            Decoded out;
            out.sample_rate = sample_rate;

            if (format == 1 && bits == 16) {
                size_t frames = data_size / (2 * channels);
                out.samples.resize(frames);
                for (size_t i = 0; i < frames; ++i) {
                    float sum = 0.0f;
                    for (uint16_t c = 0; c < channels; ++c) {
                        int16_t s;
                        std::memcpy(&s, bytes.data() + body + (i * channels + c) * 2, 2);
                        sum += static_cast<float>(s) / 32768.0f;
                    }
                    out.samples[i] = sum / channels;
                }
            } else if (format == 3 && bits == 32) {
                size_t frames = data_size / (4 * channels);
                out.samples.resize(frames);
                for (size_t i = 0; i < frames; ++i) {
                    float sum = 0.0f;
                    for (uint16_t c = 0; c < channels; ++c) {
                        float s;
                        std::memcpy(&s, bytes.data() + body + (i * channels + c) * 4, 4);
                        sum += s;
                    }
                    out.samples[i] = sum / channels;
                }
            } else {
                return std::unexpected("unsupported sample format " + std::to_string(format) +
                                       "/" + std::to_string(bits) + "bit");
            }
            return out;
        }

        // Chunks are padded to even sizes.
        pos = body + size + (size & 1);
    }

    return std::unexpected("no data chunk");
}

} // namespace wav
