#pragma once

#include "media_decoder.hpp"

#include <cstdint>
#include <string>

// Runs the ffmpeg executable to produce 16-bit mono PCM at sample_rate.
class FfmpegDecoder : public MediaDecoder {
public:
    FfmpegDecoder(std::string executable, uint32_t sample_rate, std::string temp_root);

    Result<AudioStream> decode(const std::string& path, const DecodeOptions& opts) override;

    // Resolves a bare name against PATH; names containing '/' are checked as-is.
    // Returns empty if no executable regular file was found.
    static std::string find_executable(const std::string& name);

private:
    std::string executable_;
    uint32_t sample_rate_;
    std::string temp_root_;
};
