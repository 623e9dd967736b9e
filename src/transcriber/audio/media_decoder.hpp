#pragma once

#include "audio/audio_stream.hpp"
#include "errors.hpp"

#include <functional>
#include <string>

struct DecodeOptions {
    std::function<bool()> cancelled;
};

class MediaDecoder {
public:
    virtual ~MediaDecoder() = default;
    virtual Result<AudioStream> decode(const std::string& path, const DecodeOptions& opts) = 0;
};
