#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Transcription {
        std::string model = "small";
        std::string language = "en";
        std::string device = "auto";
        std::string precision;  // empty = pick per device
        int beam_size = 5;
        bool vad = true;
        int threads = 0;        // 0 = hardware concurrency
    } transcription;

    struct Decoder {
        std::string ffmpeg = "ffmpeg";
        uint32_t sample_rate = 16000;
    } decoder;

    struct Engine {
        double chunk_seconds = 30.0;
        double overlap_seconds = 2.0;
        // How far back from a nominal chunk end to look for a quiet frame.
        double vad_search_seconds = 3.0;
        float silence_threshold = 0.01f;
    } engine;

    struct Models {
        std::string dir;  // empty = <cache_dir>/models
        std::string base_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";

        std::string resolved_dir() const;
    } models;

    struct Output {
        std::string dir = "output";
        bool keep_wav = false;
    } output;

    static Config load(const std::string& path);
    static Config load_default();
};
