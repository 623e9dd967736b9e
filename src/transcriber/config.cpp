#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::Models::resolved_dir() const {
    if (!dir.empty()) return dir;
    auto cache = platform::cache_dir();
    if (cache.empty()) return "models";
    return cache + "/models";
}

// Out-of-range values keep the default and are reported.
template <typename T, typename Valid>
static void read_checked(const json& section, const char* key, T& out, Valid valid, const char* expect) {
    if (!section.contains(key)) return;
    auto v = section[key].get<T>();
    if (!valid(v)) {
        std::println(stderr, "config: {} must be {}, got {}; keeping {}", key, expect, v, out);
        return;
    }
    out = v;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("model")) cfg.transcription.model = t["model"].get<std::string>();
            if (t.contains("language")) cfg.transcription.language = t["language"].get<std::string>();
            if (t.contains("device")) cfg.transcription.device = t["device"].get<std::string>();
            if (t.contains("precision")) cfg.transcription.precision = t["precision"].get<std::string>();
            read_checked(t, "beam_size", cfg.transcription.beam_size, [](int v) { return v >= 1; }, ">= 1");
            if (t.contains("vad")) cfg.transcription.vad = t["vad"].get<bool>();
            read_checked(t, "threads", cfg.transcription.threads, [](int v) { return v >= 0; }, ">= 0");
        }

        if (j.contains("decoder")) {
            auto& d = j["decoder"];
            if (d.contains("ffmpeg")) cfg.decoder.ffmpeg = d["ffmpeg"].get<std::string>();
            read_checked(d, "sample_rate", cfg.decoder.sample_rate, [](uint32_t v) { return v > 0; }, "> 0");
        }

        if (j.contains("engine")) {
            auto& e = j["engine"];
            auto at_least_one = [](double v) { return v >= 1.0; };
            auto non_negative = [](double v) { return v >= 0.0; };
            read_checked(e, "chunk_seconds", cfg.engine.chunk_seconds, at_least_one, ">= 1");
            read_checked(e, "overlap_seconds", cfg.engine.overlap_seconds, non_negative, ">= 0");
            read_checked(e, "vad_search_seconds", cfg.engine.vad_search_seconds, non_negative, ">= 0");
            read_checked(e, "silence_threshold", cfg.engine.silence_threshold,
                         [](float v) { return v >= 0.0f; }, ">= 0");
        }

        if (j.contains("models")) {
            auto& m = j["models"];
            if (m.contains("dir")) cfg.models.dir = m["dir"].get<std::string>();
            if (m.contains("base_url")) cfg.models.base_url = m["base_url"].get<std::string>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("dir")) cfg.output.dir = o["dir"].get<std::string>();
            if (o.contains("keep_wav")) cfg.output.keep_wav = o["keep_wav"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        return load(config_path.string());
    }
    return Config{};
}
