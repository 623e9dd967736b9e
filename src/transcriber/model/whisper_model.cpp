#include "whisper_model.hpp"

#include "text_stats.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <format>
#include <mutex>
#include <thread>
#include <vector>
#include <whisper.h>

static std::atomic<bool> g_verbose{false};

static void log_cb(ggml_log_level level, const char* text, void*) {
    switch (level) {
        case GGML_LOG_LEVEL_ERROR:
        case GGML_LOG_LEVEL_WARN:
            std::fputs(text, stderr);
            break;
        default:
            if (g_verbose.load(std::memory_order_relaxed)) std::fputs(text, stderr);
            break;
    }
}

static void install_log_filter() {
    static std::once_flag once;
    std::call_once(once, [] { whisper_log_set(log_cb, nullptr); });
}

struct StateDeleter {
    void operator()(whisper_state* s) const { whisper_free_state(s); }
};

static std::string trim(const char* raw) {
    if (!raw) return {};
    std::string s(raw);
    auto a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

// "[BLANK_AUDIO]", "[ Silence ]", "(music)" and similar non-speech markers.
static bool is_non_speech(const std::string& s) {
    if (s.size() < 2) return false;
    return (s.front() == '[' && s.back() == ']') || (s.front() == '(' && s.back() == ')');
}

// Mean log probability of the segment's text tokens; special tokens excluded.
static double avg_logprob(whisper_context* ctx, whisper_state* state, int segment) {
    const whisper_token eot = whisper_token_eot(ctx);
    double sum = 0.0;
    int count = 0;
    int n = whisper_full_n_tokens_from_state(state, segment);
    for (int j = 0; j < n; ++j) {
        auto data = whisper_full_get_token_data_from_state(state, segment, j);
        if (data.id >= eot) continue;
        sum += data.plog;
        ++count;
    }
    return count > 0 ? sum / count : 0.0;
}

void WhisperModel::set_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
    install_log_filter();
}

WhisperModel::WhisperModel(whisper_context* ctx) : ctx_(ctx) {}

WhisperModel::~WhisperModel() {
    if (ctx_) whisper_free(ctx_);
}

Result<std::shared_ptr<WhisperModel>> WhisperModel::load(const std::string& path, const ResolvedConfig& cfg) {
    install_log_filter();

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = cfg.accelerated;
    if (cfg.accelerated) cparams.gpu_device = cfg.gpu_ordinal;

    whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx) {
        return fail(ErrorKind::OutOfResource,
                    std::format("could not allocate {} ({}) on {}", path, cfg.precision, cfg.device));
    }
    return std::shared_ptr<WhisperModel>(new WhisperModel(ctx));
}

Result<LocalTranscript>
WhisperModel::transcribe(std::span<const float> pcm, const InferenceOptions& opts) const {
    LocalTranscript out;
    if (pcm.empty()) return out;

    std::unique_ptr<whisper_state, StateDeleter> state(whisper_init_state(ctx_));
    if (!state) {
        return fail(ErrorKind::Inference, "could not allocate decoder state");
    }

    bool beam = opts.beam_size > 1;
    whisper_full_params wparams = whisper_full_default_params(
        beam ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY);
    if (beam) wparams.beam_search.beam_size = opts.beam_size;

    int threads = opts.threads > 0
        ? opts.threads
        : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    const int n_samples = static_cast<int>(pcm.size());

    const char* language = opts.language.c_str();
    if (opts.language == "auto" && !whisper_is_multilingual(ctx_)) {
        language = "en";
        out.language = language;
        out.language_probability = 1.0;
    } else if (opts.language == "auto") {
        if (whisper_pcm_to_mel_with_state(ctx_, state.get(), pcm.data(), n_samples, threads) != 0) {
            return fail(ErrorKind::Inference, "could not compute mel spectrogram");
        }
        std::vector<float> probs(static_cast<size_t>(whisper_lang_max_id()) + 1, 0.0f);
        int id = whisper_lang_auto_detect_with_state(ctx_, state.get(), 0, threads, probs.data());
        if (id < 0) {
            return fail(ErrorKind::Inference, std::format("language detection returned {}", id));
        }
        language = whisper_lang_str(id);
        out.language = language;
        out.language_probability = probs[static_cast<size_t>(id)];
    }

    wparams.n_threads        = threads;
    wparams.language         = language;
    wparams.detect_language  = false;
    wparams.translate        = false;
    wparams.no_context       = true;
    wparams.print_progress   = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.print_special    = false;

    int ret = whisper_full_with_state(ctx_, state.get(), wparams, pcm.data(), n_samples);
    if (ret != 0) {
        return fail(ErrorKind::Inference, std::format("whisper_full returned {}", ret));
    }

    int n = whisper_full_n_segments_from_state(state.get());
    out.segments.reserve(n);
    for (int i = 0; i < n; ++i) {
        auto text = trim(whisper_full_get_segment_text_from_state(state.get(), i));
        if (text.empty() || is_non_speech(text)) continue;

        // whisper timestamps are in 10 ms units
        LocalSegment seg{
            .start = whisper_full_get_segment_t0_from_state(state.get(), i) * 0.01,
            .end = whisper_full_get_segment_t1_from_state(state.get(), i) * 0.01,
            .text = std::move(text),
            .avg_logprob = avg_logprob(ctx_, state.get(), i),
            .no_speech_prob = whisper_full_get_segment_no_speech_prob_from_state(state.get(), i),
        };
        seg.compression_ratio = compression_ratio(seg.text);
        out.segments.push_back(std::move(seg));
    }
    return out;
}
