#include "job_runner.hpp"

#include "audio/wav_codec.hpp"
#include "engine/transcription_engine.hpp"
#include "model/model_catalog.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <format>
#include <print>
#include <unistd.h>
#include <vector>

JobRunner::JobRunner(Config config, MediaDecoder& decoder, const DeviceResolver& resolver,
                     ModelProvider& models, HistoryDb* history)
    : config_(std::move(config)), decoder_(decoder), resolver_(resolver),
      models_(models), history_(history) {}

TranscriptionJob JobRunner::make_job(const std::string& input_path) const {
    const auto& t = config_.transcription;
    TranscriptionJob job{
        .input_path = input_path,
        .model = t.model,
        .language = t.language,
        .device = t.device,
        .precision = std::nullopt,
        .output_dir = config_.output.dir,
        .beam_size = t.beam_size,
        .vad = t.vad,
        .keep_wav = config_.output.keep_wav,
    };
    if (!t.precision.empty()) job.precision = t.precision;
    return job;
}

Result<TranscriptResult> JobRunner::run(const TranscriptionJob& job, const JobHooks& hooks) {
    auto log = [&](const std::string& msg) {
        if (hooks.log) hooks.log(msg);
    };
    auto cancelled = [&] { return hooks.cancelled && hooks.cancelled(); };

    auto started = std::chrono::steady_clock::now();
    log("Input: " + job.input_path);

    if (cancelled()) return fail(ErrorKind::Cancelled, "cancelled before start");

    // Resolved before decoding so a bad device fails fast.
    auto resolved = resolver_.resolve(job.device, job.precision);
    if (!resolved) return std::unexpected(resolved.error());
    if (!job.precision || job.precision->empty()) {
        // A device default the mirror lacks for this model gives way to a published one.
        resolved->precision = catalog::closest_published(job.model, resolved->precision);
    }
    log(std::format("Device: {} ({})", resolved->device, resolved->precision));

    log("Extracting audio...");
    auto audio = decoder_.decode(job.input_path, DecodeOptions{.cancelled = hooks.cancelled});
    if (!audio) return std::unexpected(audio.error());
    log(std::format("Audio: {:.2f}s at {} Hz", audio->duration(), audio->sample_rate));

    if (cancelled()) return fail(ErrorKind::Cancelled, "cancelled after decoding");

    auto model = models_.acquire(job.model, *resolved);
    if (!model) return std::unexpected(model.error());

    ChunkingOptions chunking{
        .chunk_seconds = config_.engine.chunk_seconds,
        .overlap_seconds = config_.engine.overlap_seconds,
        .vad = job.vad,
        .vad_search_seconds = config_.engine.vad_search_seconds,
        .silence_threshold = config_.engine.silence_threshold,
    };
    InferenceOptions inference{
        .language = job.language,
        .beam_size = job.beam_size,
        .threads = config_.transcription.threads,
    };

    log("Transcribing...");
    TranscriptionEngine engine(chunking, inference);
    auto result = engine.transcribe(*audio, **model, EngineHooks{
        .progress = hooks.progress,
        .cancelled = hooks.cancelled,
        .log = hooks.log,
    });
    if (!result) return std::unexpected(result.error());

    if (cancelled()) return fail(ErrorKind::Cancelled, "cancelled before writing outputs");

    result->metadata = TranscriptMetadata{
        .model = job.model,
        .language = result->detected_language.empty() ? job.language : result->detected_language,
        .device = resolved->device,
        .precision = resolved->precision,
        .beam_size = job.beam_size,
        .vad = job.vad,
    };

    log("Writing outputs...");
    auto planned = ResultWriter::paths_for(job.input_path, job.output_dir);
    if (job.keep_wav) {
        if (auto kept = keep_wav(*audio, job.output_dir, planned.wav); !kept) {
            return std::unexpected(kept.error());
        }
    }

    auto paths = writer_.write(*result, job.input_path, job.output_dir);
    if (!paths) {
        if (job.keep_wav) ::unlink(planned.wav.c_str());
        return std::unexpected(paths.error());
    }

    double processing_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    record(job, *result, *paths, processing_s);

    log(std::format("Done. {} segments, {:.1f}s audio in {:.1f}s", result->segments.size(),
                    result->duration_s, processing_s));
    log("  " + paths->timestamps_txt);
    log("  " + paths->segments_json);
    return result;
}

Result<void> JobRunner::keep_wav(const AudioStream& audio, const std::string& output_dir,
                                 const std::string& path) const {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        return fail(ErrorKind::OutputWrite,
                    std::format("cannot create output directory {}: {}", output_dir, ec.message()));
    }

    std::vector<int16_t> pcm(audio.samples.size());
    std::transform(audio.samples.begin(), audio.samples.end(), pcm.begin(), [](float s) {
        float clamped = std::clamp(s, -1.0f, 1.0f);
        return static_cast<int16_t>(std::lround(clamped * 32767.0f));
    });
    auto bytes = wav::encode(pcm, audio.sample_rate);
    return ResultWriter::write_atomically(
        path, std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

void JobRunner::record(const TranscriptionJob& job, const TranscriptResult& result,
                       const OutputPaths& paths, double processing_s) {
    if (!history_ || !history_->is_open()) return;

    bool ok = history_->insert(JobRecord{
        .input_path = job.input_path,
        .model = job.model,
        .language = result.metadata.language,
        .device = result.metadata.device,
        .precision = result.metadata.precision,
        .audio_duration = result.duration_s,
        .processing_time = processing_s,
        .segment_count = static_cast<int>(result.segments.size()),
        .timestamps_path = paths.timestamps_txt,
        .json_path = paths.segments_json,
        .text = result.text,
    });
    if (!ok) {
        std::println(stderr, "Warning: job not recorded in history");
    }
}
