#pragma once

#include "audio/media_decoder.hpp"
#include "config.hpp"
#include "device/device_resolver.hpp"
#include "errors.hpp"
#include "job.hpp"
#include "model/model_provider.hpp"
#include "output/result_writer.hpp"
#include "storage/history_db.hpp"

#include <functional>
#include <string>

struct JobHooks {
    // (completed chunks, total chunks), after each chunk.
    std::function<void(int, int)> progress;
    // Checked between chunks, never during one.
    std::function<bool()> cancelled;
    std::function<void(const std::string&)> log;
};

// Runs one job end to end: decode, resolve device, acquire model, transcribe,
// write outputs. A job that fails leaves none of its outputs behind; files
// from an earlier run of the same input may already have been replaced.
class JobRunner {
public:
    JobRunner(Config config, MediaDecoder& decoder, const DeviceResolver& resolver,
              ModelProvider& models, HistoryDb* history = nullptr);

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    // A job for input_path carrying the configured defaults.
    TranscriptionJob make_job(const std::string& input_path) const;

    Result<TranscriptResult> run(const TranscriptionJob& job, const JobHooks& hooks = {});

private:
    Result<void> keep_wav(const AudioStream& audio, const std::string& output_dir,
                          const std::string& path) const;
    void record(const TranscriptionJob& job, const TranscriptResult& result,
                const OutputPaths& paths, double processing_s);

    Config config_;
    MediaDecoder& decoder_;
    const DeviceResolver& resolver_;
    ModelProvider& models_;
    HistoryDb* history_;
    ResultWriter writer_;
};
