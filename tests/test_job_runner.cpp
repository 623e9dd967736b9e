#include <catch2/catch_test_macros.hpp>

#include "audio/ffmpeg_decoder.hpp"
#include "audio/wav_codec.hpp"
#include "job_runner.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace testing_support;
namespace fs = std::filesystem;

namespace {

// Hears one utterance spanning whatever it is given; "auto" hears German.
class SpanModel : public SpeechModel {
public:
    Result<LocalTranscript>
    transcribe(std::span<const float> pcm, const InferenceOptions& opts) const override {
        LocalTranscript out;
        if (opts.language == "auto") {
            out.language = "de";
            out.language_probability = 0.93;
        }
        if (pcm.empty()) return out;
        double len = static_cast<double>(pcm.size()) / 16000.0;
        out.segments.push_back(LocalSegment{
            .start = 0.0, .end = len, .text = "speech",
            .avg_logprob = -0.25, .no_speech_prob = 0.01, .compression_ratio = 1.5,
        });
        return out;
    }
};

struct Fixture {
    TmpDir dir;
    TmpDir temp_root;
    std::string input;
    std::string out_dir;

    FakeProbe probe;
    FakeProvisioner provisioner;
    HistoryDb history;

    Fixture(double seconds) {
        auto wav_path = dir.file("fixture.wav");
        write_bytes(wav_path, wav::encode(tone(seconds, 16000), 16000));
        input = dir.file("interview.mov");
        write_file(input, "container bytes");
        out_dir = dir.file("out");

        probe.devices = {FakeProbe::cpu()};
        provisioner.impl = [](const std::string&, const ResolvedConfig&) -> Result<ModelHandle> {
            return std::make_shared<SpanModel>();
        };
        history.open(dir.file("history.db"));
    }

    Config config() const {
        Config cfg;
        cfg.engine.chunk_seconds = 15.0;
        cfg.engine.overlap_seconds = 2.0;
        cfg.output.dir = out_dir;
        return cfg;
    }

    std::string decoder_script() const { return copying_decoder(dir, dir.file("fixture.wav")); }

    bool outputs_absent() const {
        std::error_code ec;
        return !fs::exists(out_dir, ec) || fs::is_empty(out_dir, ec);
    }
};

} // namespace

TEST_CASE("JobRunner", "[job]") {

    SECTION("WritesOutputsAndRecordsHistory") {
        Fixture fx(65.0);
        FfmpegDecoder decoder(fx.decoder_script(), 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models, &fx.history);

        auto job = runner.make_job(fx.input);
        job.vad = false;
        job.keep_wav = true;

        std::vector<int> completed;
        auto result = runner.run(job, JobHooks{
            .progress = [&](int done, int total) {
                completed.push_back(done);
                REQUIRE(total == 5);
            },
        });

        REQUIRE(result.has_value());
        REQUIRE(completed == std::vector<int>{1, 2, 3, 4, 5});
        REQUIRE(result->duration_s == 65.0);
        REQUIRE(is_well_ordered(result->segments, 65.0));
        REQUIRE(result->segments.front().start == 0.0);
        REQUIRE(result->segments.back().end == 65.0);
        REQUIRE(result->metadata.device == "cpu");
        REQUIRE(result->metadata.precision == "q8_0");
        REQUIRE(result->metadata.model == "small");
        REQUIRE_FALSE(result->metadata.vad);

        auto paths = ResultWriter::paths_for(fx.input, fx.out_dir);
        REQUIRE(paths.timestamps_txt == fx.out_dir + "/interview.timestamps.txt");
        REQUIRE(fs::exists(paths.timestamps_txt));
        REQUIRE(fs::exists(paths.segments_json));

        auto doc = nlohmann::json::parse(read_file(paths.segments_json));
        REQUIRE(doc["metadata"]["device"] == "cpu");
        REQUIRE(doc["segments"].size() == result->segments.size());

        auto kept = read_file(paths.wav);
        auto decoded = wav::decode(std::vector<uint8_t>(kept.begin(), kept.end()));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->samples.size() == 65 * 16000);

        auto entries = fx.history.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].job.input_path == fx.input);
        REQUIRE(entries[0].job.segment_count == static_cast<int>(result->segments.size()));

        REQUIRE(fx.temp_root.entry_count() == 0);
    }

    SECTION("RerunIsByteIdentical") {
        Fixture fx(20.0);
        FfmpegDecoder decoder(fx.decoder_script(), 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models);

        auto job = runner.make_job(fx.input);
        REQUIRE(runner.run(job).has_value());
        auto paths = ResultWriter::paths_for(fx.input, fx.out_dir);
        auto txt = read_file(paths.timestamps_txt);
        auto json = read_file(paths.segments_json);

        REQUIRE(runner.run(job).has_value());
        REQUIRE(read_file(paths.timestamps_txt) == txt);
        REQUIRE(read_file(paths.segments_json) == json);
        // Second job reused the cached model.
        REQUIRE(fx.provisioner.calls.load() == 1);
    }

    SECTION("CancelAfterSecondChunk") {
        Fixture fx(65.0);
        FfmpegDecoder decoder(fx.decoder_script(), 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models, &fx.history);

        auto job = runner.make_job(fx.input);
        job.vad = false;
        job.keep_wav = true;

        int done_chunks = 0;
        auto result = runner.run(job, JobHooks{
            .progress = [&](int done, int) { done_chunks = done; },
            .cancelled = [&] { return done_chunks >= 2; },
        });

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Cancelled);
        REQUIRE(done_chunks == 2);
        REQUIRE(fx.outputs_absent());
        REQUIRE(fx.temp_root.entry_count() == 0);
        REQUIRE(fx.history.recent().empty());
    }

    SECTION("CancelledBeforeStart") {
        Fixture fx(5.0);
        FfmpegDecoder decoder(fx.decoder_script(), 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models);

        auto result = runner.run(runner.make_job(fx.input), JobHooks{.cancelled = [] { return true; }});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Cancelled);
        REQUIRE(fx.provisioner.calls.load() == 0);
        REQUIRE(fx.outputs_absent());
    }

    SECTION("ZeroDurationSucceeds") {
        Fixture fx(0.0);
        FfmpegDecoder decoder(fx.decoder_script(), 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models);

        auto result = runner.run(runner.make_job(fx.input));
        REQUIRE(result.has_value());
        REQUIRE(result->segments.empty());
        REQUIRE(result->duration_s == 0.0);

        auto paths = ResultWriter::paths_for(fx.input, fx.out_dir);
        REQUIRE(fs::exists(paths.timestamps_txt));
        REQUIRE(read_file(paths.timestamps_txt).empty());
    }

    SECTION("ExplicitUnavailableDevice") {
        Fixture fx(5.0);
        FfmpegDecoder decoder(fx.decoder_script(), 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models);

        auto job = runner.make_job(fx.input);
        job.device = "cuda:0";
        auto result = runner.run(job);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::DeviceUnavailable);
        REQUIRE(fx.provisioner.calls.load() == 0);
        REQUIRE(fx.outputs_absent());
    }

    SECTION("DecoderFailurePropagates") {
        Fixture fx(5.0);
        auto script = write_script(fx.dir.file("failing-ffmpeg"), "echo 'moov atom not found' >&2\nexit 1");
        FfmpegDecoder decoder(script, 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models);

        auto result = runner.run(runner.make_job(fx.input));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::UnsupportedMedia);
        REQUIRE(fx.outputs_absent());
    }

    SECTION("ModelFailurePropagates") {
        Fixture fx(5.0);
        fx.provisioner.impl = [](const std::string& name, const ResolvedConfig&) -> Result<ModelHandle> {
            return fail(ErrorKind::ModelUnavailable, "unknown model '" + name + "'");
        };
        FfmpegDecoder decoder(fx.decoder_script(), 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models);

        auto job = runner.make_job(fx.input);
        job.model = "gigantic";
        auto result = runner.run(job);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::ModelUnavailable);
        REQUIRE(fx.outputs_absent());
        REQUIRE(fx.temp_root.entry_count() == 0);
    }

    SECTION("AutoLanguageRecordsDetected") {
        Fixture fx(20.0);
        FfmpegDecoder decoder(fx.decoder_script(), 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models, &fx.history);

        auto job = runner.make_job(fx.input);
        job.language = "auto";
        auto result = runner.run(job);
        REQUIRE(result.has_value());
        REQUIRE(result->metadata.language == "de");

        auto doc = nlohmann::json::parse(read_file(ResultWriter::paths_for(fx.input, fx.out_dir).segments_json));
        REQUIRE(doc["metadata"]["language"] == "de");
        REQUIRE(doc["info"]["language"] == "de");
        REQUIRE(doc["info"]["language_probability"] == 0.93);
        REQUIRE(doc["segments"][0]["avg_logprob"] == -0.25);
        REQUIRE(doc["segments"][0]["no_speech_prob"] == 0.01);
        REQUIRE(doc["segments"][0]["compression_ratio"] == 1.5);

        REQUIRE(fx.history.recent(1).at(0).job.language == "de");
    }

    SECTION("DefaultPrecisionFollowsPublishedFiles") {
        Fixture fx(5.0);
        std::vector<std::string> requested;
        fx.provisioner.impl = [&](const std::string&, const ResolvedConfig& cfg) -> Result<ModelHandle> {
            requested.push_back(cfg.precision);
            return std::make_shared<SpanModel>();
        };
        FfmpegDecoder decoder(fx.decoder_script(), 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models);

        auto job = runner.make_job(fx.input);
        job.model = "large-v3";
        auto result = runner.run(job);
        REQUIRE(result.has_value());
        REQUIRE(result->metadata.precision == "q5_0");

        // An explicit choice is passed through untouched.
        job.precision = "q8_0";
        REQUIRE(runner.run(job).has_value());
        REQUIRE(requested == std::vector<std::string>{"q5_0", "q8_0"});
    }

    SECTION("KeptWavFailureWritesNoTranscripts") {
        Fixture fx(5.0);
        fs::create_directories(fx.out_dir + "/interview.wav");
        FfmpegDecoder decoder(fx.decoder_script(), 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models, &fx.history);

        auto job = runner.make_job(fx.input);
        job.keep_wav = true;
        auto result = runner.run(job);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::OutputWrite);

        auto paths = ResultWriter::paths_for(fx.input, fx.out_dir);
        REQUIRE_FALSE(fs::exists(paths.timestamps_txt));
        REQUIRE_FALSE(fs::exists(paths.segments_json));
        REQUIRE(fs::is_directory(paths.wav));
        REQUIRE(fx.history.recent().empty());
    }

    SECTION("TranscriptFailureRemovesKeptWav") {
        Fixture fx(5.0);
        fs::create_directories(fx.out_dir + "/interview.timestamps.txt");
        FfmpegDecoder decoder(fx.decoder_script(), 16000, fx.temp_root.path);
        DeviceResolver resolver(fx.probe);
        ModelProvider models(fx.provisioner);
        JobRunner runner(fx.config(), decoder, resolver, models);

        auto job = runner.make_job(fx.input);
        job.keep_wav = true;
        auto result = runner.run(job);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::OutputWrite);

        auto paths = ResultWriter::paths_for(fx.input, fx.out_dir);
        REQUIRE_FALSE(fs::exists(paths.wav));
        REQUIRE_FALSE(fs::exists(paths.segments_json));
        // Only the blocking directory remains.
        size_t entries = 0;
        for ([[maybe_unused]] auto& e : fs::directory_iterator(fx.out_dir)) ++entries;
        REQUIRE(entries == 1);
    }
}
