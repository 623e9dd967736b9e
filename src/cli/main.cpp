#include "audio/ffmpeg_decoder.hpp"
#include "config.hpp"
#include "device/device_resolver.hpp"
#include "device/ggml_device_probe.hpp"
#include "job_runner.hpp"
#include "model/model_downloader.hpp"
#include "model/model_provider.hpp"
#include "model/whisper_model.hpp"
#include "model/whisper_provisioner.hpp"
#include "platform/platform_paths.hpp"
#include "platform/platform_signals.hpp"
#include "storage/history_db.hpp"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <format>
#include <optional>
#include <poll.h>
#include <print>
#include <signal.h>
#include <string>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <thread>
#include <unistd.h>

static constexpr int kExitFailure = 1;
static constexpr int kExitCancelled = 130;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} --input PATH [options]", prog);
    std::println(stderr, "       {} --list-devices", prog);
    std::println(stderr, "       {} --history [N]", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  -i, --input PATH       Media file to transcribe");
    std::println(stderr, "  -o, --outdir DIR       Output directory (default: output)");
    std::println(stderr, "  -m, --model NAME       tiny, base, small, medium, large-v3, ... (default: small)");
    std::println(stderr, "  -l, --language CODE    Language code, or auto (default: en)");
    std::println(stderr, "  -d, --device DEV       auto, cpu, cuda[:N], metal[:N], vulkan[:N] (default: auto)");
    std::println(stderr, "  -p, --precision P      f16, q8_0, q5_1, q5_0, q4_0 (default: per device)");
    std::println(stderr, "  -b, --beam-size N      Beam size, 1 = greedy (default: 5)");
    std::println(stderr, "      --no-vad           Fixed-length chunks, no silence snapping");
    std::println(stderr, "      --keep-wav         Keep the extracted 16 kHz WAV next to the outputs");
    std::println(stderr, "  -t, --threads N        Inference threads (default: all cores)");
    std::println(stderr, "  -c, --config PATH      Config file path");
    std::println(stderr, "  -v, --verbose          Enable verbose logging");
    std::println(stderr, "  -h, --help             Show this help");
}

static std::string format_memory(size_t bytes) {
    return std::format("{:.1f} GiB", static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
}

static int list_devices(const DeviceProbe& probe, const DeviceResolver& resolver) {
    for (const auto& d : probe.available_devices()) {
        if (d.accelerated()) {
            std::println("{:<10} {} ({} free of {})", d.id(), d.description,
                         format_memory(d.free_memory), format_memory(d.total_memory));
        } else {
            std::println("{:<10} {}", d.id(), d.description);
        }
    }
    auto resolved = resolver.resolve("auto", std::nullopt);
    if (!resolved) {
        std::println(stderr, "Error: {}", describe(resolved.error()));
        return kExitFailure;
    }
    std::println("auto -> {} ({})", resolved->device, resolved->precision);
    return 0;
}

static int show_history(HistoryDb& history, int limit) {
    if (!history.is_open()) {
        std::println(stderr, "History database is not available");
        return kExitFailure;
    }
    for (const auto& e : history.recent(limit)) {
        const auto& j = e.job;
        std::println("[{}] {} ({}, {} {}, {:.1f}s audio in {:.1f}s, {} segments)",
                     e.timestamp, j.input_path, j.model, j.device, j.precision,
                     j.audio_duration, j.processing_time, j.segment_count);
        if (!j.timestamps_path.empty()) std::println("  {}", j.timestamps_path);
        if (!j.json_path.empty()) std::println("  {}", j.json_path);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    // Before backend loading can start driver threads with the default mask.
    sigset_t mask = platform::block_termination_signals();

    bool verbose = false;
    bool want_list_devices = false;
    std::optional<int> history_limit;
    std::string config_path;
    std::string input;

    std::optional<std::string> outdir, model, language, device, precision;
    std::optional<int> beam_size, threads;
    bool no_vad = false;
    bool keep_wav = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](std::optional<std::string>& dst) {
            if (i + 1 < argc) dst = argv[++i];
        };

        if (arg == "--input" || arg == "-i") {
            if (i + 1 < argc) input = argv[++i];
        } else if (arg == "--outdir" || arg == "-o") {
            next(outdir);
        } else if (arg == "--model" || arg == "-m") {
            next(model);
        } else if (arg == "--language" || arg == "-l") {
            next(language);
        } else if (arg == "--device" || arg == "-d") {
            next(device);
        } else if (arg == "--precision" || arg == "-p") {
            next(precision);
        } else if (arg == "--beam-size" || arg == "-b") {
            if (i + 1 < argc) beam_size = std::atoi(argv[++i]);
        } else if (arg == "--threads" || arg == "-t") {
            if (i + 1 < argc) threads = std::atoi(argv[++i]);
        } else if (arg == "--no-vad") {
            no_vad = true;
        } else if (arg == "--keep-wav") {
            keep_wav = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--list-devices") {
            want_list_devices = true;
        } else if (arg == "--history") {
            history_limit = 10;
            if (i + 1 < argc && argv[i + 1][0] != '-') history_limit = std::atoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return kExitFailure;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    if (outdir) config.output.dir = *outdir;
    if (model) config.transcription.model = *model;
    if (language) config.transcription.language = *language;
    if (device) config.transcription.device = *device;
    if (precision) config.transcription.precision = *precision;
    if (beam_size) config.transcription.beam_size = *beam_size;
    if (threads) config.transcription.threads = *threads;
    if (no_vad) config.transcription.vad = false;
    if (keep_wav) config.output.keep_wav = true;

    if (config.transcription.beam_size < 1) {
        std::println(stderr, "Invalid beam size: {}", config.transcription.beam_size);
        return kExitFailure;
    }

    WhisperModel::set_verbose(verbose);

    GgmlDeviceProbe probe;
    DeviceResolver resolver(probe);

    if (want_list_devices) return list_devices(probe, resolver);

    HistoryDb history;
    auto data = platform::data_dir();
    auto db_path = (data.empty() ? platform::temp_dir() + "/transcriber" : data) + "/history.db";
    if (!history.open(db_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    if (history_limit) return show_history(history, *history_limit);

    if (input.empty()) {
        usage(argv[0]);
        return kExitFailure;
    }

    ModelDownloader downloader(config.models.base_url, verbose);
    WhisperProvisioner provisioner(config.models.resolved_dir(), downloader, probe, verbose);
    ModelProvider models(provisioner);
    FfmpegDecoder decoder(config.decoder.ffmpeg, config.decoder.sample_rate, platform::temp_dir());

    JobRunner runner(config, decoder, resolver, models, &history);
    auto job = runner.make_job(input);

    // SIGINT/SIGTERM are consumed through a signalfd; the job runs on a worker
    // and signals completion through an eventfd.
    int signal_fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    int done_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (signal_fd < 0 || done_fd < 0) {
        std::println(stderr, "signalfd/eventfd failed: {}", std::strerror(errno));
        return kExitFailure;
    }

    std::atomic<bool> cancel_requested{false};
    std::optional<Result<TranscriptResult>> outcome;

    JobHooks hooks{
        .progress = [](int done, int total) {
            std::println(stderr, "Chunk {}/{} done", done, total);
        },
        .cancelled = [&cancel_requested] {
            return cancel_requested.load(std::memory_order_acquire);
        },
        .log = [verbose](const std::string& msg) {
            if (verbose) std::println(stderr, "[transcriber] {}", msg);
        },
    };

    std::jthread worker([&] {
        outcome = runner.run(job, hooks);
        uint64_t one = 1;
        ::write(done_fd, &one, sizeof(one));
    });

    pollfd fds[2] = {
        {.fd = signal_fd, .events = POLLIN, .revents = 0},
        {.fd = done_fd, .events = POLLIN, .revents = 0},
    };
    for (;;) {
        int n = ::poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "poll error: {}", std::strerror(errno));
            cancel_requested.store(true, std::memory_order_release);
            break;
        }
        if (fds[0].revents & POLLIN) {
            signalfd_siginfo info;
            while (::read(signal_fd, &info, sizeof(info)) == sizeof(info)) {}
            if (!cancel_requested.exchange(true, std::memory_order_acq_rel)) {
                std::println(stderr, "Cancelling after the current chunk...");
            }
        }
        if (fds[1].revents & POLLIN) break;
    }

    worker.join();
    ::close(signal_fd);
    ::close(done_fd);

    if (!outcome) {
        std::println(stderr, "Error: job did not complete");
        return kExitFailure;
    }
    if (!*outcome) {
        const auto& err = outcome->error();
        std::println(stderr, "Error: {}", describe(err));
        return err.kind == ErrorKind::Cancelled ? kExitCancelled : kExitFailure;
    }

    const auto& result = outcome->value();
    auto paths = ResultWriter::paths_for(job.input_path, job.output_dir);
    std::println("{} segments, {:.1f}s ({} on {})", result.segments.size(), result.duration_s,
                 result.metadata.model, result.metadata.device);
    std::println("{}", paths.timestamps_txt);
    std::println("{}", paths.segments_json);
    return 0;
}
