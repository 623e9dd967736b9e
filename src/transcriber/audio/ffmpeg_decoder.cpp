#include "ffmpeg_decoder.hpp"

#include "audio/scoped_temp_dir.hpp"
#include "audio/wav_codec.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

static constexpr int kExecFailed = 127;
static constexpr size_t kMaxQuotedLog = 2000;

static bool is_executable_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

static std::string read_file_text(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return {};
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

static std::string tail(std::string s, size_t max) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    if (s.size() <= max) return s;
    return "..." + s.substr(s.size() - max);
}

FfmpegDecoder::FfmpegDecoder(std::string executable, uint32_t sample_rate, std::string temp_root)
    : executable_(std::move(executable)), sample_rate_(sample_rate),
      temp_root_(std::move(temp_root)) {}

std::string FfmpegDecoder::find_executable(const std::string& name) {
    if (name.empty()) return {};
    if (name.find('/') != std::string::npos) {
        return is_executable_file(name) ? name : std::string{};
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        auto candidate = fs::path(dir) / name;
        if (is_executable_file(candidate)) return candidate.string();
        start = end + 1;
    }
    return {};
}

Result<AudioStream> FfmpegDecoder::decode(const std::string& path, const DecodeOptions& opts) {
    auto exe = find_executable(executable_);
    if (exe.empty()) {
        return fail(ErrorKind::DecoderUnavailable,
                    std::format("'{}' not found or not executable. Install ffmpeg "
                                "(e.g. `sudo apt-get install ffmpeg`) and make sure it is on PATH",
                                executable_));
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return fail(ErrorKind::UnsupportedMedia, std::format("cannot read input file {}", path));
    }

    // Scratch files live only as long as this scope.
    ScopedTempDir scratch(temp_root_, "transcriber-");
    if (!scratch.valid()) {
        return fail(ErrorKind::OutputWrite,
                    std::format("could not create a temporary directory under {}", temp_root_));
    }
    auto wav_path = scratch.file("audio.wav");
    auto log_path = scratch.file("ffmpeg.log");

    std::vector<std::string> args = {
        exe, "-nostdin", "-hide_banner", "-loglevel", "error", "-y",
        "-i", path,
        "-vn",
        "-ac", "1",
        "-ar", std::to_string(sample_rate_),
        "-c:a", "pcm_s16le",
        wav_path,
    };
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return fail(ErrorKind::DecoderUnavailable,
                    std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: own process group so a terminal ^C reaches only us, default
        // signal mask, stderr to the log file, no stdin/stdout
        ::setpgid(0, 0);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        int devnull = ::open("/dev/null", O_RDWR);
        int logfd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
        }
        if (logfd >= 0) ::dup2(logfd, STDERR_FILENO);
        ::execv(argv[0], argv.data());
        ::_exit(kExecFailed);
    }

    int status = 0;
    for (;;) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            return fail(ErrorKind::DecoderUnavailable,
                        std::string("waitpid() failed: ") + std::strerror(errno));
        }
        if (opts.cancelled && opts.cancelled()) {
            ::kill(pid, SIGTERM);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return fail(ErrorKind::Cancelled, "cancelled during audio extraction");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == kExecFailed) {
        return fail(ErrorKind::DecoderUnavailable, std::format("could not execute {}", exe));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        if (opts.cancelled && opts.cancelled()) {
            return fail(ErrorKind::Cancelled, "cancelled during audio extraction");
        }
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -WTERMSIG(status);
        return fail(ErrorKind::UnsupportedMedia,
                    std::format("ffmpeg failed to extract audio from {} (exit {}):\n{}",
                                path, code, tail(read_file_text(log_path), kMaxQuotedLog)));
    }

    std::ifstream in(wav_path, std::ios::binary);
    if (!in.is_open()) {
        return fail(ErrorKind::UnsupportedMedia,
                    std::format("ffmpeg produced no audio for {}", path));
    }
    std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    in.close();

    auto decoded = wav::decode(bytes);
    if (!decoded) {
        return fail(ErrorKind::UnsupportedMedia,
                    std::format("unreadable decoder output for {}: {}", path, decoded.error()));
    }
    if (decoded->sample_rate != sample_rate_) {
        return fail(ErrorKind::DecoderUnavailable,
                    std::format("decoder produced {} Hz, expected {} Hz",
                                decoded->sample_rate, sample_rate_));
    }

    return AudioStream{
        .samples = std::move(decoded->samples),
        .sample_rate = sample_rate_,
    };
}
