#include "result_writer.hpp"

#include "filename.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

static double round_ms(double seconds) {
    return std::round(seconds * 1000.0) / 1000.0;
}

// Model scores keep four decimals.
static double round_score(double v) {
    return std::round(v * 10000.0) / 10000.0;
}

std::string format_timestamp(double seconds) {
    if (seconds < 0.0) seconds = 0.0;
    auto total_ms = static_cast<int64_t>(std::llround(seconds * 1000.0));
    int64_t ms = total_ms % 1000;
    int64_t total_s = total_ms / 1000;
    int64_t s = total_s % 60;
    int64_t total_m = total_s / 60;
    int64_t m = total_m % 60;
    int64_t h = total_m / 60;
    return std::format("{:02}:{:02}:{:02}.{:03}", h, m, s, ms);
}

OutputPaths ResultWriter::paths_for(const std::string& input_path, const std::string& output_dir) {
    auto base = sanitize_filename_component(fs::path(input_path).stem().string());
    auto dir = fs::path(output_dir);
    return OutputPaths{
        .timestamps_txt = (dir / (base + ".timestamps.txt")).string(),
        .segments_json = (dir / (base + ".segments.json")).string(),
        .wav = (dir / (base + ".wav")).string(),
    };
}

std::string ResultWriter::render_timestamps(const TranscriptResult& result) {
    std::string out;
    for (const auto& s : result.segments) {
        if (s.text.empty()) continue;
        out += std::format("[{} → {}] {}\n", format_timestamp(s.start), format_timestamp(s.end), s.text);
    }
    return out;
}

std::string ResultWriter::render_json(const TranscriptResult& result) {
    const auto& md = result.metadata;
    json j = {
        {"metadata", {
            {"model", md.model},
            {"language", md.language},
            {"device", md.device},
            {"precision", md.precision},
            {"beam_size", md.beam_size},
            {"vad", md.vad},
        }},
        {"info", {
            {"language", md.language},
            // A language given by the caller is certain.
            {"language_probability",
             result.detected_language.empty() ? 1.0 : round_score(result.language_probability)},
        }},
        {"duration", round_ms(result.duration_s)},
        {"text", result.text},
        {"segments", json::array()},
    };
    for (const auto& s : result.segments) {
        if (s.text.empty()) continue;
        j["segments"].push_back({
            {"index", s.index},
            {"start", round_ms(s.start)},
            {"end", round_ms(s.end)},
            {"text", s.text},
            {"avg_logprob", round_score(s.avg_logprob)},
            {"no_speech_prob", round_score(s.no_speech_prob)},
            {"compression_ratio", round_score(s.compression_ratio)},
        });
    }
    // Invalid UTF-8 from the model is replaced rather than aborting the dump.
    return j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

Result<void> ResultWriter::write_atomically(const std::string& path, std::string_view content) {
    auto target = fs::path(path);
    std::string tmpl = (target.parent_path() / ("." + target.filename().string() + ".XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        return fail(ErrorKind::OutputWrite,
                    std::format("cannot create temporary file for {}: {}", path, std::strerror(errno)));
    }
    std::string tmp_path(buf.data());

    auto abort_with = [&](const std::string& what) {
        int err = errno;
        ::close(fd);
        ::unlink(tmp_path.c_str());
        return fail(ErrorKind::OutputWrite, std::format("{} {}: {}", what, path, std::strerror(err)));
    };

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return abort_with("write() failed for");
        }
        written += static_cast<size_t>(n);
    }

    ::fchmod(fd, 0644);
    if (::fsync(fd) < 0) return abort_with("fsync() failed for");

    if (::close(fd) < 0) {
        int err = errno;
        ::unlink(tmp_path.c_str());
        return fail(ErrorKind::OutputWrite, std::format("close() failed for {}: {}", path, std::strerror(err)));
    }

    if (::rename(tmp_path.c_str(), path.c_str()) < 0) {
        int err = errno;
        ::unlink(tmp_path.c_str());
        return fail(ErrorKind::OutputWrite, std::format("rename() to {} failed: {}", path, std::strerror(err)));
    }
    return {};
}

Result<OutputPaths> ResultWriter::write(const TranscriptResult& result, const std::string& input_path,
                                        const std::string& output_dir) const {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        return fail(ErrorKind::OutputWrite,
                    std::format("cannot create output directory {}: {}", output_dir, ec.message()));
    }

    auto paths = paths_for(input_path, output_dir);

    if (auto r = write_atomically(paths.segments_json, render_json(result)); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = write_atomically(paths.timestamps_txt, render_timestamps(result)); !r) {
        ::unlink(paths.segments_json.c_str());
        return std::unexpected(r.error());
    }
    return paths;
}
