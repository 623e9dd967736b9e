#include "whisper_provisioner.hpp"

#include "model_catalog.hpp"
#include "whisper_model.hpp"

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

// "ggml" read as a little-endian uint32
static constexpr uint32_t kGgmlMagic = 0x67676d6c;

WhisperProvisioner::WhisperProvisioner(std::string models_dir, ModelDownloader& downloader,
                                       const DeviceProbe& probe, bool verbose)
    : models_dir_(std::move(models_dir)), downloader_(downloader),
      probe_(probe), verbose_(verbose) {}

Result<std::string> WhisperProvisioner::locate(const std::string& name, const std::string& precision) {
    if (!catalog::is_known_model(name)) {
        return fail(ErrorKind::ModelUnavailable, std::format("unknown model '{}'", name));
    }
    if (!catalog::is_known_precision(precision)) {
        return fail(ErrorKind::ModelUnavailable,
                    std::format("unknown precision '{}' for model '{}'", precision, name));
    }

    auto file = catalog::file_name(name, precision);
    auto path = (fs::path(models_dir_) / file).string();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (!catalog::is_published(name, precision)) {
            return fail(ErrorKind::ModelUnavailable,
                        std::format("{} is not published for download; place it at {}", file, path));
        }
        log(std::format("Model {} not cached, downloading to {}", file, models_dir_));
        auto res = downloader_.fetch(file, path);
        if (!res) {
            return fail(ErrorKind::ModelDownload,
                        std::format("could not fetch {}: {}", file, res.error()));
        }
    }

    std::ifstream f(path, std::ios::binary);
    uint32_t magic = 0;
    if (!f.read(reinterpret_cast<char*>(&magic), sizeof(magic)) || magic != kGgmlMagic) {
        return fail(ErrorKind::ModelUnavailable,
                    std::format("{} is not a ggml model file (delete it to download again)", path));
    }
    return path;
}

Result<void> WhisperProvisioner::check_device_memory(const std::string& path,
                                                     const ResolvedConfig& cfg) const {
    if (!cfg.accelerated) return {};

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return {};

    for (const auto& dev : probe_.available_devices()) {
        if (dev.id() != cfg.device) continue;
        // Devices that cannot report memory say 0.
        if (dev.free_memory > 0 && size > dev.free_memory) {
            return fail(ErrorKind::OutOfResource,
                        std::format("{} needs {} MiB but {} has {} MiB free",
                                    fs::path(path).filename().string(), size >> 20,
                                    cfg.device, dev.free_memory >> 20));
        }
        break;
    }
    return {};
}

Result<ModelHandle> WhisperProvisioner::provision(const std::string& name, const ResolvedConfig& cfg) {
    auto path = locate(name, cfg.precision);
    if (!path) return std::unexpected(path.error());

    if (auto mem = check_device_memory(*path, cfg); !mem) {
        return std::unexpected(mem.error());
    }

    log(std::format("Loading {} on {}", *path, cfg.device));
    auto model = WhisperModel::load(*path, cfg);
    if (!model) return std::unexpected(model.error());
    return ModelHandle(std::move(*model));
}

void WhisperProvisioner::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[transcriber] {}", msg);
    }
}
