#pragma once

#include "device/device_probe.hpp"
#include "model_downloader.hpp"
#include "model_provisioner.hpp"

#include <string>

class WhisperProvisioner : public ModelProvisioner {
public:
    WhisperProvisioner(std::string models_dir, ModelDownloader& downloader,
                       const DeviceProbe& probe, bool verbose = false);

    Result<ModelHandle> provision(const std::string& name, const ResolvedConfig& cfg) override;

    // Validates the name/precision, downloads the file if missing and checks
    // that it is a ggml model. Returns the local path.
    Result<std::string> locate(const std::string& name, const std::string& precision);

private:
    Result<void> check_device_memory(const std::string& path, const ResolvedConfig& cfg) const;
    void log(const std::string& msg) const;

    std::string models_dir_;
    ModelDownloader& downloader_;
    const DeviceProbe& probe_;
    bool verbose_;
};
