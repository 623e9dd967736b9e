#include "ggml_device_probe.hpp"

#include <algorithm>
#include <cctype>
#include <ggml-backend.h>
#include <map>
#include <mutex>

GgmlDeviceProbe::GgmlDeviceProbe() {
    // Dynamic backends (CUDA, Vulkan, ...) must be loaded before enumeration.
    static std::once_flag loaded;
    std::call_once(loaded, [] { ggml_backend_load_all(); });
}

std::vector<DeviceInfo> GgmlDeviceProbe::available_devices() const {
    std::vector<DeviceInfo> devices;
    std::map<std::string, int> per_backend;
    int gpu_ordinal = 0;
    bool have_cpu = false;

    for (size_t i = 0; i < ggml_backend_dev_count(); ++i) {
        ggml_backend_dev_t dev = ggml_backend_dev_get(i);
        auto type = ggml_backend_dev_type(dev);

        if (type == GGML_BACKEND_DEVICE_TYPE_CPU) {
            if (have_cpu) continue;
            have_cpu = true;
            DeviceInfo info{.backend = "cpu", .index = 0, .gpu_ordinal = -1,
                            .description = ggml_backend_dev_description(dev)};
            ggml_backend_dev_memory(dev, &info.free_memory, &info.total_memory);
            devices.push_back(std::move(info));
            continue;
        }
        if (type != GGML_BACKEND_DEVICE_TYPE_GPU) continue;

        std::string backend = ggml_backend_reg_name(ggml_backend_dev_backend_reg(dev));
        std::transform(backend.begin(), backend.end(), backend.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

        DeviceInfo info{.backend = backend, .index = per_backend[backend]++,
                        .gpu_ordinal = gpu_ordinal++,
                        .description = ggml_backend_dev_description(dev)};
        ggml_backend_dev_memory(dev, &info.free_memory, &info.total_memory);
        devices.push_back(std::move(info));
    }

    if (!have_cpu) {
        devices.push_back(DeviceInfo{.backend = "cpu", .description = "CPU"});
    }
    return devices;
}
