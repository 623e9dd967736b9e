#pragma once

#include "device_probe.hpp"

// Enumerates the compute devices registered with ggml.
class GgmlDeviceProbe : public DeviceProbe {
public:
    GgmlDeviceProbe();
    std::vector<DeviceInfo> available_devices() const override;
};
