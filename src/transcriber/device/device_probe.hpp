#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct DeviceInfo {
    std::string backend;      // "cuda", "metal", "vulkan", "cpu", ...
    int index = 0;            // position among devices of the same backend
    int gpu_ordinal = -1;     // position among all GPU devices, -1 for cpu
    std::string description;
    size_t free_memory = 0;
    size_t total_memory = 0;

    bool accelerated() const { return gpu_ordinal >= 0; }
    std::string id() const;   // "cpu" or "<backend>:<index>"
};

class DeviceProbe {
public:
    virtual ~DeviceProbe() = default;
    // Devices that reported themselves usable, in enumeration order.
    virtual std::vector<DeviceInfo> available_devices() const = 0;
};
