#include "device_probe.hpp"

std::string DeviceInfo::id() const {
    if (!accelerated()) return backend;
    return backend + ":" + std::to_string(index);
}
