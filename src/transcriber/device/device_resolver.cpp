#include "device_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

const std::vector<std::string>& DeviceResolver::default_preference() {
    static const std::vector<std::string> order = {"cuda", "metal", "vulkan", "cpu"};
    return order;
}

DeviceResolver::DeviceResolver(const DeviceProbe& probe, std::vector<std::string> preference)
    : probe_(probe), preference_(std::move(preference)) {
    std::erase(preference_, "cpu");
    preference_.push_back("cpu");
}

std::string DeviceResolver::default_precision(bool accelerated) {
    return accelerated ? "f16" : "q8_0";
}

std::optional<DeviceResolver::Candidate> DeviceResolver::parse(const std::string& device) {
    std::string lower = device;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    auto colon = lower.find(':');
    if (colon == std::string::npos) {
        if (lower.empty()) return std::nullopt;
        return Candidate{.backend = lower, .index = std::nullopt};
    }

    int index = 0;
    auto digits = std::string_view(lower).substr(colon + 1);
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || index < 0 || colon == 0) {
        return std::nullopt;
    }
    return Candidate{.backend = lower.substr(0, colon), .index = index};
}

const DeviceInfo* DeviceResolver::match(const std::vector<DeviceInfo>& devices, const Candidate& c) {
    for (const auto& d : devices) {
        if (d.backend != c.backend) continue;
        if (c.index && d.index != *c.index) continue;
        return &d;
    }
    return nullptr;
}

Result<ResolvedConfig> DeviceResolver::resolve(
    const std::string& requested_device,
    const std::optional<std::string>& requested_precision) const {

    auto devices = probe_.available_devices();

    auto finish = [&](bool accelerated, std::string id, int gpu_ordinal) {
        ResolvedConfig cfg;
        cfg.device = std::move(id);
        cfg.accelerated = accelerated;
        cfg.gpu_ordinal = gpu_ordinal;
        cfg.precision = requested_precision && !requested_precision->empty()
            ? *requested_precision
            : default_precision(accelerated);
        return cfg;
    };

    if (requested_device.empty() || requested_device == "auto") {
        for (const auto& backend : preference_) {
            if (backend == "cpu") break;
            if (auto* d = match(devices, Candidate{.backend = backend})) {
                return finish(true, d->id(), d->gpu_ordinal);
            }
        }
        // The general-purpose processor is always usable.
        return finish(false, "cpu", -1);
    }

    auto candidate = parse(requested_device);
    if (!candidate) {
        return fail(ErrorKind::DeviceUnavailable,
                    std::format("invalid device '{}' (expected auto, cpu or <backend>[:N])",
                                requested_device));
    }

    if (candidate->backend == "cpu") {
        if (candidate->index.value_or(0) != 0) {
            return fail(ErrorKind::DeviceUnavailable,
                        std::format("device '{}' is not available", requested_device));
        }
        return finish(false, "cpu", -1);
    }

    auto* d = match(devices, *candidate);
    if (!d) {
        return fail(ErrorKind::DeviceUnavailable,
                    std::format("device '{}' is not available on this machine", requested_device));
    }
    return finish(true, d->id(), d->gpu_ordinal);
}
