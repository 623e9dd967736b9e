#pragma once

#include "device_probe.hpp"
#include "errors.hpp"
#include "job.hpp"

#include <optional>
#include <string>
#include <vector>

class DeviceResolver {
public:
    // Backends tried by "auto", most preferred first. "cpu" always terminates the chain.
    static const std::vector<std::string>& default_preference();

    explicit DeviceResolver(const DeviceProbe& probe,
                            std::vector<std::string> preference = default_preference());

    Result<ResolvedConfig> resolve(const std::string& requested_device,
                                   const std::optional<std::string>& requested_precision) const;

    static std::string default_precision(bool accelerated);

private:
    struct Candidate {
        std::string backend;
        std::optional<int> index;  // nullopt = first device of the backend
    };

    static std::optional<Candidate> parse(const std::string& device);
    static const DeviceInfo* match(const std::vector<DeviceInfo>& devices, const Candidate& c);

    const DeviceProbe& probe_;
    std::vector<std::string> preference_;
};
