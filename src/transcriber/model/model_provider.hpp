#pragma once

#include "model_provisioner.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>

// Cache of loaded models keyed by (name, device, precision). One instance is
// shared by every job in the process.
class ModelProvider {
public:
    explicit ModelProvider(ModelProvisioner& provisioner);

    ModelProvider(const ModelProvider&) = delete;
    ModelProvider& operator=(const ModelProvider&) = delete;

    // Concurrent callers with the same key wait for a single provisioning
    // call; failures are not cached.
    Result<ModelHandle> acquire(const std::string& name, const ResolvedConfig& cfg);

    size_t cached_count() const;
    void clear();

private:
    using Key = std::tuple<std::string, std::string, std::string>;

    struct Slot {
        std::mutex mutex;
        ModelHandle handle;
    };

    ModelProvisioner& provisioner_;
    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<Slot>> slots_;
};
