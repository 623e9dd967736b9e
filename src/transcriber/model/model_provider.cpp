#include "model_provider.hpp"

ModelProvider::ModelProvider(ModelProvisioner& provisioner)
    : provisioner_(provisioner) {}

Result<ModelHandle> ModelProvider::acquire(const std::string& name, const ResolvedConfig& cfg) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard lock(mutex_);
        auto& entry = slots_[Key{name, cfg.device, cfg.precision}];
        if (!entry) entry = std::make_shared<Slot>();
        slot = entry;
    }

    std::lock_guard slot_lock(slot->mutex);
    if (slot->handle) return slot->handle;

    auto loaded = provisioner_.provision(name, cfg);
    if (!loaded) return std::unexpected(loaded.error());

    slot->handle = std::move(*loaded);
    return slot->handle;
}

size_t ModelProvider::cached_count() const {
    std::lock_guard lock(mutex_);
    size_t n = 0;
    for (const auto& [key, slot] : slots_) {
        std::lock_guard slot_lock(slot->mutex);
        if (slot->handle) ++n;
    }
    return n;
}

void ModelProvider::clear() {
    std::lock_guard lock(mutex_);
    slots_.clear();
}
