#pragma once

#include "errors.hpp"
#include "job.hpp"
#include "speech_model.hpp"

#include <string>

// Turns a model name plus resolved device/precision into a loaded model,
// fetching weights first if they are not present locally.
class ModelProvisioner {
public:
    virtual ~ModelProvisioner() = default;
    virtual Result<ModelHandle> provision(const std::string& name, const ResolvedConfig& cfg) = 0;
};
