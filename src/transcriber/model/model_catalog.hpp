#pragma once

#include <string>
#include <vector>

namespace catalog {

const std::vector<std::string>& model_names();
const std::vector<std::string>& precisions();

bool is_known_model(const std::string& name);
bool is_known_precision(const std::string& precision);

// Whether the download mirror carries this name/precision pair.
bool is_published(const std::string& name, const std::string& precision);
std::vector<std::string> published_precisions(const std::string& name);

// The preferred precision when the mirror has it, else the closest published one:
// another integer quantization for integer preferences, f16 as the last resort.
// Unknown names get the preference back unchanged.
std::string closest_published(const std::string& name, const std::string& preferred);

// "ggml-small.bin" for f16, "ggml-small-q8_0.bin" otherwise.
std::string file_name(const std::string& name, const std::string& precision);

} // namespace catalog
