#pragma once

#include <string>

namespace platform {

// Empty string when neither the XDG variable nor HOME is set.
std::string config_dir();
std::string data_dir();
std::string cache_dir();

// Directory for per-job scratch files ($TMPDIR or /tmp).
std::string temp_dir();

} // namespace platform
