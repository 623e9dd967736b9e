#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

static std::string xdg_dir(const char* var, const char* home_suffix) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + "/transcriber";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + home_suffix + "/transcriber";
}

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string cache_dir() {
    return xdg_dir("XDG_CACHE_HOME", "/.cache");
}

std::string temp_dir() {
    const char* tmp = std::getenv("TMPDIR");
    if (tmp && *tmp) return tmp;
    return "/tmp";
}

} // namespace platform
