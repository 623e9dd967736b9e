#include "scoped_temp_dir.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <print>
#include <vector>

namespace fs = std::filesystem;

ScopedTempDir::ScopedTempDir(const std::string& parent, const std::string& prefix) {
    std::error_code ec;
    fs::create_directories(parent, ec);

    std::string tmpl = parent + "/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) {
        std::println(stderr, "tempdir: mkdtemp({}) failed: {}", tmpl, std::strerror(errno));
        return;
    }
    path_.assign(buf.data());
}

ScopedTempDir::~ScopedTempDir() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::println(stderr, "tempdir: failed to remove {}: {}", path_, ec.message());
    }
}
