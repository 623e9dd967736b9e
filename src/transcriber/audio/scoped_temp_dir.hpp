#pragma once

#include <string>

// Creates a private directory on construction and removes it, with everything
// inside, on destruction.
class ScopedTempDir {
public:
    ScopedTempDir(const std::string& parent, const std::string& prefix);
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    bool valid() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};
