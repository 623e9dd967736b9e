#pragma once

#include <expected>
#include <string>

// Fetches model files from a base URL (https://, or file:// for mirrors).
class ModelDownloader {
public:
    explicit ModelDownloader(std::string base_url, bool verbose = false);
    ~ModelDownloader();

    ModelDownloader(const ModelDownloader&) = delete;
    ModelDownloader& operator=(const ModelDownloader&) = delete;

    // Downloads <base_url>/<file_name> to dest_path via a uniquely named hidden
    // file beside it. The destination only appears once the transfer completed.
    std::expected<void, std::string> fetch(const std::string& file_name, const std::string& dest_path);

private:
    std::string base_url_;
    bool verbose_;
};
