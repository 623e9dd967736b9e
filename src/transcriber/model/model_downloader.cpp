#include "model_downloader.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <curl/curl.h>
#include <filesystem>
#include <print>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* file = static_cast<std::FILE*>(userdata);
    return std::fwrite(ptr, size, nmemb, file) * size;
}

ModelDownloader::ModelDownloader(std::string base_url, bool verbose)
    : base_url_(std::move(base_url)), verbose_(verbose) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

ModelDownloader::~ModelDownloader() {
    curl_global_cleanup();
}

std::expected<void, std::string>
ModelDownloader::fetch(const std::string& file_name, const std::string& dest_path) {
    std::error_code ec;
    fs::create_directories(fs::path(dest_path).parent_path(), ec);
    if (ec) {
        return std::unexpected("cannot create " + fs::path(dest_path).parent_path().string() +
                               ": " + ec.message());
    }

    // A name of its own per transfer: concurrent fetches of one file never share it.
    auto dest = fs::path(dest_path);
    std::string tmpl = (dest.parent_path() / ("." + dest.filename().string() + ".XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        return std::unexpected("cannot create temporary file for " + dest_path + ": " + std::strerror(errno));
    }
    std::string part_path(buf.data());
    ::fchmod(fd, 0644);

    std::FILE* out = ::fdopen(fd, "wb");
    if (!out) {
        int err = errno;
        ::close(fd);
        fs::remove(part_path, ec);
        return std::unexpected("cannot write " + part_path + ": " + std::strerror(err));
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(out);
        fs::remove(part_path, ec);
        return std::unexpected("curl_easy_init failed");
    }

    std::string url = base_url_ + "/" + file_name;
    if (verbose_) {
        std::println(stderr, "[transcriber] downloading {}", url);
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, out);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    // Abort stalled transfers rather than whole slow ones: large models take minutes.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1024L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    bool flushed = std::fclose(out) == 0;

    if (res != CURLE_OK) {
        fs::remove(part_path, ec);
        if (res == CURLE_HTTP_RETURNED_ERROR) {
            return std::unexpected("HTTP " + std::to_string(http_code) + " for " + url);
        }
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res) + " (" + url + ")");
    }
    if (!flushed) {
        fs::remove(part_path, ec);
        return std::unexpected("failed to flush " + part_path);
    }

    fs::rename(part_path, dest_path, ec);
    if (ec) {
        fs::remove(part_path, ec);
        return std::unexpected("cannot move download into place at " + dest_path);
    }
    return {};
}
