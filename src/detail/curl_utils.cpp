#include "surge/detail/curl_utils.hpp"

#include <curl/curl.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <mutex>

namespace surge::detail {

namespace {

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

struct CurlStringDeleter {
    void operator()(char* str) const noexcept { curl_free(str); }
};

using CurlString = std::unique_ptr<char, CurlStringDeleter>;

UrlHandle parseUrl(const std::string& url) {
    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        throw std::runtime_error("Failed to allocate curl URL handle");
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        handle.reset();
    }
    return handle;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

bool isWellFormedUrl(const std::string& url) {
    const auto handle = parseUrl(url);
    if (!handle) {
        return false;
    }
    char* host = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_HOST, &host, 0) != CURLUE_OK) {
        return false;
    }
    CurlString owned{host};
    return owned && *owned != '\0';
}

std::string fileNameFromUrl(const std::string& url) {
    const auto handle = parseUrl(url);
    if (!handle) {
        return {};
    }
    char* path = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_PATH, &path, CURLU_URLDECODE) != CURLUE_OK) {
        return {};
    }
    const CurlString owned{path};
    const std::string full{owned.get()};
    const auto slash = full.find_last_of('/');
    return slash == std::string::npos ? full : full.substr(slash + 1);
}

} // namespace surge::detail
