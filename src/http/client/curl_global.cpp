#include "curl_global.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace http::client {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }

        const auto* info = curl_version_info(CURLVERSION_NOW);
        spdlog::debug("libcurl {} ({})", info->version, info->ssl_version != nullptr ? info->ssl_version : "no TLS");
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

}  // namespace http::client
