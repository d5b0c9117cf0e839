#ifndef REQ_FORGE_CURL_OPTIONS_HPP
#define REQ_FORGE_CURL_OPTIONS_HPP

#include <curl/curl.h>

#include <string>

#include "../error/http_error.hpp"

namespace http::client {
    template <typename T>
    void setopt(CURL* handle, CURLoption option, T value) {
        const auto rc = curl_easy_setopt(handle, option, value);

        if (rc != CURLE_OK) {
            throw http::http_error::TransportError(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc), {}, rc);
        }
    }
}  // namespace http::client

#endif
