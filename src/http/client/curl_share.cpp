#include "curl_share.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace http::client {
    CurlShare::CurlShare(const ShareOptions& options) : handle_(curl_share_init()), options_(options) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL share handle");
        }

        if (curl_share_setopt(handle_, CURLSHOPT_USERDATA, this) != CURLSHE_OK ||
            curl_share_setopt(handle_, CURLSHOPT_LOCKFUNC, &CurlShare::lock_cb) != CURLSHE_OK ||
            curl_share_setopt(handle_, CURLSHOPT_UNLOCKFUNC, &CurlShare::unlock_cb) != CURLSHE_OK) {
            curl_share_cleanup(handle_);
            handle_ = nullptr;
            throw std::runtime_error("Failed to install CURL share lock callbacks");
        }

        share(CURL_LOCK_DATA_DNS);
        share(CURL_LOCK_DATA_SSL_SESSION);
        if (options_.connections_) {
            share(CURL_LOCK_DATA_CONNECT);
        }
        if (options_.cookies_) {
            share(CURL_LOCK_DATA_COOKIE);
        }
    }

    CurlShare::~CurlShare() {
        if (handle_ != nullptr) {
            curl_share_cleanup(handle_);
        }
    }

    void CurlShare::share(curl_lock_data data) {
        const auto rc = curl_share_setopt(handle_, CURLSHOPT_SHARE, data);
        if (rc != CURLSHE_OK) {
            curl_share_cleanup(handle_);
            handle_ = nullptr;
            throw std::runtime_error(std::string("curl_share_setopt failed: ") + curl_share_strerror(rc));
        }
    }

    void CurlShare::lock_cb(CURL* /*handle*/, curl_lock_data data, curl_lock_access /*access*/, void* userptr) {
        auto* self = static_cast<CurlShare*>(userptr);
        self->locks_.at(static_cast<size_t>(data)).lock();
    }

    void CurlShare::unlock_cb(CURL* /*handle*/, curl_lock_data data, void* userptr) {
        auto* self = static_cast<CurlShare*>(userptr);
        self->locks_.at(static_cast<size_t>(data)).unlock();
    }
}  // namespace http::client
