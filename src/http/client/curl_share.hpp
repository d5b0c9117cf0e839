#ifndef REQ_FORGE_CURL_SHARE_HPP
#define REQ_FORGE_CURL_SHARE_HPP

#include <curl/curl.h>

#include <array>
#include <mutex>

namespace http::client {
    struct ShareOptions {
        bool connections_ = false;
        bool cookies_ = false;
    };

    // A libcurl share handle guarded by one mutex per lock_data kind. DNS and TLS sessions are always
    // shared; connections and cookies on request. A cookie sharing instance is the cookie jar.
    class CurlShare {
       public:
        explicit CurlShare(const ShareOptions& options);

        ~CurlShare();
        CurlShare(const CurlShare&) = delete;
        CurlShare& operator=(const CurlShare&) = delete;
        CurlShare(CurlShare&&) = delete;
        CurlShare& operator=(CurlShare&&) = delete;

        [[nodiscard]] CURLSH* handle() const { return handle_; }
        [[nodiscard]] bool shares_cookies() const { return options_.cookies_; }

       private:
        void share(curl_lock_data data);

        static void lock_cb(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
        static void unlock_cb(CURL* handle, curl_lock_data data, void* userptr);

        CURLSH* handle_{};
        ShareOptions options_;
        std::array<std::mutex, CURL_LOCK_DATA_LAST> locks_;
    };
}  // namespace http::client

#endif
