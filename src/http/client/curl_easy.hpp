#ifndef REQ_FORGE_CURL_EASY_HPP
#define REQ_FORGE_CURL_EASY_HPP

#include <curl/curl.h>

#include <chrono>
#include <memory>
#include <string>

#include "../model/model.hpp"
#include "client_options.hpp"
#include "curl_share.hpp"
#include "interface.hpp"
#include "redirect_policy.hpp"

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = 256;

    enum class HttpStatusCode : long {
        TOO_MANY_REQUESTS = 429,
        INTERNAL_SERVER_ERROR = 500,
        NOT_IMPLEMENTED = 501,
        NETWORK_CONNECT_TIMEOUT = 599,
    };

    // The standard transmitter. Every send() uses its own easy handle, so one instance serves all
    // worker threads; connections, DNS, TLS sessions and cookies are pooled through the share handle.
    class CurlEasy : public IHttpClient {
       public:
        CurlEasy(ClientOptions options, std::shared_ptr<CurlShare> share);

        ~CurlEasy() override = default;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response send(const http::model::Request& req) override;

        static std::chrono::milliseconds get_retry_delay(const RetryPolicy& p, std::chrono::milliseconds& delay);

        static bool is_retryable_http(long code) {
            return code == static_cast<long>(HttpStatusCode::TOO_MANY_REQUESTS) ||
                   (code >= static_cast<long>(HttpStatusCode::INTERNAL_SERVER_ERROR) && code <= static_cast<long>(HttpStatusCode::NETWORK_CONNECT_TIMEOUT) &&
                    code != static_cast<long>(HttpStatusCode::NOT_IMPLEMENTED));
        }

        [[nodiscard]] const ClientOptions& options() const { return options_; }

       private:
        struct Hop {
            http::model::Response response_;
            std::string location_;
            std::chrono::steady_clock::time_point headers_done_;
        };

        http::model::Response follow_redirects(const http::model::Request& req, std::chrono::steady_clock::time_point started) const;
        Hop perform_once(const std::string& url, const std::string& method, const http::model::Headers& headers, const std::string& body) const;
        void apply_transport_options(CURL* handle) const;

        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        ClientOptions options_;
        RedirectPolicy redirect_policy_;
        std::shared_ptr<CurlShare> share_;
        std::string socks_url_;
    };
}  // namespace http::client

#endif
