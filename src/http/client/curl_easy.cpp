#include "curl_easy.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <random>
#include <string>
#include <thread>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"
#include "curl_options.hpp"

using namespace std::chrono;

namespace http::client {

    struct CurlDefaults {
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long VERIFY_PEER = 0L;
        static constexpr long VERIFY_HOST = 0L;
        static constexpr long FORBID_REUSE = 1L;
    };

    namespace {
        // Owns one easy handle and its header list for a single exchange.
        struct EasyHandle {
            CURL* handle_ = curl_easy_init();
            curl_slist* headers_{};
            std::array<char, ERROR_BUFFER_SIZE> error_buf_{};

            EasyHandle() {
                if (handle_ == nullptr) {
                    throw std::runtime_error("Failed to create CURL easy handle");
                }
            }

            ~EasyHandle() {
                if (headers_ != nullptr) {
                    curl_slist_free_all(headers_);
                }
                curl_easy_cleanup(handle_);
            }

            EasyHandle(const EasyHandle&) = delete;
            EasyHandle& operator=(const EasyHandle&) = delete;
            EasyHandle(EasyHandle&&) = delete;
            EasyHandle& operator=(EasyHandle&&) = delete;

            void append_header(const std::string& line) {
                auto* next = curl_slist_append(headers_, line.c_str());
                if (next == nullptr) {
                    throw std::runtime_error("curl_slist_append failed");
                }
                headers_ = next;
            }
        };

        struct HeaderState {
            http::model::Response* response_;
            steady_clock::time_point* headers_done_;
        };
    }  // namespace

    CurlEasy::CurlEasy(ClientOptions options, std::shared_ptr<CurlShare> share)
        : options_(std::move(options)), redirect_policy_(options_.follow_redirects_, options_.max_redirects_), share_(std::move(share)) {
        if (options_.socks_proxy_) {
            socks_url_ = options_.socks_proxy_->to_curl_url();
        }
    }

    void CurlEasy::apply_transport_options(CURL* handle) const {
        setopt(handle, CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(handle, CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(handle, CURLOPT_USERAGENT, constants::USER_AGENT);
        setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(duration_cast<milliseconds>(options_.timeout_).count()));
        setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_.count()));
        setopt(handle, CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(handle, CURLOPT_TCP_KEEPIDLE, constants::DIAL_KEEPALIVE_S);
        setopt(handle, CURLOPT_SSL_VERIFYPEER, CurlDefaults::VERIFY_PEER);
        setopt(handle, CURLOPT_SSL_VERIFYHOST, CurlDefaults::VERIFY_HOST);

        if (options_.keep_alive_) {
            setopt(handle, CURLOPT_MAXCONNECTS, options_.max_connections_);
        } else {
            setopt(handle, CURLOPT_FORBID_REUSE, CurlDefaults::FORBID_REUSE);
        }

        if (share_) {
            setopt(handle, CURLOPT_SHARE, share_->handle());
            if (share_->shares_cookies()) {
                setopt(handle, CURLOPT_COOKIEFILE, "");  // enables the cookie engine, nothing is read
            }
        }

        if (!options_.http_proxy_.empty()) {
            setopt(handle, CURLOPT_PROXY, options_.http_proxy_.c_str());
            if (!socks_url_.empty()) {
                setopt(handle, CURLOPT_PRE_PROXY, socks_url_.c_str());
            }
        } else if (!socks_url_.empty()) {
            setopt(handle, CURLOPT_PROXY, socks_url_.c_str());
        }
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* state = static_cast<HeaderState*>(userdata);
        const size_t bytes = size * n_items;

        std::string_view line(buffer, bytes);
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.remove_suffix(1);
        }

        if (string_utils::ieq_prefix(line.data(), line.size(), "HTTP/")) {
            // a new header block: interim 1xx or proxy CONNECT responses come first
            auto& resp = *state->response_;
            resp.headers_ = {};
            const auto first_space = line.find(' ');
            resp.protocol_ = std::string(line.substr(0, first_space));
            const auto second_space = first_space == std::string_view::npos ? first_space : line.find(' ', first_space + 1);
            resp.reason_ = second_space == std::string_view::npos ? std::string{} : std::string(line.substr(second_space + 1));
            return bytes;
        }

        if (line.empty()) {
            *state->headers_done_ = steady_clock::now();
            return bytes;
        }

        const auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            state->response_->headers_.add(string_utils::trim(std::string(line.substr(0, colon))), string_utils::trim(std::string(line.substr(colon + 1))));
        }

        return bytes;
    }

    CurlEasy::Hop CurlEasy::perform_once(const std::string& url, const std::string& method, const http::model::Headers& headers,
                                         const std::string& body) const {
        EasyHandle easy;
        Hop hop;
        hop.headers_done_ = steady_clock::now();
        HeaderState state{&hop.response_, &hop.headers_done_};

        apply_transport_options(easy.handle_);
        setopt(easy.handle_, CURLOPT_ERRORBUFFER, easy.error_buf_.data());
        setopt(easy.handle_, CURLOPT_URL, url.c_str());
        setopt(easy.handle_, CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(easy.handle_, CURLOPT_WRITEDATA, &hop.response_.body_);
        setopt(easy.handle_, CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(easy.handle_, CURLOPT_HEADERDATA, &state);

        if (method == "HEAD") {
            setopt(easy.handle_, CURLOPT_NOBODY, 1L);
        } else if (method == "GET" && body.empty()) {
            setopt(easy.handle_, CURLOPT_HTTPGET, 1L);
        } else if (!body.empty() || method == "POST") {
            setopt(easy.handle_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
            setopt(easy.handle_, CURLOPT_POSTFIELDS, body.c_str());
            if (method != "POST") {
                setopt(easy.handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
            }
        } else {
            setopt(easy.handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
        }

        for (const auto& [name, value] : headers) {
            // "Name;" is libcurl's spelling of a header with an empty value
            easy.append_header(value.empty() ? name + ";" : name + ": " + value);
        }
        if (!body.empty()) {
            if (!headers.contains("Content-Type")) {
                easy.append_header("Content-Type:");
            }
            if (!headers.contains("Expect")) {
                easy.append_header("Expect:");
            }
        }
        if (easy.headers_ != nullptr) {
            setopt(easy.handle_, CURLOPT_HTTPHEADER, easy.headers_);
        }

        const auto rc = curl_easy_perform(easy.handle_);
        if (rc != CURLE_OK) {
            std::string err = "curl_easy_perform failed for " + url + ": ";
            err += easy.error_buf_[0] != '\0' ? easy.error_buf_.data() : curl_easy_strerror(rc);
            throw http::http_error::TransportError(err, url, rc);
        }

        long code = 0;
        char* effective = nullptr;
        char* location = nullptr;
        curl_easy_getinfo(easy.handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(easy.handle_, CURLINFO_EFFECTIVE_URL, &effective);
        curl_easy_getinfo(easy.handle_, CURLINFO_REDIRECT_URL, &location);

        hop.response_.status_ = code;
        hop.response_.effective_url_ = effective != nullptr ? effective : url;
        hop.location_ = location != nullptr ? location : std::string{};
        return hop;
    }

    http::model::Response CurlEasy::follow_redirects(const http::model::Request& req, steady_clock::time_point started) const {
        std::string url = req.url_;
        std::string method = req.method_;
        std::string body = req.body_;
        size_t followed = 0;

        for (;;) {
            auto hop = perform_once(url, method, req.headers_, body);
            hop.response_.redirects_followed_ = followed;

            const bool redirect = is_redirect_status(hop.response_.status_) && !hop.location_.empty();
            if (!redirect || !redirect_policy_.should_follow(followed + 1)) {
                hop.response_.duration_ = duration_cast<nanoseconds>(hop.headers_done_ - started);
                return std::move(hop.response_);
            }

            const auto next_method = redirect_method(hop.response_.status_, method);
            if (next_method != method) {
                body.clear();
            }
            method = next_method;
            url = std::move(hop.location_);
            ++followed;
        }
    }

    http::model::Response CurlEasy::send(const http::model::Request& req) {
        const auto started = steady_clock::now();
        const auto& p = options_.retry_;
        milliseconds delay = p.base_delay_;

        for (size_t attempt = 1; attempt <= p.max_tries_; ++attempt) {
            try {
                auto resp = follow_redirects(req, started);

                if (p.retry_on_status_ && is_retryable_http(resp.status_) && attempt < p.max_tries_) {
                    spdlog::warn("{} {} returned {}, retrying ({}/{})", req.method_, req.url_, resp.status_, attempt, p.max_tries_ - 1);
                    delay = CurlEasy::get_retry_delay(p, delay);
                    continue;
                }

                return resp;
            } catch (const http::http_error::TransportError& e) {
                if (attempt < p.max_tries_) {
                    spdlog::warn("{} {} failed: {}, retrying ({}/{})", req.method_, req.url_, e.what(), attempt, p.max_tries_ - 1);
                    delay = CurlEasy::get_retry_delay(p, delay);
                    continue;
                }
                throw;
            }
        }

        throw http::http_error::TransportError("no attempts made for " + req.url_, req.url_);
    }

    milliseconds CurlEasy::get_retry_delay(const RetryPolicy& p, milliseconds& delay) {
        std::minstd_rand rng{std::random_device{}()};

        auto jitter = [&](milliseconds base) {
            std::uniform_int_distribution<int> d(0, static_cast<int>(base.count()));
            return milliseconds{d(rng)};
        };

        std::this_thread::sleep_for(std::min(delay + jitter(p.base_delay_), p.max_delay_));
        return std::min(delay * 2, p.max_delay_);
    }

}  // namespace http::client
