#include "curl_connection.hpp"

#include <curl/curl.h>
#include <poll.h>

#include <cerrno>
#include <stdexcept>
#include <memory>
#include <string>

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"
#include "curl_options.hpp"

namespace http::client {

    CurlConnection::CurlConnection(const http::model::Url& url, const ConnectionOptions& options)
        : handle_(curl_easy_init()), origin_(url.scheme_ + "://" + url.host_ + ":" + std::to_string(url.port_)), options_(options) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        try {
            setopt(handle_, CURLOPT_ERRORBUFFER, error_buf_.data());
            setopt(handle_, CURLOPT_URL, origin_.c_str());
            setopt(handle_, CURLOPT_CONNECT_ONLY, 1L);
            setopt(handle_, CURLOPT_NOSIGNAL, 1L);
            setopt(handle_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_.count()));
            setopt(handle_, CURLOPT_SSL_VERIFYPEER, 0L);
            setopt(handle_, CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(handle_, CURLOPT_TCP_KEEPALIVE, 1L);
            setopt(handle_, CURLOPT_TCP_KEEPIDLE, constants::DIAL_KEEPALIVE_S);

            const auto rc = curl_easy_perform(handle_);
            if (rc != CURLE_OK) {
                std::string err = "could not connect to " + origin_ + ": ";
                err += error_buf_[0] != '\0' ? error_buf_.data() : curl_easy_strerror(rc);
                throw http::http_error::TransportError(err, origin_, rc);
            }

            if (curl_easy_getinfo(handle_, CURLINFO_ACTIVESOCKET, &socket_) != CURLE_OK || socket_ == CURL_SOCKET_BAD) {
                throw http::http_error::TransportError("no active socket after connecting to " + origin_, origin_);
            }
        } catch (const http::http_error::TransportError&) {
            curl_easy_cleanup(handle_);
            handle_ = nullptr;
            throw;
        }
    }

    CurlConnection::~CurlConnection() {
        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlConnection::wait_ready(bool for_read) {
        pollfd pfd{};
        pfd.fd = socket_;
        pfd.events = for_read ? POLLIN : POLLOUT;

        int rc = 0;
        do {
            rc = ::poll(&pfd, 1, static_cast<int>(options_.io_timeout_.count()));
        } while (rc < 0 && errno == EINTR);

        if (rc == 0) {
            throw http::http_error::TransportError(std::string("timed out ") + (for_read ? "reading from " : "writing to ") + origin_, origin_,
                                                   CURLE_OPERATION_TIMEDOUT);
        }
        if (rc < 0) {
            throw http::http_error::TransportError("poll failed on connection to " + origin_, origin_);
        }
    }

    http::wire::IoStatus CurlConnection::try_send(const char* data, size_t length, size_t& sent) {
        const auto rc = curl_easy_send(handle_, data, length, &sent);
        if (rc == CURLE_AGAIN) {
            return http::wire::IoStatus::AGAIN;
        }
        if (rc != CURLE_OK) {
            throw http::http_error::TransportError("could not write to " + origin_ + ": " + curl_easy_strerror(rc), origin_, rc);
        }
        return http::wire::IoStatus::DONE;
    }

    http::wire::IoStatus CurlConnection::try_recv(char* buffer, size_t capacity, size_t& received) {
        const auto rc = curl_easy_recv(handle_, buffer, capacity, &received);
        if (rc == CURLE_AGAIN) {
            return http::wire::IoStatus::AGAIN;
        }
        if (rc != CURLE_OK) {
            throw http::http_error::TransportError("could not read from " + origin_ + ": " + curl_easy_strerror(rc), origin_, rc);
        }
        return http::wire::IoStatus::DONE;
    }

    http::wire::StreamFactory CurlConnection::factory(const ConnectionOptions& options) {
        return [options](const http::model::Url& url) -> std::unique_ptr<http::wire::IByteStream> { return std::make_unique<CurlConnection>(url, options); };
    }
}  // namespace http::client
