#ifndef REQ_FORGE_CURL_CONNECTION_HPP
#define REQ_FORGE_CURL_CONNECTION_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <memory>
#include <string>

#include "../model/url.hpp"
#include "../wire/byte_stream.hpp"
#include "../wire/polled_stream.hpp"

namespace http::client {
    const size_t CONNECTION_ERROR_BUFFER_SIZE = 256;

    struct ConnectionOptions {
        std::chrono::milliseconds connect_timeout_{30'000};
        std::chrono::milliseconds io_timeout_{5'000};
    };

    // A connect-only libcurl handle: libcurl resolves, connects and negotiates TLS (peer
    // verification off), then bytes are moved with curl_easy_send/curl_easy_recv. The pipelined
    // client writes and reads one connection from different threads; PolledStream serializes the
    // handle calls.
    class CurlConnection : public http::wire::PolledStream {
       public:
        CurlConnection(const http::model::Url& url, const ConnectionOptions& options);

        ~CurlConnection() override;
        CurlConnection(const CurlConnection&) = delete;
        CurlConnection& operator=(const CurlConnection&) = delete;
        CurlConnection(CurlConnection&&) = delete;
        CurlConnection& operator=(CurlConnection&&) = delete;

        static http::wire::StreamFactory factory(const ConnectionOptions& options);

       protected:
        http::wire::IoStatus try_send(const char* data, size_t length, size_t& sent) override;
        http::wire::IoStatus try_recv(char* buffer, size_t capacity, size_t& received) override;
        void wait_ready(bool for_read) override;

       private:
        CURL* handle_{};
        curl_socket_t socket_ = CURL_SOCKET_BAD;
        std::string origin_;
        ConnectionOptions options_;
        std::array<char, CONNECTION_ERROR_BUFFER_SIZE> error_buf_{};
    };
}  // namespace http::client

#endif
