#ifndef REQ_FORGE_PROXY_HPP
#define REQ_FORGE_PROXY_HPP

#include <optional>
#include <string>

namespace http::client {
    struct SocksProxy {
        std::string host_;
        int port_ = 0;
        std::string user_;
        std::string password_;

        // socks5h:// URL understood by CURLOPT_PROXY / CURLOPT_PRE_PROXY; names resolve on the proxy.
        [[nodiscard]] std::string to_curl_url() const;
    };

    // Returns nullopt (and logs a warning) when the URL cannot be used, so callers dial directly.
    [[nodiscard]] std::optional<SocksProxy> parse_socks_proxy(const std::string& text);

    // Throws std::invalid_argument for an unusable HTTP proxy URL. Returns the URL as curl expects it.
    [[nodiscard]] std::string parse_http_proxy(const std::string& text);
}  // namespace http::client

#endif
