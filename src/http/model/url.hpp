#ifndef REQ_FORGE_URL_HPP
#define REQ_FORGE_URL_HPP

#include <optional>
#include <string>

namespace http::model {
    struct Url {
        std::string scheme_;
        std::string user_;
        std::string password_;
        std::string host_;
        int port_ = 0;  // explicit or scheme default
        std::string path_ = "/";
        std::string query_;

        // host[:port] as it belongs in a Host header (default ports omitted).
        [[nodiscard]] std::string authority() const;
        // scheme://authority
        [[nodiscard]] std::string root() const;
        // path[?query]
        [[nodiscard]] std::string request_target() const;
    };

    // Parses with libcurl's URL API. Unknown schemes (socks5, ...) are accepted.
    [[nodiscard]] std::optional<Url> parse_url(const std::string& text);
}  // namespace http::model

#endif
