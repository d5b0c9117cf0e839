#include "proxy.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "../../utils/string_utils.hpp"
#include "../model/url.hpp"

namespace http::client {
    std::string SocksProxy::to_curl_url() const {
        std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> url(::curl_url(), &curl_url_cleanup);
        if (url == nullptr) {
            throw std::runtime_error("Failed to create CURLU handle");
        }

        auto set_part = [&url, this](CURLUPart part, const std::string& value, unsigned int flags) {
            if (curl_url_set(url.get(), part, value.c_str(), flags) != CURLUE_OK) {
                throw std::runtime_error("Failed to build socks proxy URL for " + host_);
            }
        };

        set_part(CURLUPART_SCHEME, "socks5h", CURLU_NON_SUPPORT_SCHEME);
        set_part(CURLUPART_HOST, host_, 0);
        set_part(CURLUPART_PORT, std::to_string(port_), 0);
        if (!user_.empty()) {
            set_part(CURLUPART_USER, user_, CURLU_URLENCODE);
            set_part(CURLUPART_PASSWORD, password_, CURLU_URLENCODE);
        }

        char* text = nullptr;
        if (curl_url_get(url.get(), CURLUPART_URL, &text, 0) != CURLUE_OK || text == nullptr) {
            throw std::runtime_error("Failed to render socks proxy URL for " + host_);
        }
        std::string out(text);
        curl_free(text);
        return out;
    }

    std::optional<SocksProxy> parse_socks_proxy(const std::string& text) {
        auto url = http::model::parse_url(text);
        if (!url || url->host_.empty()) {
            spdlog::warn("Ignoring malformed socks proxy URL '{}', dialing directly", text);
            return std::nullopt;
        }

        const auto scheme = string_utils::to_lower(url->scheme_);
        if (scheme != "socks5" && scheme != "socks5h") {
            spdlog::warn("Ignoring socks proxy URL '{}' with scheme '{}', dialing directly", text, url->scheme_);
            return std::nullopt;
        }

        return SocksProxy{
            .host_ = url->host_,
            .port_ = url->port_,
            .user_ = url->user_,
            .password_ = url->password_,
        };
    }

    std::string parse_http_proxy(const std::string& text) {
        auto url = http::model::parse_url(text);
        if (!url || url->host_.empty()) {
            throw std::invalid_argument("invalid http proxy URL: " + text);
        }

        const auto scheme = string_utils::to_lower(url->scheme_);
        if (scheme != "http" && scheme != "https") {
            throw std::invalid_argument("unsupported http proxy scheme '" + url->scheme_ + "' in " + text);
        }
        return text;
    }
}  // namespace http::client
