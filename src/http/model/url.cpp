#include "url.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

#include "../../utils/constants.hpp"

namespace http::model {
    namespace {
        struct CurlUrlDeleter {
            void operator()(CURLU* u) const { curl_url_cleanup(u); }
        };

        struct CurlStringDeleter {
            void operator()(char* s) const { curl_free(s); }
        };

        std::optional<std::string> get_part(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
            char* raw = nullptr;
            if (curl_url_get(handle, part, &raw, flags) != CURLUE_OK || raw == nullptr) {
                return std::nullopt;
            }
            std::unique_ptr<char, CurlStringDeleter> owned(raw);
            return std::string(owned.get());
        }

        int default_port(const std::string& scheme) {
            if (scheme == "https") {
                return 443;
            }
            if (scheme == "http") {
                return 80;
            }
            if (scheme.rfind("socks", 0) == 0) {
                return 1080;
            }
            return 0;
        }
    }  // namespace

    std::string Url::authority() const {
        if (port_ == 0 || port_ == default_port(scheme_)) {
            return host_;
        }
        return host_ + ":" + std::to_string(port_);
    }

    std::string Url::root() const { return scheme_ + "://" + authority(); }

    std::string Url::request_target() const { return query_.empty() ? path_ : path_ + "?" + query_; }

    std::optional<Url> parse_url(const std::string& text) {
        std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
        if (!handle) {
            return std::nullopt;
        }

        if (curl_url_set(handle.get(), CURLUPART_URL, text.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
            return std::nullopt;
        }

        Url url;
        auto scheme = get_part(handle.get(), CURLUPART_SCHEME);
        auto host = get_part(handle.get(), CURLUPART_HOST);
        if (!scheme || !host || host->empty()) {
            return std::nullopt;
        }

        url.scheme_ = *scheme;
        url.host_ = *host;
        url.user_ = get_part(handle.get(), CURLUPART_USER, CURLU_URLDECODE).value_or("");
        url.password_ = get_part(handle.get(), CURLUPART_PASSWORD, CURLU_URLDECODE).value_or("");
        url.path_ = get_part(handle.get(), CURLUPART_PATH).value_or("/");
        url.query_ = get_part(handle.get(), CURLUPART_QUERY).value_or("");

        if (auto port = get_part(handle.get(), CURLUPART_PORT)) {
            char* end = nullptr;
            url.port_ = static_cast<int>(std::strtol(port->c_str(), &end, constants::BASE_10));
        } else {
            url.port_ = default_port(url.scheme_);
        }

        if (url.path_.empty()) {
            url.path_ = "/";
        }

        return url;
    }
}  // namespace http::model
