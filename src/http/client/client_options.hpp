#ifndef REQ_FORGE_CLIENT_OPTIONS_HPP
#define REQ_FORGE_CLIENT_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "../../utils/constants.hpp"
#include "proxy.hpp"

namespace http::client {
    class CurlShare;

    struct RetryPolicy {
        size_t max_tries_ = 1;
        std::chrono::milliseconds base_delay_{constants::RETRY_WAIT_MIN_MS};
        std::chrono::milliseconds max_delay_{constants::RETRY_WAIT_MAX_MS};
        // Host spraying only retries transport failures; single host also retries 429 and 5xx.
        bool retry_on_status_ = false;
    };

    // What the executer knows when it builds its standard client.
    struct ClientConfig {
        int threads_ = 0;
        int timeout_s_ = constants::DEFAULT_TIMEOUT_S;
        int retries_ = constants::DEFAULT_RETRIES;
        bool follow_redirects_ = false;
        int max_redirects_ = 0;
        std::string proxy_url_;
        std::string proxy_socks_url_;
    };

    // Immutable once built; shared by every request the standard client sends.
    struct ClientOptions {
        std::chrono::seconds timeout_{constants::DEFAULT_TIMEOUT_S};
        std::chrono::milliseconds connect_timeout_{constants::DIAL_TIMEOUT_MS};
        RetryPolicy retry_;

        bool keep_alive_ = false;
        long max_connections_ = constants::SPRAY_MAX_CONNS;

        bool follow_redirects_ = false;
        int max_redirects_ = 0;

        std::string http_proxy_;
        std::optional<SocksProxy> socks_proxy_;
    };

    // Single host mode (threads > 0) keeps connections alive with a 500 connection cache;
    // host spraying closes every connection after use. Throws std::invalid_argument for a bad HTTP proxy.
    [[nodiscard]] ClientOptions make_client_options(const ClientConfig& config);
}  // namespace http::client

#endif
