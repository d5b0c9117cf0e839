#include "client_options.hpp"

#include <algorithm>

#include "proxy.hpp"

namespace http::client {
    ClientOptions make_client_options(const ClientConfig& config) {
        const bool single_host = config.threads_ > 0;

        ClientOptions options{
            .timeout_ = std::chrono::seconds{config.timeout_s_},
            .retry_ =
                RetryPolicy{
                    .max_tries_ = static_cast<size_t>(std::max(config.retries_, 0)) + 1,
                    .retry_on_status_ = single_host,
                },
            .keep_alive_ = single_host,
            .max_connections_ = single_host ? constants::SINGLE_HOST_MAX_CONNS : constants::SPRAY_MAX_CONNS,
            .follow_redirects_ = config.follow_redirects_,
            .max_redirects_ = config.max_redirects_,
        };

        if (!config.proxy_url_.empty()) {
            options.http_proxy_ = parse_http_proxy(config.proxy_url_);
        }
        if (!config.proxy_socks_url_.empty()) {
            options.socks_proxy_ = parse_socks_proxy(config.proxy_socks_url_);
        }

        return options;
    }
}  // namespace http::client
