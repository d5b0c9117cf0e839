#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>

#include "../src/http/client/client_options.hpp"
#include "../src/http/client/proxy.hpp"
#include "../src/http/model/url.hpp"
#include "../src/http/response/response_processor.hpp"

using namespace http::client;

TEST_CASE("client options", "[client_options]") {
    SECTION("host spraying closes connections and only retries transport errors") {
        const auto options = make_client_options(ClientConfig{.threads_ = 0, .timeout_s_ = 7, .retries_ = 2});
        REQUIRE_FALSE(options.keep_alive_);
        REQUIRE(options.max_connections_ == 0);
        REQUIRE(options.retry_.max_tries_ == 3);
        REQUIRE_FALSE(options.retry_.retry_on_status_);
        REQUIRE(options.timeout_ == std::chrono::seconds(7));
        REQUIRE(options.http_proxy_.empty());
        REQUIRE_FALSE(options.socks_proxy_.has_value());
    }

    SECTION("single host keeps a large connection cache") {
        const auto options = make_client_options(ClientConfig{.threads_ = 10, .retries_ = 0, .follow_redirects_ = true, .max_redirects_ = 3});
        REQUIRE(options.keep_alive_);
        REQUIRE(options.max_connections_ == 500);
        REQUIRE(options.retry_.max_tries_ == 1);
        REQUIRE(options.retry_.retry_on_status_);
        REQUIRE(options.follow_redirects_);
        REQUIRE(options.max_redirects_ == 3);
    }

    SECTION("proxies") {
        const auto options = make_client_options(ClientConfig{.proxy_url_ = "http://proxy.test:3128", .proxy_socks_url_ = "socks5://user:pw@127.0.0.1:9050"});
        REQUIRE(options.http_proxy_ == "http://proxy.test:3128");
        REQUIRE(options.socks_proxy_.has_value());
        REQUIRE(options.socks_proxy_->host_ == "127.0.0.1");
        REQUIRE(options.socks_proxy_->port_ == 9050);
        REQUIRE(options.socks_proxy_->user_ == "user");
        REQUIRE(options.socks_proxy_->password_ == "pw");
        REQUIRE(options.socks_proxy_->to_curl_url().rfind("socks5h://user:pw@127.0.0.1:9050", 0) == 0);
    }

    SECTION("a bad http proxy is fatal") {
        REQUIRE_THROWS_AS(make_client_options(ClientConfig{.proxy_url_ = "ftp://proxy.test"}), std::invalid_argument);
        REQUIRE_THROWS_AS(make_client_options(ClientConfig{.proxy_url_ = "::nonsense::"}), std::invalid_argument);
    }

    SECTION("a bad socks proxy is ignored") {
        const auto options = make_client_options(ClientConfig{.proxy_socks_url_ = "http://proxy.test:1080"});
        REQUIRE_FALSE(options.socks_proxy_.has_value());
        REQUIRE_FALSE(parse_socks_proxy("::nonsense::").has_value());
    }
}

TEST_CASE("urls", "[url]") {
    SECTION("default ports are left out of the authority") {
        const auto url = http::model::parse_url("https://example.test:443/a/b?c=d");
        REQUIRE(url.has_value());
        REQUIRE(url->authority() == "example.test");
        REQUIRE(url->root() == "https://example.test");
        REQUIRE(url->request_target() == "/a/b?c=d");
    }

    SECTION("explicit ports are kept") {
        const auto url = http::model::parse_url("http://example.test:8080");
        REQUIRE(url.has_value());
        REQUIRE(url->authority() == "example.test:8080");
        REQUIRE(url->path_ == "/");
    }

    SECTION("garbage is rejected") { REQUIRE_FALSE(http::model::parse_url("not a url").has_value()); }
}

TEST_CASE("debug dumps", "[dump]") {
    http::model::Request req;
    req.method_ = "POST";
    req.url_ = "http://example.test:8080/login?next=1";
    req.headers_.add("Content-Type", "application/x-www-form-urlencoded");
    req.body_ = "user=admin";

    REQUIRE(http::response::dump_request(req, "http://example.test:8080") ==
            "POST /login?next=1 HTTP/1.1\r\nHost: example.test:8080\r\nContent-Type: application/x-www-form-urlencoded\r\n\r\nuser=admin");

    http::model::Response resp;
    resp.status_ = 302;
    resp.reason_ = "Found";
    resp.headers_.add("Location", "/home");
    REQUIRE(http::response::dump_response(resp).rfind("HTTP/1.1 302 Found\r\nLocation: /home\r\n", 0) == 0);
}
