#include <catch2/catch.hpp>

#include <curl/curl.h>

#include <string>

#include "../src/http/client/curl_options.hpp"
#include "../src/http/error/http_error.hpp"

TEST_CASE("curl option errors", "[curl_options]") {
    CURL* handle = curl_easy_init();
    REQUIRE(handle != nullptr);

    SECTION("accepted options pass through") {
        REQUIRE_NOTHROW(http::client::setopt(handle, CURLOPT_CONNECT_ONLY, 1L));
        REQUIRE_NOTHROW(http::client::setopt(handle, CURLOPT_URL, "http://example.test:80"));
    }

    SECTION("a rejected option raises a transport error") {
        const auto unknown = static_cast<CURLoption>(CURLOPTTYPE_LONG + 9999);
        try {
            http::client::setopt(handle, unknown, 1L);
            FAIL("setopt accepted an unknown option");
        } catch (const http::http_error::TransportError& e) {
            REQUIRE(e.code_ == CURLE_UNKNOWN_OPTION);
            REQUIRE(std::string(e.what()).rfind("curl_easy_setopt failed: ", 0) == 0);
        }
    }

    curl_easy_cleanup(handle);
}
