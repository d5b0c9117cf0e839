#include <catch2/catch.hpp>

#include <memory>
#include <string>

#include "../src/http/client/raw_client.hpp"
#include "../src/http/error/http_error.hpp"
#include "test_fakes.hpp"

TEST_CASE("raw client", "[raw_client]") {
    auto written = std::make_shared<std::string>();
    http::model::Url dialed;

    http::client::RawClient client([written, &dialed](const http::model::Url& url) -> std::unique_ptr<http::wire::IByteStream> {
        dialed = url;
        return std::make_unique<fakes::FakeStream>("HTTP/1.1 201 Created\r\nContent-Length: 4\r\nX-Reply: yes\r\n\r\ndone", written);
    });

    http::model::Request req;
    req.method_ = "POST";
    req.path_ = "/submit";
    req.body_ = "a=1\nb=2";
    req.headers_.add("X-A", "1");
    req.mode_ = http::model::TransmissionMode::RAW;

    SECTION("writes the authored request with CRLF line endings") {
        const auto resp = client.send("http://example.test:8080", req, http::client::RawOptions{});

        REQUIRE(*written == "POST /submit HTTP/1.1\r\nHost: example.test:8080\r\nX-A: 1\r\nContent-Length: 8\r\n\r\na=1\r\nb=2");
        REQUIRE(dialed.host_ == "example.test");
        REQUIRE(dialed.port_ == 8080);

        REQUIRE(resp.status_ == 201);
        REQUIRE(resp.body_ == "done");
        REQUIRE(resp.headers_.find("X-Reply") == std::optional<std::string_view>("yes"));
        REQUIRE(resp.effective_url_ == "http://example.test:8080/submit");
    }

    SECTION("automatic headers can be turned off") {
        (void)client.send("http://example.test", req, http::client::RawOptions{.automatic_content_length_ = false, .automatic_host_header_ = false});
        REQUIRE(*written == "POST /submit HTTP/1.1\r\nX-A: 1\r\n\r\na=1\r\nb=2");
    }

    SECTION("an unusable target is a transport error") {
        REQUIRE_THROWS_AS(client.send("not a url", req, http::client::RawOptions{}), http::http_error::TransportError);
        REQUIRE(written->empty());
    }
}
