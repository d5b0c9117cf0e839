#include <catch2/catch.hpp>
#include <zlib.h>

#include <string>
#include <vector>

#include "../src/http/error/http_error.hpp"
#include "../src/http/response/decompress.hpp"
#include "../src/http/response/response_processor.hpp"

using namespace http::response;

namespace {
    // window_bits: 15 + 16 for gzip framing, 15 for zlib framing, -15 for raw deflate.
    std::string compress(const std::string& input, int window_bits) {
        z_stream stream{};
        REQUIRE(deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) == Z_OK);

        std::vector<char> out(deflateBound(&stream, static_cast<uLong>(input.size())) + 32);
        stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
        stream.avail_in = static_cast<uInt>(input.size());
        stream.next_out = reinterpret_cast<Bytef*>(out.data());
        stream.avail_out = static_cast<uInt>(out.size());

        REQUIRE(deflate(&stream, Z_FINISH) == Z_STREAM_END);
        out.resize(stream.total_out);
        deflateEnd(&stream);
        return std::string(out.begin(), out.end());
    }

    http::model::Response encoded_response(std::string body, const std::string& encoding) {
        http::model::Response resp;
        resp.status_ = 200;
        resp.body_ = std::move(body);
        resp.headers_.add("Content-Encoding", encoding);
        return resp;
    }
}  // namespace

TEST_CASE("content encoding names", "[decompress]") {
    REQUIRE(parse_content_encoding("gzip") == ContentEncoding::GZIP);
    REQUIRE(parse_content_encoding(" X-GZIP ") == ContentEncoding::GZIP);
    REQUIRE(parse_content_encoding("deflate") == ContentEncoding::DEFLATE);
    REQUIRE(parse_content_encoding("identity") == ContentEncoding::IDENTITY);
    REQUIRE(parse_content_encoding("") == ContentEncoding::IDENTITY);
    REQUIRE(parse_content_encoding("br") == ContentEncoding::UNSUPPORTED);
}

TEST_CASE("response decompression", "[decompress]") {
    const std::string plain = "<html><body>admin panel</body></html>";

    SECTION("gzip") {
        auto resp = encoded_response(compress(plain, 15 + 16), "gzip");
        REQUIRE(decompress_response(resp));
        REQUIRE(resp.body_ == plain);
        REQUIRE(resp.decoded_);
    }

    SECTION("deflate with and without the zlib header") {
        auto wrapped = encoded_response(compress(plain, 15), "deflate");
        REQUIRE(decompress_response(wrapped));
        REQUIRE(wrapped.body_ == plain);

        auto raw = encoded_response(compress(plain, -15), "deflate");
        REQUIRE(decompress_response(raw));
        REQUIRE(raw.body_ == plain);
    }

    SECTION("bodies the transport already decoded are left alone") {
        auto resp = encoded_response(plain, "gzip");
        resp.decoded_ = true;
        REQUIRE_FALSE(decompress_response(resp));
        REQUIRE(resp.body_ == plain);
    }

    SECTION("unsupported encodings are passed through") {
        auto resp = encoded_response("opaque", "br");
        REQUIRE_FALSE(decompress_response(resp));
        REQUIRE(resp.body_ == "opaque");
    }

    SECTION("corrupt and truncated input") {
        auto corrupt = encoded_response("not compressed at all", "gzip");
        REQUIRE_THROWS_AS(decompress_response(corrupt), http::http_error::DecompressionError);

        const auto full = compress(plain, 15 + 16);
        auto truncated = encoded_response(full.substr(0, full.size() / 2), "gzip");
        REQUIRE_THROWS_WITH(decompress_response(truncated), "gzip: truncated stream");
    }
}

TEST_CASE("processed responses", "[decompress]") {
    http::model::Response resp;
    resp.status_ = 200;
    resp.headers_.add("Content-Type", "text/plain");
    resp.headers_.add("Content-Encoding", "gzip");
    resp.body_ = compress("hello", 15 + 16);

    const auto processed = process_response(std::move(resp));
    REQUIRE(processed.body() == "hello");
    REQUIRE(processed.headers().find("Content-Type: text/plain") != std::string_view::npos);
    REQUIRE(processed.response().status_ == 200);
}
