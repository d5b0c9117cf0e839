#include "raw_client.hpp"

#include <chrono>
#include <string>

#include "../error/http_error.hpp"
#include "../model/url.hpp"
#include "../wire/wire_format.hpp"

using namespace std::chrono;

namespace http::client {
    RawClient::RawClient(http::wire::StreamFactory factory) : factory_(std::move(factory)) {}

    http::model::Response RawClient::send(const std::string& target, const http::model::Request& req, const RawOptions& options) {
        const auto url = http::model::parse_url(target);
        if (!url) {
            throw http::http_error::TransportError("invalid raw request target: " + target, target);
        }

        // raw requests are authored with "\n" line endings; the wire wants "\r\n"
        const auto body = http::wire::normalize_line_endings(req.body_);
        const auto bytes = http::wire::serialize_request(req.method_, req.path_, req.headers_, body, url->authority(),
                                                         http::wire::SerializeOptions{
                                                             .automatic_content_length_ = options.automatic_content_length_,
                                                             .automatic_host_header_ = options.automatic_host_header_,
                                                         });

        const auto started = steady_clock::now();
        auto stream = factory_(*url);
        stream->write_all(bytes);

        http::wire::BufferedReader reader(*stream);
        auto response = http::wire::read_response_head(reader);
        response.duration_ = duration_cast<nanoseconds>(steady_clock::now() - started);
        http::wire::read_response_body(reader, response, req.method_ == "HEAD");

        response.effective_url_ = url->root() + req.path_;
        return response;
    }
}  // namespace http::client
