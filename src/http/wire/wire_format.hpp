#ifndef REQ_FORGE_WIRE_FORMAT_HPP
#define REQ_FORGE_WIRE_FORMAT_HPP

#include <string>
#include <string_view>

#include "../model/model.hpp"
#include "byte_stream.hpp"

namespace http::wire {
    struct SerializeOptions {
        bool automatic_content_length_ = true;
        bool automatic_host_header_ = true;
    };

    // Converts every bare "\n" into "\r\n". Existing "\r\n" pairs are left untouched.
    [[nodiscard]] std::string normalize_line_endings(std::string_view input);

    // Writes "METHOD TARGET HTTP/1.1", the headers in order and the body, filling Host and
    // Content-Length only when asked to and when the request does not carry them already.
    [[nodiscard]] std::string serialize_request(std::string_view method, std::string_view path, const http::model::Headers& headers,
                                                std::string_view body, std::string_view host, const SerializeOptions& options);

    // Status line and header block. Leaves the reader positioned at the first body byte.
    [[nodiscard]] http::model::Response read_response_head(BufferedReader& reader);

    // Reads a Content-Length, chunked or close-delimited body into response.body_.
    void read_response_body(BufferedReader& reader, http::model::Response& response, bool head_request);
}  // namespace http::wire

#endif
