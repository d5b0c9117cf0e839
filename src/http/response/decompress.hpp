#ifndef REQ_FORGE_DECOMPRESS_HPP
#define REQ_FORGE_DECOMPRESS_HPP

#include <optional>
#include <string>
#include <string_view>

#include "../model/model.hpp"

namespace http::response {
    enum class ContentEncoding { IDENTITY, GZIP, DEFLATE, UNSUPPORTED };

    [[nodiscard]] ContentEncoding parse_content_encoding(std::string_view value);

    // gzip accepts gzip and zlib framing; deflate accepts zlib framing and falls back to raw deflate.
    // Throws DecompressionError on corrupt input.
    [[nodiscard]] std::string inflate_body(std::string_view data, ContentEncoding encoding);

    // Decodes response.body_ in place unless the transport already did. Returns true when it decoded.
    bool decompress_response(http::model::Response& response);
}  // namespace http::response

#endif
