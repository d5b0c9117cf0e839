#include "decompress.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <array>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

namespace http::response {
    namespace {
        constexpr int GZIP_OR_ZLIB_WINDOW = 15 + 32;
        constexpr int ZLIB_WINDOW = 15;
        constexpr int RAW_WINDOW = -15;

        class Inflater {
           public:
            explicit Inflater(int window_bits) {
                if (inflateInit2(&stream_, window_bits) != Z_OK) {
                    throw http::http_error::DecompressionError("zlib", "failed to initialize inflate context");
                }
            }

            ~Inflater() { inflateEnd(&stream_); }
            Inflater(const Inflater&) = delete;
            Inflater& operator=(const Inflater&) = delete;
            Inflater(Inflater&&) = delete;
            Inflater& operator=(Inflater&&) = delete;

            // Returns the zlib status of the last call: Z_STREAM_END on success.
            int run(std::string_view data, std::string& out) {
                std::array<char, constants::READ_CHUNK_SIZE> chunk{};

                stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
                stream_.avail_in = static_cast<uInt>(data.size());

                int rc = Z_OK;
                do {
                    stream_.next_out = reinterpret_cast<Bytef*>(chunk.data());
                    stream_.avail_out = static_cast<uInt>(chunk.size());

                    rc = inflate(&stream_, Z_NO_FLUSH);
                    if (rc != Z_OK && rc != Z_STREAM_END) {
                        return rc;
                    }

                    out.append(chunk.data(), chunk.size() - stream_.avail_out);
                } while (rc != Z_STREAM_END && (stream_.avail_in > 0 || stream_.avail_out == 0));

                return rc;
            }

            [[nodiscard]] const char* message() const { return stream_.msg != nullptr ? stream_.msg : "corrupt input"; }

           private:
            z_stream stream_{};
        };

        std::string inflate_with(std::string_view data, int window_bits, const char* encoding_name) {
            Inflater inflater(window_bits);
            std::string out;
            const int rc = inflater.run(data, out);
            if (rc == Z_STREAM_END) {
                return out;
            }
            if (rc == Z_OK || rc == Z_BUF_ERROR) {
                throw http::http_error::DecompressionError(encoding_name, "truncated stream");
            }
            throw http::http_error::DecompressionError(encoding_name, inflater.message());
        }
    }  // namespace

    ContentEncoding parse_content_encoding(std::string_view value) {
        const auto encoding = string_utils::to_lower(string_utils::trim(std::string(value)));
        if (encoding.empty() || encoding == "identity") {
            return ContentEncoding::IDENTITY;
        }
        if (encoding == "gzip" || encoding == "x-gzip") {
            return ContentEncoding::GZIP;
        }
        if (encoding == "deflate") {
            return ContentEncoding::DEFLATE;
        }
        return ContentEncoding::UNSUPPORTED;
    }

    std::string inflate_body(std::string_view data, ContentEncoding encoding) {
        switch (encoding) {
            case ContentEncoding::GZIP:
                return inflate_with(data, GZIP_OR_ZLIB_WINDOW, "gzip");
            case ContentEncoding::DEFLATE:
                try {
                    return inflate_with(data, ZLIB_WINDOW, "deflate");
                } catch (const http::http_error::DecompressionError&) {
                    // servers disagree on whether "deflate" carries the zlib header
                    return inflate_with(data, RAW_WINDOW, "deflate");
                }
            case ContentEncoding::IDENTITY:
            case ContentEncoding::UNSUPPORTED:
                break;
        }
        return std::string(data);
    }

    bool decompress_response(http::model::Response& response) {
        if (response.decoded_ || response.body_.empty()) {
            return false;
        }

        const auto header = response.headers_.find("Content-Encoding");
        if (!header) {
            return false;
        }

        const auto encoding = parse_content_encoding(*header);
        if (encoding == ContentEncoding::IDENTITY) {
            return false;
        }
        if (encoding == ContentEncoding::UNSUPPORTED) {
            spdlog::debug("Leaving body with content encoding '{}' as received", *header);
            return false;
        }

        response.body_ = inflate_body(response.body_, encoding);
        response.decoded_ = true;
        return true;
    }
}  // namespace http::response
