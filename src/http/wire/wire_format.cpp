#include "wire_format.hpp"

#include <cstdlib>
#include <string>
#include <string_view>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "byte_stream.hpp"

namespace http::wire {
    namespace {
        constexpr long STATUS_CONTINUE_MIN = 100;
        constexpr long STATUS_CONTINUE_MAX = 199;
        constexpr long STATUS_NO_CONTENT = 204;
        constexpr long STATUS_NOT_MODIFIED = 304;
        constexpr size_t STATUS_CODE_DIGITS = 3;

        bool has_token(std::string_view list, std::string_view token) {
            for (const auto& item : string_utils::split_comma_delimited_string(list)) {
                if (string_utils::ieq(item, token)) {
                    return true;
                }
            }
            return false;
        }

        size_t parse_chunk_size(const std::string& line) {
            const std::string size_part = string_utils::trim(line.substr(0, line.find(';')));
            if (size_part.empty()) {
                throw http::http_error::WireFormatError("empty chunk size");
            }

            char* end = nullptr;
            const unsigned long long size = std::strtoull(size_part.c_str(), &end, constants::BASE_16);
            if (end == nullptr || *end != '\0') {
                throw http::http_error::WireFormatError("invalid chunk size: " + size_part);
            }
            return static_cast<size_t>(size);
        }
    }  // namespace

    //
    // BufferedReader
    //

    bool BufferedReader::fill() {
        if (offset_ > 0) {
            buffer_.erase(0, offset_);
            offset_ = 0;
        }

        char chunk[constants::READ_CHUNK_SIZE];
        const size_t n = stream_.read_some(chunk, sizeof(chunk));
        if (n == 0) {
            return false;
        }

        buffer_.append(chunk, n);
        return true;
    }

    std::string BufferedReader::read_line() {
        for (;;) {
            const size_t pos = buffer_.find('\n', offset_);
            if (pos != std::string::npos) {
                size_t end = pos;
                if (end > offset_ && buffer_[end - 1] == '\r') {
                    --end;
                }
                std::string line = buffer_.substr(offset_, end - offset_);
                offset_ = pos + 1;
                return line;
            }

            if (!fill()) {
                throw http::http_error::WireFormatError("connection closed before end of line");
            }
        }
    }

    std::string BufferedReader::read_exact(size_t n) {
        while (buffer_.size() - offset_ < n) {
            if (!fill()) {
                throw http::http_error::WireFormatError("connection closed after " + std::to_string(buffer_.size() - offset_) + " of " +
                                                        std::to_string(n) + " body bytes");
            }
        }

        std::string out = buffer_.substr(offset_, n);
        offset_ += n;
        return out;
    }

    std::string BufferedReader::read_to_end() {
        while (fill()) {
        }

        std::string out = buffer_.substr(offset_);
        buffer_.clear();
        offset_ = 0;
        return out;
    }

    //
    // Requests
    //

    std::string normalize_line_endings(std::string_view input) {
        std::string out;
        out.reserve(input.size() + input.size() / 8);

        for (size_t i = 0; i < input.size(); ++i) {
            if (input[i] == '\n' && (i == 0 || input[i - 1] != '\r')) {
                out.push_back('\r');
            }
            out.push_back(input[i]);
        }

        return out;
    }

    std::string serialize_request(std::string_view method, std::string_view path, const http::model::Headers& headers, std::string_view body,
                                  std::string_view host, const SerializeOptions& options) {
        std::string out;
        out.reserve(method.size() + path.size() + body.size() + 256);

        out.append(method).append(" ").append(path.empty() ? "/" : path).append(" HTTP/1.1").append(constants::CRLF);

        if (options.automatic_host_header_ && !headers.contains("Host") && !host.empty()) {
            out.append("Host: ").append(host).append(constants::CRLF);
        }

        for (const auto& [name, value] : headers) {
            out.append(name).append(": ").append(value).append(constants::CRLF);
        }

        if (options.automatic_content_length_ && !body.empty() && !headers.contains("Content-Length") && !headers.contains("Transfer-Encoding")) {
            out.append("Content-Length: ").append(std::to_string(body.size())).append(constants::CRLF);
        }

        out.append(constants::CRLF);
        out.append(body);
        return out;
    }

    //
    // Responses
    //

    http::model::Response read_response_head(BufferedReader& reader) {
        for (;;) {
            std::string status_line = reader.read_line();
            while (status_line.empty()) {
                status_line = reader.read_line();
            }

            if (status_line.rfind("HTTP/", 0) != 0) {
                throw http::http_error::WireFormatError("malformed status line: " + status_line.substr(0, constants::BODY_PREVIEW_LENGTH));
            }

            http::model::Response response;

            const size_t first_space = status_line.find(' ');
            if (first_space == std::string::npos || status_line.size() < first_space + 1 + STATUS_CODE_DIGITS) {
                throw http::http_error::WireFormatError("malformed status line: " + status_line);
            }

            response.protocol_ = status_line.substr(0, first_space);
            const std::string code = status_line.substr(first_space + 1, STATUS_CODE_DIGITS);
            char* end = nullptr;
            response.status_ = std::strtol(code.c_str(), &end, constants::BASE_10);
            if (end == nullptr || *end != '\0') {
                throw http::http_error::WireFormatError("malformed status code: " + code);
            }

            const size_t reason_start = first_space + 1 + STATUS_CODE_DIGITS;
            if (reason_start < status_line.size()) {
                response.reason_ = string_utils::trim(status_line.substr(reason_start));
            }

            std::string last_name;
            for (std::string line = reader.read_line(); !line.empty(); line = reader.read_line()) {
                if ((line[0] == ' ' || line[0] == '\t') && !last_name.empty()) {
                    // obsolete line folding
                    auto previous = response.headers_.find(last_name);
                    response.headers_.set(last_name, std::string(previous.value_or("")) + " " + string_utils::trim(line));
                    continue;
                }

                const size_t colon = line.find(':');
                if (colon == std::string::npos) {
                    throw http::http_error::WireFormatError("malformed header line: " + line);
                }

                last_name = line.substr(0, colon);
                response.headers_.add(last_name, string_utils::trim(line.substr(colon + 1)));
            }

            if (response.status_ >= STATUS_CONTINUE_MIN && response.status_ <= STATUS_CONTINUE_MAX) {
                continue;
            }

            const auto connection = response.headers_.find("Connection");
            if (response.protocol_ == "HTTP/1.0") {
                response.keep_alive_ = connection.has_value() && has_token(*connection, "keep-alive");
            } else {
                response.keep_alive_ = !(connection.has_value() && has_token(*connection, "close"));
            }

            return response;
        }
    }

    void read_response_body(BufferedReader& reader, http::model::Response& response, bool head_request) {
        if (head_request || response.status_ == STATUS_NO_CONTENT || response.status_ == STATUS_NOT_MODIFIED) {
            return;
        }

        const auto transfer_encoding = response.headers_.find("Transfer-Encoding");
        if (transfer_encoding.has_value() && has_token(*transfer_encoding, "chunked")) {
            for (;;) {
                const size_t size = parse_chunk_size(reader.read_line());
                if (size == 0) {
                    // trailers
                    for (std::string line = reader.read_line(); !line.empty(); line = reader.read_line()) {
                    }
                    return;
                }

                response.body_.append(reader.read_exact(size));
                if (!reader.read_line().empty()) {
                    throw http::http_error::WireFormatError("missing CRLF after chunk");
                }
            }
        }

        const auto content_length = response.headers_.find("Content-Length");
        if (content_length.has_value()) {
            const std::string value = string_utils::trim(std::string(*content_length));
            char* end = nullptr;
            const unsigned long long length = std::strtoull(value.c_str(), &end, constants::BASE_10);
            if (value.empty() || end == nullptr || *end != '\0') {
                throw http::http_error::WireFormatError("invalid Content-Length: " + value);
            }
            response.body_ = reader.read_exact(static_cast<size_t>(length));
            return;
        }

        response.body_ = reader.read_to_end();
        response.keep_alive_ = false;
    }
}  // namespace http::wire
