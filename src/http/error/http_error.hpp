#ifndef REQ_FORGE_HTTP_ERROR_HPP
#define REQ_FORGE_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::http_error {
    // Connect, write or read failure on any transmitter.
    struct TransportError : public std::runtime_error {
        int code_;
        std::string url_;
        explicit TransportError(const std::string &msg, std::string u = {}, int code = 0);
    };

    // The peer sent something that is not a valid HTTP/1.x response.
    struct WireFormatError : public std::runtime_error {
        explicit WireFormatError(const std::string &msg) : std::runtime_error(msg) {}
    };

    struct DecompressionError : public std::runtime_error {
        std::string encoding_;
        explicit DecompressionError(std::string encoding, const std::string &msg);
    };

    // "context: cause", the way every per-request failure is reported in a Result.
    std::string wrap(const std::string &context, const std::exception &cause);
}  // namespace http::http_error

#endif
