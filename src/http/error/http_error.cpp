#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace http::http_error {
    TransportError::TransportError(const std::string &msg,
                                   std::string u,  // NOLINT(bugprone-easily-swappable-parameters)
                                   int code) : std::runtime_error(msg), code_(code), url_(std::move(u)) {}

    DecompressionError::DecompressionError(std::string encoding, const std::string &msg)
        : std::runtime_error(encoding + ": " + msg), encoding_(std::move(encoding)) {}

    std::string wrap(const std::string &context, const std::exception &cause) { return context + ": " + cause.what(); }
}  // namespace http::http_error
