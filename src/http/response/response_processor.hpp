#ifndef REQ_FORGE_RESPONSE_PROCESSOR_HPP
#define REQ_FORGE_RESPONSE_PROCESSOR_HPP

#include <chrono>
#include <string>
#include <string_view>

#include "../model/model.hpp"

namespace http::response {
    // A response flattened for matchers and extractors. body() and headers() are views into storage
    // owned by this object and are valid only while it lives.
    class ProcessedResponse {
       public:
        explicit ProcessedResponse(http::model::Response response);

        [[nodiscard]] const http::model::Response& response() const { return response_; }
        [[nodiscard]] std::string_view body() const { return response_.body_; }
        [[nodiscard]] std::string_view headers() const { return header_text_; }
        [[nodiscard]] std::chrono::nanoseconds duration() const { return response_.duration_; }

       private:
        http::model::Response response_;
        std::string header_text_;
    };

    // Decompresses (DecompressionError on failure) and flattens.
    [[nodiscard]] ProcessedResponse process_response(http::model::Response response);

    // Text renderings used by the debug dumps.
    [[nodiscard]] std::string dump_request(const http::model::Request& req, const std::string& target);
    [[nodiscard]] std::string dump_response(const http::model::Response& resp);
}  // namespace http::response

#endif
