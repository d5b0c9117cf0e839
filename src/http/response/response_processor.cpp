#include "response_processor.hpp"

#include <string>

#include "../model/url.hpp"
#include "decompress.hpp"

namespace http::response {
    ProcessedResponse::ProcessedResponse(http::model::Response response) : response_(std::move(response)), header_text_(response_.headers_.to_text()) {}

    ProcessedResponse process_response(http::model::Response response) {
        decompress_response(response);
        return ProcessedResponse(std::move(response));
    }

    std::string dump_request(const http::model::Request& req, const std::string& target) {
        std::string out;

        if (req.mode_ == http::model::TransmissionMode::STANDARD) {
            const auto url = http::model::parse_url(req.url_);
            out.append(req.method_).append(" ").append(url ? url->request_target() : req.url_).append(" HTTP/1.1\r\n");
            if (url && !req.headers_.contains("Host")) {
                out.append("Host: ").append(url->authority()).append("\r\n");
            }
        } else {
            out.append(req.method_).append(" ").append(req.path_).append(" HTTP/1.1\r\n");
            const auto url = http::model::parse_url(target);
            if (url && req.automatic_host_header_ && !req.headers_.contains("Host")) {
                out.append("Host: ").append(url->authority()).append("\r\n");
            }
        }

        for (const auto& [name, value] : req.headers_) {
            out.append(name).append(": ").append(value).append("\r\n");
        }
        out.append("\r\n").append(req.body_);
        return out;
    }

    std::string dump_response(const http::model::Response& resp) {
        std::string out;
        out.append(resp.protocol_.empty() ? "HTTP/1.1" : resp.protocol_).append(" ").append(std::to_string(resp.status_));
        if (!resp.reason_.empty()) {
            out.append(" ").append(resp.reason_);
        }
        out.append("\r\n");

        for (const auto& [name, value] : resp.headers_) {
            out.append(name).append(": ").append(value).append("\r\n");
        }
        out.append("\r\n").append(resp.body_);
        return out;
    }
}  // namespace http::response
