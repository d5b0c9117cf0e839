#include "output_writer.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>

#include "../http/response/response_processor.hpp"

namespace executer {
    namespace {
        constexpr const char* BOLD_BLUE = "\033[1;34m";
        constexpr const char* GREEN = "\033[32m";
        constexpr const char* CYAN = "\033[36m";
        constexpr const char* RESET = "\033[0m";

        std::string paint(const std::string& text, const char* color, bool colored) { return colored ? std::string(color) + text + RESET : text; }

        std::string matched_at(const OutputEvent& event) {
            if (!event.response_.effective_url_.empty()) {
                return event.response_.effective_url_;
            }
            return event.request_.url_;
        }
    }  // namespace

    ConsoleWriter::ConsoleWriter(std::ostream& out, const WriterOptions& options) : out_(out), options_(options) {}

    std::string ConsoleWriter::format_text(const OutputEvent& event, bool colored) {
        std::string label = event.template_id_;
        if (event.matcher_ != nullptr && !event.matcher_->name().empty()) {
            label += ":" + event.matcher_->name();
        }

        std::string line = "[" + paint(label, GREEN, colored) + "] [" + paint("http", BOLD_BLUE, colored) + "] " + matched_at(event);

        if (event.extracted_ != nullptr && !event.extracted_->empty()) {
            std::string values;
            for (const auto& value : *event.extracted_) {
                if (!values.empty()) {
                    values += ",";
                }
                values += value;
            }
            line += " [" + paint(values, CYAN, colored) + "]";
        }
        return line;
    }

    std::string ConsoleWriter::format_json(const OutputEvent& event, bool with_requests) {
        nlohmann::json record = {
            {"template", event.template_id_},
            {"type", "http"},
            {"host", event.target_},
            {"matched", matched_at(event)},
            {"status", event.response_.status_},
        };

        if (event.matcher_ != nullptr && !event.matcher_->name().empty()) {
            record["matcher_name"] = event.matcher_->name();
        }
        if (event.extracted_ != nullptr && !event.extracted_->empty()) {
            record["extracted_values"] = *event.extracted_;
        }
        if (!event.request_.meta_.empty()) {
            record["meta"] = event.request_.meta_;
        }
        if (with_requests) {
            record["request"] = http::response::dump_request(event.request_, event.target_);
            record["response"] = http::response::dump_response(event.response_);
        }

        // bodies are arbitrary bytes; invalid UTF-8 becomes U+FFFD instead of failing the dump
        return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    void ConsoleWriter::write(const OutputEvent& event) {
        const auto line = options_.json_ ? format_json(event, options_.json_requests_) : format_text(event, options_.colored_);

        std::lock_guard<std::mutex> lock(mutex_);
        out_ << line << '\n';
        out_.flush();
    }
}  // namespace executer
