#include "job_file.hpp"

#include <simdjson.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <limits>
#include <memory>
#include <regex>
#include <string>
#include <type_traits>
#include <utility>

#include "../operators/extractor.hpp"
#include "../operators/matcher.hpp"

namespace config {
    namespace parser {
        template <typename T>
        static T parse_value(simdjson::simdjson_result<T> result, const ParserOptions<T>& options) {
            if (result.error() == simdjson::error_code::NO_SUCH_FIELD && !options.is_required_) {
                return options.fallback_value_;
            }
            if (result.error() != simdjson::error_code::SUCCESS) {
                throw ConfigError(options.error_message_);
            }

            auto value = result.value();

            if (options.allowed_values_.empty()) {
                return T(value);
            }

            if (!std::ranges::any_of(options.allowed_values_, [value](const T& allowed_value) { return allowed_value == value; })) {
                if constexpr (std::is_same_v<T, std::string_view>) {
                    throw ConfigError(options.error_message_ + ": " + std::string(value));
                }
                throw ConfigError(options.error_message_);
            }

            return T(value);
        }

        static int parse_int(simdjson::simdjson_result<int64_t> result, const ParserOptions<int64_t>& options) {
            const auto value = parse_value(std::move(result), options);
            if (value < 0 || value > std::numeric_limits<int>::max()) {
                throw ConfigError(options.error_message_ + ": " + std::to_string(value));
            }
            return static_cast<int>(value);
        }

        template <typename Field>
        static std::vector<std::string> parse_strings(Field&& field, bool is_required, const std::string& error_message) {
            std::vector<std::string> out;

            auto array = field.get_array();
            if (array.error() == simdjson::error_code::NO_SUCH_FIELD && !is_required) {
                return out;
            }
            if (array.error() != simdjson::error_code::SUCCESS) {
                throw ConfigError(error_message);
            }

            for (auto element : array.value()) {
                auto text = element.get_string();
                if (text.error() != simdjson::error_code::SUCCESS) {
                    throw ConfigError(error_message);
                }
                out.emplace_back(text.value());
            }
            return out;
        }

        template <typename Field>
        static std::vector<int64_t> parse_integers(Field&& field, const std::string& error_message) {
            std::vector<int64_t> out;

            auto array = field.get_array();
            if (array.error() != simdjson::error_code::SUCCESS) {
                throw ConfigError(error_message);
            }

            for (auto element : array.value()) {
                auto number = element.get_int64();
                if (number.error() != simdjson::error_code::SUCCESS || number.value() < 0) {
                    throw ConfigError(error_message);
                }
                out.push_back(number.value());
            }
            return out;
        }

        // {"Name": "value", ...} in document order.
        template <typename Field>
        static http::model::Headers parse_headers(Field&& field) {
            http::model::Headers headers;

            auto object = field.get_object();
            if (object.error() == simdjson::error_code::NO_SUCH_FIELD) {
                return headers;
            }
            if (object.error() != simdjson::error_code::SUCCESS) {
                throw ConfigError("Invalid headers");
            }

            for (auto entry : object.value()) {
                simdjson::ondemand::field header;
                if (std::move(entry).get(header) != simdjson::error_code::SUCCESS) {
                    throw ConfigError("Invalid header");
                }
                auto key = header.unescaped_key();
                auto value = header.value().get_string();
                if (key.error() != simdjson::error_code::SUCCESS || value.error() != simdjson::error_code::SUCCESS) {
                    throw ConfigError("Invalid header");
                }
                headers.add(std::string(key.value()), std::string(value.value()));
            }
            return headers;
        }

        static simdjson::ondemand::object as_object(simdjson::simdjson_result<simdjson::ondemand::value> element, const std::string& error_message) {
            auto object = element.get_object();
            if (object.error() != simdjson::error_code::SUCCESS) {
                throw ConfigError(error_message);
            }
            return object.value();
        }
    }  // namespace parser

    namespace {
        void parse_options(simdjson::ondemand::document& doc, JobFile& job) {
            auto& options = job.options_;

            options.timeout_s_ = parser::parse_int(doc["options"]["timeout"].get_int64(), TIMEOUT_PARSER_OPTIONS);
            options.retries_ = parser::parse_int(doc["options"]["retries"].get_int64(), RETRIES_PARSER_OPTIONS);
            options.debug_ = parser::parse_value<bool>(doc["options"]["debug"].get_bool(), FLAG_PARSER_OPTIONS);
            options.json_ = parser::parse_value<bool>(doc["options"]["json"].get_bool(), FLAG_PARSER_OPTIONS);
            options.json_requests_ = parser::parse_value<bool>(doc["options"]["json_requests"].get_bool(), FLAG_PARSER_OPTIONS);
            options.colored_ = parser::parse_value<bool>(doc["options"]["colored"].get_bool(), FLAG_PARSER_OPTIONS);
            options.cookie_reuse_ = parser::parse_value<bool>(doc["options"]["cookie_reuse"].get_bool(), FLAG_PARSER_OPTIONS);
            options.stop_at_first_match_ = parser::parse_value<bool>(doc["options"]["stop_at_first_match"].get_bool(), FLAG_PARSER_OPTIONS);
            options.proxy_url_ = std::string(parser::parse_value(doc["options"]["proxy"].get_string(), PROXY_PARSER_OPTIONS));
            options.proxy_socks_url_ = std::string(parser::parse_value(doc["options"]["proxy_socks"].get_string(), PROXY_PARSER_OPTIONS));
            options.custom_headers_ = parser::parse_strings(doc["options"]["headers"], false, "Invalid custom headers");
            job.rate_limit_ = static_cast<size_t>(parser::parse_int(doc["options"]["rate_limit"].get_int64(), RATE_LIMIT_PARSER_OPTIONS));

            if (options.timeout_s_ == 0) {
                throw ConfigError("Invalid timeout: 0");
            }
        }

        generator::RequestTemplate parse_template(simdjson::ondemand::object obj) {
            generator::RequestTemplate tmpl;

            tmpl.raw_ = std::string(parser::parse_value(obj["raw"].get_string(), TEMPLATE_TEXT_PARSER_OPTIONS));
            tmpl.method_ = std::string(parser::parse_value(obj["method"].get_string(), METHOD_PARSER_OPTIONS));
            tmpl.path_ = std::string(parser::parse_value(obj["path"].get_string(), TEMPLATE_TEXT_PARSER_OPTIONS));
            tmpl.headers_ = parser::parse_headers(obj["headers"]);
            tmpl.body_ = std::string(parser::parse_value(obj["body"].get_string(), TEMPLATE_TEXT_PARSER_OPTIONS));
            tmpl.unsafe_ = parser::parse_value<bool>(obj["unsafe"].get_bool(), FLAG_PARSER_OPTIONS);
            tmpl.automatic_content_length_ = !parser::parse_value<bool>(obj["disable_automatic_content_length"].get_bool(), FLAG_PARSER_OPTIONS);
            tmpl.automatic_host_header_ = !parser::parse_value<bool>(obj["disable_automatic_host"].get_bool(), FLAG_PARSER_OPTIONS);

            if (tmpl.raw_.empty() && tmpl.path_.empty()) {
                throw ConfigError("Request template needs either a path or a raw request");
            }
            return tmpl;
        }

        std::shared_ptr<const operators::IMatcher> parse_matcher(simdjson::ondemand::object obj) {
            const std::string type(parser::parse_value(obj["type"].get_string(), MATCHER_TYPE_PARSER_OPTIONS));
            std::string name(parser::parse_value(obj["name"].get_string(), NAME_PARSER_OPTIONS));
            if (name.empty()) {
                name = type;
            }
            const bool negative = parser::parse_value<bool>(obj["negative"].get_bool(), FLAG_PARSER_OPTIONS);
            const auto part = operators::parse_part(std::string(parser::parse_value(obj["part"].get_string(), PART_PARSER_OPTIONS)));
            const auto condition = operators::parse_condition(std::string(parser::parse_value(obj["condition"].get_string(), CONDITION_PARSER_OPTIONS)));

            if (type == "status") {
                const auto raw = parser::parse_integers(obj["status"], "Invalid status list for matcher " + name);
                return std::make_shared<operators::StatusMatcher>(name, std::vector<long>(raw.begin(), raw.end()), negative);
            }
            if (type == "size") {
                const auto raw = parser::parse_integers(obj["size"], "Invalid size list for matcher " + name);
                std::vector<size_t> sizes;
                std::transform(raw.begin(), raw.end(), std::back_inserter(sizes), [](int64_t v) { return static_cast<size_t>(v); });
                return std::make_shared<operators::SizeMatcher>(name, std::move(sizes), negative);
            }
            if (type == "word") {
                return std::make_shared<operators::WordMatcher>(name, parser::parse_strings(obj["words"], true, "Invalid words for matcher " + name), part,
                                                                condition, negative);
            }

            try {
                return std::make_shared<operators::RegexMatcher>(name, parser::parse_strings(obj["regex"], true, "Invalid regex list for matcher " + name),
                                                                 part, condition, negative);
            } catch (const std::regex_error& e) {
                throw ConfigError("Invalid regex for matcher " + name + ": " + e.what());
            }
        }

        std::shared_ptr<const operators::IExtractor> parse_extractor(simdjson::ondemand::object obj) {
            const std::string type(parser::parse_value(obj["type"].get_string(), EXTRACTOR_TYPE_PARSER_OPTIONS));
            std::string name(parser::parse_value(obj["name"].get_string(), NAME_PARSER_OPTIONS));
            if (name.empty()) {
                name = type;
            }
            const bool internal = parser::parse_value<bool>(obj["internal"].get_bool(), FLAG_PARSER_OPTIONS);

            if (type == "kval") {
                return std::make_shared<operators::KValExtractor>(name, parser::parse_strings(obj["kval"], true, "Invalid kval keys for extractor " + name),
                                                                  internal);
            }

            const auto group = static_cast<size_t>(parser::parse_int(obj["group"].get_int64(), GROUP_PARSER_OPTIONS));
            const auto part = operators::parse_part(std::string(parser::parse_value(obj["part"].get_string(), PART_PARSER_OPTIONS)));
            try {
                return std::make_shared<operators::RegexExtractor>(name, parser::parse_strings(obj["regex"], true, "Invalid regex list for extractor " + name),
                                                                   group, part, internal);
            } catch (const std::regex_error& e) {
                throw ConfigError("Invalid regex for extractor " + name + ": " + e.what());
            }
        }

        void parse_requests(simdjson::ondemand::document& doc, JobFile& job) {
            auto& settings = job.settings_;

            settings.template_id_ = job.id_;
            settings.threads_ = parser::parse_int(doc["requests"]["threads"].get_int64(), THREADS_PARSER_OPTIONS);
            settings.pipeline_ = parser::parse_value<bool>(doc["requests"]["pipeline"].get_bool(), FLAG_PARSER_OPTIONS);
            settings.pipeline_max_workers_ = parser::parse_int(doc["requests"]["pipeline_max_workers"].get_int64(), PIPELINE_MAX_WORKERS_PARSER_OPTIONS);
            settings.follow_redirects_ = parser::parse_value<bool>(doc["requests"]["redirects"].get_bool(), FLAG_PARSER_OPTIONS);
            settings.max_redirects_ = parser::parse_int(doc["requests"]["max_redirects"].get_int64(), MAX_REDIRECTS_PARSER_OPTIONS);
            settings.matchers_condition_ =
                operators::parse_condition(std::string(parser::parse_value(doc["requests"]["matchers_condition"].get_string(), CONDITION_PARSER_OPTIONS)));

            try {
                job.attack_ = generator::parse_attack_type(std::string(parser::parse_value(doc["requests"]["attack"].get_string(), ATTACK_PARSER_OPTIONS)));
            } catch (const generator::GeneratorError& e) {
                throw ConfigError(e.what());
            }

            auto payloads = doc["requests"]["payloads"].get_object();
            if (payloads.error() == simdjson::error_code::SUCCESS) {
                for (auto entry : payloads.value()) {
                    simdjson::ondemand::field payload;
                    if (std::move(entry).get(payload) != simdjson::error_code::SUCCESS) {
                        throw ConfigError("Invalid payload");
                    }
                    auto key = payload.unescaped_key();
                    if (key.error() != simdjson::error_code::SUCCESS) {
                        throw ConfigError("Invalid payload name");
                    }
                    const std::string name(key.value());
                    job.payloads_[name] = parser::parse_strings(payload.value(), true, "Invalid payload values for " + name);
                }
            } else if (payloads.error() != simdjson::error_code::NO_SUCH_FIELD) {
                throw ConfigError("Invalid payloads");
            }

            auto templates = doc["requests"]["templates"].get_array();
            if (templates.error() != simdjson::error_code::SUCCESS) {
                throw ConfigError("Invalid request templates");
            }
            for (auto element : templates.value()) {
                job.templates_.push_back(parse_template(parser::as_object(element, "Invalid request template")));
            }
            if (job.templates_.empty()) {
                throw ConfigError("At least one request template is required");
            }

            auto matchers = doc["requests"]["matchers"].get_array();
            if (matchers.error() == simdjson::error_code::SUCCESS) {
                for (auto element : matchers.value()) {
                    settings.matchers_.push_back(parse_matcher(parser::as_object(element, "Invalid matcher")));
                }
            } else if (matchers.error() != simdjson::error_code::NO_SUCH_FIELD) {
                throw ConfigError("Invalid matchers");
            }

            auto extractors = doc["requests"]["extractors"].get_array();
            if (extractors.error() == simdjson::error_code::SUCCESS) {
                for (auto element : extractors.value()) {
                    settings.extractors_.push_back(parse_extractor(parser::as_object(element, "Invalid extractor")));
                }
            } else if (extractors.error() != simdjson::error_code::NO_SUCH_FIELD) {
                throw ConfigError("Invalid extractors");
            }
        }

        JobFile parse_document(simdjson::ondemand::document& doc) {
            JobFile job;

            job.id_ = std::string(parser::parse_value(doc["id"].get_string(), ID_PARSER_OPTIONS));
            job.targets_ = parser::parse_strings(doc["targets"], false, "Invalid targets");

            parse_options(doc, job);
            parse_requests(doc, job);

            return job;
        }
    }  // namespace

    JobFile parse_job(std::string_view json) {
        simdjson::ondemand::parser json_parser;
        simdjson::padded_string padded(json);

        auto doc = json_parser.iterate(padded);
        if (doc.error() != simdjson::error_code::SUCCESS) {
            throw ConfigError(std::string("Malformed job file: ") + simdjson::error_message(doc.error()));
        }

        try {
            return parse_document(doc.value());
        } catch (const simdjson::simdjson_error& e) {
            throw ConfigError(std::string("Malformed job file: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }

    JobFile load_job_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw ConfigError("Job file not found: " + path.string());
        }

        simdjson::padded_string json;
        if (simdjson::padded_string::load(path.string()).get(json) != simdjson::error_code::SUCCESS) {
            throw ConfigError("Could not read job file: " + path.string());
        }

        return parse_job(std::string_view(json.data(), json.size()));
    }
}  // namespace config
