#include "bulk_generator.hpp"

#include <algorithm>
#include <string>

#include "../http/model/url.hpp"
#include "../utils/string_utils.hpp"

namespace generator {
    namespace {
        std::vector<http::model::Payload> cluster_bomb(const PayloadSets& payloads) {
            std::vector<http::model::Payload> out{{}};
            for (const auto& [name, values] : payloads) {
                std::vector<http::model::Payload> next;
                next.reserve(out.size() * values.size());
                for (const auto& partial : out) {
                    for (const auto& value : values) {
                        auto combo = partial;
                        combo[name] = value;
                        next.push_back(std::move(combo));
                    }
                }
                out = std::move(next);
            }
            return out;
        }

        std::vector<http::model::Payload> pitchfork(const PayloadSets& payloads) {
            if (payloads.empty()) {
                return {{}};
            }

            const size_t length = payloads.begin()->second.size();
            for (const auto& [name, values] : payloads) {
                if (values.size() != length) {
                    throw GeneratorError("pitchfork payload '" + name + "' has " + std::to_string(values.size()) + " values, expected " + std::to_string(length));
                }
            }

            std::vector<http::model::Payload> out(length);
            for (size_t i = 0; i < length; ++i) {
                for (const auto& [name, values] : payloads) {
                    out[i][name] = values[i];
                }
            }
            return out;
        }

        std::string trim_trailing_slash(std::string s) {
            while (s.size() > 1 && s.back() == '/') {
                s.pop_back();
            }
            return s;
        }

        http::model::Payload target_values(const std::string& target) {
            const auto url = http::model::parse_url(target);
            if (!url) {
                throw GeneratorError("could not parse target URL: " + target);
            }

            const auto base = trim_trailing_slash(target);
            auto path = url->path_ == "/" ? std::string{} : trim_trailing_slash(url->path_);

            return {
                {"BaseURL", base},
                {"RootURL", url->root()},
                {"Hostname", url->authority()},
                {"Path", path},
            };
        }

        std::string resolve(std::string_view text, const http::model::Payload& values) {
            auto out = string_utils::replace_placeholders(text, values);

            const auto open = out.find("{{");
            if (open != std::string::npos) {
                const auto close = out.find("}}", open);
                if (close != std::string::npos) {
                    throw GeneratorError("unresolved placeholder " + out.substr(open, close - open + 2));
                }
            }
            return out;
        }
    }  // namespace

    AttackType parse_attack_type(const std::string& value) {
        const auto lowered = string_utils::to_lower(value);
        if (lowered.empty() || lowered == "clusterbomb") {
            return AttackType::CLUSTERBOMB;
        }
        if (lowered == "pitchfork") {
            return AttackType::PITCHFORK;
        }
        throw GeneratorError("unknown attack type: " + value);
    }

    RawRequest parse_raw_request(const std::string& raw) {
        RawRequest out;

        size_t pos = 0;
        auto next_line = [&raw, &pos]() -> std::optional<std::string> {
            if (pos >= raw.size()) {
                return std::nullopt;
            }
            auto end = raw.find('\n', pos);
            if (end == std::string::npos) {
                end = raw.size();
            }
            std::string line = raw.substr(pos, end - pos);
            pos = end + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        };

        // leading blank lines are common in templates
        std::optional<std::string> request_line;
        do {
            request_line = next_line();
        } while (request_line && string_utils::trim(*request_line).empty());

        if (!request_line) {
            throw GeneratorError("raw request is empty");
        }

        const auto first = request_line->find(' ');
        const auto second = first == std::string::npos ? first : request_line->find(' ', first + 1);
        if (first == std::string::npos) {
            throw GeneratorError("malformed raw request line: " + *request_line);
        }
        out.method_ = request_line->substr(0, first);
        out.path_ = request_line->substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);

        while (auto line = next_line()) {
            if (line->empty()) {
                break;
            }
            const auto colon = line->find(':');
            if (colon == std::string::npos) {
                continue;
            }
            out.headers_.add(string_utils::trim(line->substr(0, colon)), string_utils::trim(line->substr(colon + 1)));
        }

        out.body_ = pos < raw.size() ? raw.substr(pos) : std::string{};
        return out;
    }

    BulkGenerator::BulkGenerator(GeneratorSettings settings, std::vector<RequestTemplate> templates, const PayloadSets& payloads, AttackType attack)
        : settings_(std::move(settings)), templates_(std::move(templates)), combinations_(attack == AttackType::PITCHFORK ? pitchfork(payloads) : cluster_bomb(payloads)) {}

    bool BulkGenerator::has_state(const std::string& target) const {
        std::lock_guard<std::mutex> lock(states_mutex_);
        return states_.contains(target);
    }

    bool BulkGenerator::create_state(const std::string& target) {
        std::lock_guard<std::mutex> lock(states_mutex_);
        return states_.try_emplace(target).second;
    }

    void BulkGenerator::remove_state(const std::string& target) {
        std::lock_guard<std::mutex> lock(states_mutex_);
        states_.erase(target);
    }

    const BulkGenerator::State& BulkGenerator::state_of(const std::string& target) const {
        auto it = states_.find(target);
        if (it == states_.end()) {
            throw GeneratorError("no generator state for " + target);
        }
        return it->second;
    }

    bool BulkGenerator::has_next(const std::string& target) const {
        std::lock_guard<std::mutex> lock(states_mutex_);
        return state_of(target).position_ < total_count();
    }

    http::model::Payload BulkGenerator::current(const std::string& target) const {
        std::lock_guard<std::mutex> lock(states_mutex_);
        const auto position = state_of(target).position_;
        if (position >= total_count()) {
            throw GeneratorError("generator for " + target + " is exhausted");
        }
        return combinations_[position % combinations_.size()];
    }

    void BulkGenerator::advance(const std::string& target) {
        std::lock_guard<std::mutex> lock(states_mutex_);
        auto it = states_.find(target);
        if (it == states_.end()) {
            throw GeneratorError("no generator state for " + target);
        }
        ++it->second.position_;
    }

    http::model::Request BulkGenerator::build_request(const std::string& target, const http::model::Payload& dynamic_values,
                                                      const http::model::Payload& payload) const {
        size_t position = 0;
        {
            std::lock_guard<std::mutex> lock(states_mutex_);
            position = state_of(target).position_;
        }
        if (position >= total_count()) {
            throw GeneratorError("generator for " + target + " is exhausted");
        }
        const auto& tmpl = templates_[position / combinations_.size()];

        auto values = target_values(target);
        for (const auto& [key, value] : payload) {
            values[key] = value;
        }
        for (const auto& [key, value] : dynamic_values) {
            values.try_emplace(key, value);
        }

        http::model::Request req;
        req.meta_ = payload;
        req.automatic_content_length_ = tmpl.automatic_content_length_;
        req.automatic_host_header_ = tmpl.automatic_host_header_;

        if (tmpl.raw_.empty()) {
            req.method_ = tmpl.method_;
            req.url_ = resolve(tmpl.path_, values);
            for (const auto& [name, value] : tmpl.headers_) {
                req.headers_.add(resolve(name, values), resolve(value, values));
            }
            req.body_ = resolve(tmpl.body_, values);
            return req;
        }

        auto raw = parse_raw_request(resolve(tmpl.raw_, values));
        req.method_ = std::move(raw.method_);
        req.headers_ = std::move(raw.headers_);
        req.body_ = std::move(raw.body_);

        if (auto absolute = http::model::parse_url(raw.path_)) {
            req.path_ = absolute->request_target();
        } else {
            req.path_ = raw.path_.empty() ? "/" : raw.path_;
        }

        if (settings_.pipeline_) {
            req.mode_ = http::model::TransmissionMode::PIPELINED;
            req.url_ = trim_trailing_slash(target);
        } else if (tmpl.unsafe_) {
            req.mode_ = http::model::TransmissionMode::RAW;
            req.url_ = trim_trailing_slash(target);
        } else {
            const auto url = http::model::parse_url(target);
            req.url_ = url->root() + req.path_;
        }
        return req;
    }
}  // namespace generator
