#include "matcher.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "../utils/string_utils.hpp"

namespace operators {
    MatcherCondition parse_condition(const std::string& value) {
        const auto lowered = string_utils::to_lower(value);
        if (lowered.empty() || lowered == "or") {
            return MatcherCondition::OR;
        }
        if (lowered == "and") {
            return MatcherCondition::AND;
        }
        throw std::invalid_argument("unknown matcher condition: " + value);
    }

    MatchPart parse_part(const std::string& value) {
        const auto lowered = string_utils::to_lower(value);
        if (lowered.empty() || lowered == "body") {
            return MatchPart::BODY;
        }
        if (lowered == "header") {
            return MatchPart::HEADER;
        }
        if (lowered == "all") {
            return MatchPart::ALL;
        }
        throw std::invalid_argument("unknown match part: " + value);
    }

    std::string select_part(MatchPart part, std::string_view body, std::string_view headers) {
        switch (part) {
            case MatchPart::BODY:
                return std::string(body);
            case MatchPart::HEADER:
                return std::string(headers);
            case MatchPart::ALL:
                break;
        }
        std::string all;
        all.reserve(headers.size() + body.size());
        all.append(headers).append(body);
        return all;
    }

    namespace {
        // The ALL part is the only one that needs a joined copy.
        template <typename Fn>
        bool with_part(MatchPart part, std::string_view body, std::string_view headers, Fn&& fn) {
            if (part == MatchPart::BODY) {
                return fn(body);
            }
            if (part == MatchPart::HEADER) {
                return fn(headers);
            }
            const auto all = select_part(part, body, headers);
            return fn(std::string_view(all));
        }

        template <typename Items, typename Pred>
        bool combine(const Items& items, MatcherCondition condition, Pred&& pred) {
            if (condition == MatcherCondition::AND) {
                return !items.empty() && std::all_of(items.begin(), items.end(), pred);
            }
            return std::any_of(items.begin(), items.end(), pred);
        }
    }  // namespace

    StatusMatcher::StatusMatcher(std::string name, std::vector<long> statuses, bool negative)
        : MatcherBase(std::move(name), negative), statuses_(std::move(statuses)) {}

    bool StatusMatcher::match(const http::model::Response& resp, std::string_view /*body*/, std::string_view /*headers*/,
                              std::chrono::nanoseconds /*duration*/) const {
        return result(std::find(statuses_.begin(), statuses_.end(), resp.status_) != statuses_.end());
    }

    SizeMatcher::SizeMatcher(std::string name, std::vector<size_t> sizes, bool negative) : MatcherBase(std::move(name), negative), sizes_(std::move(sizes)) {}

    bool SizeMatcher::match(const http::model::Response& /*resp*/, std::string_view body, std::string_view /*headers*/,
                            std::chrono::nanoseconds /*duration*/) const {
        return result(std::find(sizes_.begin(), sizes_.end(), body.size()) != sizes_.end());
    }

    WordMatcher::WordMatcher(std::string name, std::vector<std::string> words, MatchPart part, MatcherCondition condition, bool negative)
        : MatcherBase(std::move(name), negative), words_(std::move(words)), part_(part), condition_(condition) {}

    bool WordMatcher::match(const http::model::Response& /*resp*/, std::string_view body, std::string_view headers,
                            std::chrono::nanoseconds /*duration*/) const {
        const bool matched = with_part(part_, body, headers, [this](std::string_view corpus) {
            return combine(words_, condition_, [corpus](const std::string& word) { return corpus.find(word) != std::string_view::npos; });
        });
        return result(matched);
    }

    RegexMatcher::RegexMatcher(std::string name, const std::vector<std::string>& patterns, MatchPart part, MatcherCondition condition, bool negative)
        : MatcherBase(std::move(name), negative), part_(part), condition_(condition) {
        patterns_.reserve(patterns.size());
        for (const auto& pattern : patterns) {
            patterns_.emplace_back(pattern, std::regex::ECMAScript);
        }
    }

    bool RegexMatcher::match(const http::model::Response& /*resp*/, std::string_view body, std::string_view headers,
                             std::chrono::nanoseconds /*duration*/) const {
        const bool matched = with_part(part_, body, headers, [this](std::string_view corpus) {
            return combine(patterns_, condition_, [corpus](const std::regex& re) { return std::regex_search(corpus.begin(), corpus.end(), re); });
        });
        return result(matched);
    }
}  // namespace operators
