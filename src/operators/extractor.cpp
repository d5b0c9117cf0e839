#include "extractor.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "../utils/string_utils.hpp"

namespace operators {
    namespace {
        class RegexStream : public ExtractionStream {
           public:
            RegexStream(const std::vector<std::regex>& patterns, size_t group, std::string owned, std::string_view corpus)
                : patterns_(patterns), group_(group), owned_(std::move(owned)), corpus_(owned_.empty() ? corpus : std::string_view(owned_)) {}

            std::optional<std::string> next() override {
                for (;;) {
                    if (current_ == end_) {
                        if (pattern_index_ >= patterns_.size()) {
                            return std::nullopt;
                        }
                        current_ = std::cregex_iterator(corpus_.data(), corpus_.data() + corpus_.size(), patterns_[pattern_index_++]);
                        continue;
                    }

                    const auto& m = *current_;
                    ++current_;

                    if (group_ >= m.size() || !m[group_].matched) {
                        continue;
                    }
                    auto value = m[group_].str();
                    if (seen_.insert(value).second) {
                        return value;
                    }
                }
            }

           private:
            const std::vector<std::regex>& patterns_;
            size_t group_;
            std::string owned_;
            std::string_view corpus_;
            size_t pattern_index_ = 0;
            std::cregex_iterator current_;
            std::cregex_iterator end_;
            std::set<std::string> seen_;
        };

        std::string normalize_key(std::string_view key) {
            auto out = string_utils::to_lower(key);
            std::replace(out.begin(), out.end(), '-', '_');
            return out;
        }

        class KValStream : public ExtractionStream {
           public:
            KValStream(const std::vector<std::string>& keys, const http::model::Headers& headers) : keys_(keys), headers_(headers) {}

            std::optional<std::string> next() override {
                while (key_index_ < keys_.size()) {
                    const auto wanted = normalize_key(keys_[key_index_++]);
                    for (const auto& [name, value] : headers_) {
                        if (normalize_key(name) == wanted && seen_.insert(value).second) {
                            return value;
                        }
                    }
                }
                return std::nullopt;
            }

           private:
            const std::vector<std::string>& keys_;
            const http::model::Headers& headers_;
            size_t key_index_ = 0;
            std::set<std::string> seen_;
        };
    }  // namespace

    RegexExtractor::RegexExtractor(std::string name, const std::vector<std::string>& patterns, size_t group, MatchPart part, bool internal)
        : ExtractorBase(std::move(name), internal), group_(group), part_(part) {
        patterns_.reserve(patterns.size());
        for (const auto& pattern : patterns) {
            patterns_.emplace_back(pattern, std::regex::ECMAScript);
        }
    }

    std::unique_ptr<ExtractionStream> RegexExtractor::extract(const http::model::Response& /*resp*/, std::string_view body, std::string_view headers) const {
        if (part_ == MatchPart::ALL) {
            return std::make_unique<RegexStream>(patterns_, group_, select_part(part_, body, headers), std::string_view{});
        }
        return std::make_unique<RegexStream>(patterns_, group_, std::string{}, part_ == MatchPart::BODY ? body : headers);
    }

    KValExtractor::KValExtractor(std::string name, std::vector<std::string> keys, bool internal) : ExtractorBase(std::move(name), internal), keys_(std::move(keys)) {}

    std::unique_ptr<ExtractionStream> KValExtractor::extract(const http::model::Response& resp, std::string_view /*body*/, std::string_view /*headers*/) const {
        return std::make_unique<KValStream>(keys_, resp.headers_);
    }
}  // namespace operators
