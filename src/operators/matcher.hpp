#ifndef REQ_FORGE_MATCHER_HPP
#define REQ_FORGE_MATCHER_HPP

#include <chrono>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "../http/model/model.hpp"

namespace operators {
    enum class MatcherCondition { AND, OR };

    // Which text a word, regex or extractor rule looks at.
    enum class MatchPart { BODY, HEADER, ALL };

    [[nodiscard]] MatcherCondition parse_condition(const std::string& value);
    [[nodiscard]] MatchPart parse_part(const std::string& value);

    // body + headers joined the way the ALL part is matched.
    [[nodiscard]] std::string select_part(MatchPart part, std::string_view body, std::string_view headers);

    class IMatcher {
       public:
        IMatcher() = default;
        virtual ~IMatcher() = default;
        IMatcher(const IMatcher&) = delete;
        virtual IMatcher& operator=(const IMatcher&) = delete;
        IMatcher(IMatcher&&) = delete;
        virtual IMatcher& operator=(IMatcher&&) = delete;

        [[nodiscard]] virtual const std::string& name() const = 0;
        [[nodiscard]] virtual bool match(const http::model::Response& resp, std::string_view body, std::string_view headers,
                                         std::chrono::nanoseconds duration) const = 0;
    };

    class MatcherBase : public IMatcher {
       public:
        MatcherBase(std::string name, bool negative) : name_(std::move(name)), negative_(negative) {}

        [[nodiscard]] const std::string& name() const override { return name_; }

       protected:
        [[nodiscard]] bool result(bool matched) const { return negative_ ? !matched : matched; }

       private:
        std::string name_;
        bool negative_;
    };

    class StatusMatcher : public MatcherBase {
       public:
        StatusMatcher(std::string name, std::vector<long> statuses, bool negative = false);

        [[nodiscard]] bool match(const http::model::Response& resp, std::string_view body, std::string_view headers,
                                 std::chrono::nanoseconds duration) const override;

       private:
        std::vector<long> statuses_;
    };

    // Body length in bytes, after decompression.
    class SizeMatcher : public MatcherBase {
       public:
        SizeMatcher(std::string name, std::vector<size_t> sizes, bool negative = false);

        [[nodiscard]] bool match(const http::model::Response& resp, std::string_view body, std::string_view headers,
                                 std::chrono::nanoseconds duration) const override;

       private:
        std::vector<size_t> sizes_;
    };

    class WordMatcher : public MatcherBase {
       public:
        WordMatcher(std::string name, std::vector<std::string> words, MatchPart part, MatcherCondition condition, bool negative = false);

        [[nodiscard]] bool match(const http::model::Response& resp, std::string_view body, std::string_view headers,
                                 std::chrono::nanoseconds duration) const override;

       private:
        std::vector<std::string> words_;
        MatchPart part_;
        MatcherCondition condition_;
    };

    class RegexMatcher : public MatcherBase {
       public:
        // Throws std::regex_error for an invalid pattern.
        RegexMatcher(std::string name, const std::vector<std::string>& patterns, MatchPart part, MatcherCondition condition, bool negative = false);

        [[nodiscard]] bool match(const http::model::Response& resp, std::string_view body, std::string_view headers,
                                 std::chrono::nanoseconds duration) const override;

       private:
        std::vector<std::regex> patterns_;
        MatchPart part_;
        MatcherCondition condition_;
    };
}  // namespace operators

#endif
