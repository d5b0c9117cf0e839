#ifndef REQ_FORGE_EXTRACTOR_HPP
#define REQ_FORGE_EXTRACTOR_HPP

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "../http/model/model.hpp"
#include "matcher.hpp"

namespace operators {
    // Single pass over one response. Values are produced on demand and the stream cannot be rewound.
    class ExtractionStream {
       public:
        ExtractionStream() = default;
        virtual ~ExtractionStream() = default;
        ExtractionStream(const ExtractionStream&) = delete;
        ExtractionStream& operator=(const ExtractionStream&) = delete;
        ExtractionStream(ExtractionStream&&) = delete;
        ExtractionStream& operator=(ExtractionStream&&) = delete;

        virtual std::optional<std::string> next() = 0;
    };

    class IExtractor {
       public:
        IExtractor() = default;
        virtual ~IExtractor() = default;
        IExtractor(const IExtractor&) = delete;
        virtual IExtractor& operator=(const IExtractor&) = delete;
        IExtractor(IExtractor&&) = delete;
        virtual IExtractor& operator=(IExtractor&&) = delete;

        [[nodiscard]] virtual const std::string& name() const = 0;
        // Internal values feed dynamic values but are never shown to the user.
        [[nodiscard]] virtual bool internal() const = 0;

        // The stream borrows body and headers; it must not outlive them.
        [[nodiscard]] virtual std::unique_ptr<ExtractionStream> extract(const http::model::Response& resp, std::string_view body,
                                                                        std::string_view headers) const = 0;
    };

    class ExtractorBase : public IExtractor {
       public:
        ExtractorBase(std::string name, bool internal) : name_(std::move(name)), internal_(internal) {}

        [[nodiscard]] const std::string& name() const override { return name_; }
        [[nodiscard]] bool internal() const override { return internal_; }

       private:
        std::string name_;
        bool internal_;
    };

    // Yields capture group `group` (0 for the whole match) of every match of every pattern, each
    // distinct value once.
    class RegexExtractor : public ExtractorBase {
       public:
        RegexExtractor(std::string name, const std::vector<std::string>& patterns, size_t group, MatchPart part, bool internal = false);

        [[nodiscard]] std::unique_ptr<ExtractionStream> extract(const http::model::Response& resp, std::string_view body,
                                                                std::string_view headers) const override;

       private:
        std::vector<std::regex> patterns_;
        size_t group_;
        MatchPart part_;
    };

    // Looks keys up among the response headers. "content_type" finds "Content-Type".
    class KValExtractor : public ExtractorBase {
       public:
        KValExtractor(std::string name, std::vector<std::string> keys, bool internal = false);

        [[nodiscard]] std::unique_ptr<ExtractionStream> extract(const http::model::Response& resp, std::string_view body,
                                                                std::string_view headers) const override;

       private:
        std::vector<std::string> keys_;
    };
}  // namespace operators

#endif
