#ifndef REQ_FORGE_GENERATOR_INTERFACE_HPP
#define REQ_FORGE_GENERATOR_INTERFACE_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../http/model/model.hpp"
#include "../operators/extractor.hpp"
#include "../operators/matcher.hpp"

namespace generator {
    struct GeneratorError : public std::runtime_error {
        explicit GeneratorError(const std::string& msg) : std::runtime_error(msg) {}
    };

    struct GeneratorSettings {
        std::string template_id_;
        int threads_ = 0;
        bool pipeline_ = false;
        int pipeline_max_workers_ = 0;
        bool follow_redirects_ = false;
        int max_redirects_ = 0;

        operators::MatcherCondition matchers_condition_ = operators::MatcherCondition::OR;
        std::vector<std::shared_ptr<const operators::IMatcher> > matchers_;
        std::vector<std::shared_ptr<const operators::IExtractor> > extractors_;
    };

    // Target keyed iterator over concrete requests. The per-target position is owned by the
    // implementation and only reachable through these calls.
    class IRequestGenerator {
       public:
        IRequestGenerator() = default;
        virtual ~IRequestGenerator() = default;
        IRequestGenerator(const IRequestGenerator&) = delete;
        virtual IRequestGenerator& operator=(const IRequestGenerator&) = delete;
        IRequestGenerator(IRequestGenerator&&) = delete;
        virtual IRequestGenerator& operator=(IRequestGenerator&&) = delete;

        [[nodiscard]] virtual bool has_state(const std::string& target) const = 0;
        // False when the target already has a state; creation is atomic with the check.
        virtual bool create_state(const std::string& target) = 0;
        virtual void remove_state(const std::string& target) = 0;

        [[nodiscard]] virtual bool has_next(const std::string& target) const = 0;
        [[nodiscard]] virtual http::model::Payload current(const std::string& target) const = 0;
        virtual void advance(const std::string& target) = 0;

        // Throws GeneratorError when the request cannot be built from these values.
        [[nodiscard]] virtual http::model::Request build_request(const std::string& target, const http::model::Payload& dynamic_values,
                                                                 const http::model::Payload& payload) const = 0;

        [[nodiscard]] virtual size_t total_count() const = 0;
        [[nodiscard]] virtual const GeneratorSettings& settings() const = 0;
    };
}  // namespace generator

#endif
