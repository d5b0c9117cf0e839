#include "evaluator.hpp"

#include <string>
#include <vector>

namespace executer {
    void evaluate(const http::model::Request& req, const http::response::ProcessedResponse& resp, const EvaluationContext& ctx) {
        const auto condition = ctx.settings_.matchers_condition_;

        for (const auto& matcher : ctx.settings_.matchers_) {
            if (!matcher->match(resp.response(), resp.body(), resp.headers(), resp.duration())) {
                if (condition == operators::MatcherCondition::AND) {
                    return;
                }
                continue;
            }

            if (condition == operators::MatcherCondition::OR) {
                ctx.result_.record_match(matcher->name(), req.meta_);
                ctx.writer_.write(OutputEvent{
                    .template_id_ = ctx.settings_.template_id_,
                    .target_ = ctx.target_,
                    .request_ = req,
                    .response_ = resp.response(),
                    .body_ = resp.body(),
                    .matcher_ = matcher.get(),
                });
            }
        }

        std::vector<std::string> output;
        for (const auto& extractor : ctx.settings_.extractors_) {
            std::vector<std::string> values;

            auto stream = extractor->extract(resp.response(), resp.body(), resp.headers());
            while (auto value = stream->next()) {
                ctx.dynamic_values_.try_set(extractor->name(), *value);
                if (!extractor->internal()) {
                    output.push_back(*value);
                }
                values.push_back(std::move(*value));
            }

            if (!values.empty()) {
                ctx.result_.append_extractions(extractor->name(), values, req.meta_);
            }
        }

        if (!output.empty() || condition == operators::MatcherCondition::AND) {
            ctx.writer_.write(OutputEvent{
                .template_id_ = ctx.settings_.template_id_,
                .target_ = ctx.target_,
                .request_ = req,
                .response_ = resp.response(),
                .body_ = resp.body(),
                .extracted_ = &output,
            });
            ctx.result_.mark_got_results();
        }
    }
}  // namespace executer
