#ifndef REQ_FORGE_EVALUATOR_HPP
#define REQ_FORGE_EVALUATOR_HPP

#include <string>

#include "../generator/interface.hpp"
#include "../http/model/model.hpp"
#include "../http/response/response_processor.hpp"
#include "output_writer.hpp"
#include "result.hpp"

namespace executer {
    struct EvaluationContext {
        const std::string& target_;
        const generator::GeneratorSettings& settings_;
        ResultAccumulator& result_;
        DynamicValues& dynamic_values_;
        IOutputWriter& writer_;
    };

    // Matchers first, in order. AND stops at the first miss and skips extraction; OR reports every
    // hit on its own. Extractors then run in order and a final write is made when non-internal values
    // came out or the condition is AND.
    void evaluate(const http::model::Request& req, const http::response::ProcessedResponse& resp, const EvaluationContext& ctx);
}  // namespace executer

#endif
