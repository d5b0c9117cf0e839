#ifndef REQ_FORGE_STRATEGY_HPP
#define REQ_FORGE_STRATEGY_HPP

#include <functional>
#include <memory>
#include <string>

#include "../generator/interface.hpp"
#include "../http/client/interface.hpp"
#include "../http/model/model.hpp"
#include "progress.hpp"
#include "rate_limiter.hpp"
#include "result.hpp"

namespace executer {
    enum class Strategy { SERIAL, PARALLEL, PIPELINED };

    // Pipelining wins over a worker pool, a worker pool over serial execution.
    [[nodiscard]] Strategy select_strategy(const generator::GeneratorSettings& settings);
    [[nodiscard]] const char* to_string(Strategy strategy);

    // Everything one execute() call shares between the dispatching thread and its tasks.
    struct ExecutionContext {
        const std::string& target_;
        generator::IRequestGenerator& generator_;
        IRateLimiter& rate_limiter_;
        IProgress& progress_;
        ResultAccumulator& result_;
        DynamicValues& dynamic_values_;
        bool stop_at_first_match_ = false;

        // Transmits and evaluates one request; throws when any step fails.
        std::function<void(http::model::Request&)> handle_;
        http::client::PipelineClientFactory pipeline_factory_;
    };

    // Drives the generator for one target. Generator calls and request building stay on the
    // calling thread; only handle_ may run elsewhere.
    class IExecutionStrategy {
       public:
        IExecutionStrategy() = default;
        virtual ~IExecutionStrategy() = default;
        IExecutionStrategy(const IExecutionStrategy&) = delete;
        IExecutionStrategy& operator=(const IExecutionStrategy&) = delete;
        IExecutionStrategy(IExecutionStrategy&&) = delete;
        IExecutionStrategy& operator=(IExecutionStrategy&&) = delete;

        virtual void run(ExecutionContext& ctx) = 0;
    };

    // Inline on the calling thread, one rate limiter token per request, ticks progress and honours
    // stop at first match.
    class SerialStrategy : public IExecutionStrategy {
       public:
        void run(ExecutionContext& ctx) override;
    };

    // Worker pool of settings.threads_. Every task takes a rate limiter token. Always exhausts the
    // generator once started.
    class ParallelStrategy : public IExecutionStrategy {
       public:
        void run(ExecutionContext& ctx) override;
    };

    // One pipeline client per call, pipeline_max_workers_ connections (default 1) and workers
    // (default 150). Never rate limited.
    class PipelinedStrategy : public IExecutionStrategy {
       public:
        void run(ExecutionContext& ctx) override;
    };

    [[nodiscard]] std::unique_ptr<IExecutionStrategy> make_strategy(Strategy strategy);
}  // namespace executer

#endif
