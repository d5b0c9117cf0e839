#include "strategy.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

#include "../http/error/http_error.hpp"
#include "../utils/constants.hpp"
#include "../utils/thread_pool.hpp"

namespace executer {
    namespace {
        std::optional<http::model::Request> build_next(ExecutionContext& ctx, size_t remaining) {
            try {
                return ctx.generator_.build_request(ctx.target_, ctx.dynamic_values_.snapshot(), ctx.generator_.current(ctx.target_));
            } catch (const generator::GeneratorError& e) {
                ctx.result_.set_error(http::http_error::wrap("could not build http request", e));
                ctx.progress_.drop(remaining);
                return std::nullopt;
            }
        }

        // Failures end this request only; siblings keep running.
        void handle_request(ExecutionContext& ctx, http::model::Request& req, size_t remaining) {
            try {
                ctx.handle_(req);
            } catch (const std::exception& e) {
                ctx.result_.set_error(http::http_error::wrap("could not handle http request", e));
                ctx.progress_.drop(remaining);
                spdlog::debug("Request to {} failed: {}", ctx.target_, e.what());
            }
        }

        bool should_continue(ExecutionContext& ctx) { return ctx.generator_.has_next(ctx.target_) && !ctx.result_.done(); }
    }  // namespace

    Strategy select_strategy(const generator::GeneratorSettings& settings) {
        if (settings.pipeline_) {
            return Strategy::PIPELINED;
        }
        if (settings.threads_ > 0) {
            return Strategy::PARALLEL;
        }
        return Strategy::SERIAL;
    }

    const char* to_string(Strategy strategy) {
        switch (strategy) {
            case Strategy::SERIAL:
                return "serial";
            case Strategy::PARALLEL:
                return "parallel";
            case Strategy::PIPELINED:
                return "pipelined";
        }
        return "unknown";
    }

    void SerialStrategy::run(ExecutionContext& ctx) {
        size_t remaining = ctx.generator_.total_count();

        while (should_continue(ctx)) {
            if (auto req = build_next(ctx, remaining)) {
                ctx.rate_limiter_.take(ctx.target_);
                handle_request(ctx, *req, remaining);
            }

            if (ctx.stop_at_first_match_ && ctx.result_.got_results()) {
                ctx.progress_.drop(remaining);
                ctx.result_.mark_done();
                break;
            }

            ctx.generator_.advance(ctx.target_);
            ctx.progress_.tick();
            --remaining;
        }
    }

    void ParallelStrategy::run(ExecutionContext& ctx) {
        const size_t remaining = ctx.generator_.total_count();
        const auto workers = static_cast<size_t>(ctx.generator_.settings().threads_);
        concurrency::ThreadPool pool(workers, workers);

        while (should_continue(ctx)) {
            if (auto req = build_next(ctx, remaining)) {
                auto shared = std::make_shared<http::model::Request>(std::move(*req));
                pool.enqueue([&ctx, shared, remaining]() {
                    ctx.rate_limiter_.take(ctx.target_);
                    handle_request(ctx, *shared, remaining);
                });
            }
            ctx.generator_.advance(ctx.target_);
        }

        pool.wait_all();
    }

    void PipelinedStrategy::run(ExecutionContext& ctx) {
        const size_t remaining = ctx.generator_.total_count();
        const auto& settings = ctx.generator_.settings();

        const size_t connections = settings.pipeline_max_workers_ > 0 ? static_cast<size_t>(settings.pipeline_max_workers_) : constants::DEFAULT_PIPELINE_CONNECTIONS;
        const size_t workers = settings.pipeline_max_workers_ > 0 ? static_cast<size_t>(settings.pipeline_max_workers_) : constants::DEFAULT_PIPELINE_WORKERS;

        std::unique_ptr<http::client::IPipelineClient> client;
        try {
            client = ctx.pipeline_factory_(ctx.target_, connections);
        } catch (const std::exception& e) {
            ctx.result_.set_error(http::http_error::wrap("could not create pipeline client", e));
            ctx.progress_.drop(remaining);
            return;
        }

        concurrency::ThreadPool pool(workers, workers);
        auto* pipeline_client = client.get();

        while (should_continue(ctx)) {
            if (auto req = build_next(ctx, remaining)) {
                auto shared = std::make_shared<http::model::Request>(std::move(*req));
                pool.enqueue([&ctx, shared, pipeline_client, remaining]() {
                    shared->pipeline_client_ = pipeline_client;
                    handle_request(ctx, *shared, remaining);
                    shared->pipeline_client_ = nullptr;
                });
            }
            ctx.generator_.advance(ctx.target_);
        }

        pool.wait_all();
    }

    std::unique_ptr<IExecutionStrategy> make_strategy(Strategy strategy) {
        switch (strategy) {
            case Strategy::PIPELINED:
                return std::make_unique<PipelinedStrategy>();
            case Strategy::PARALLEL:
                return std::make_unique<ParallelStrategy>();
            case Strategy::SERIAL:
                break;
        }
        return std::make_unique<SerialStrategy>();
    }
}  // namespace executer
