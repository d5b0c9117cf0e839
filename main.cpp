#include <spdlog/spdlog.h>

#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "src/config/job_file.hpp"
#include "src/executer/http_executer.hpp"
#include "src/executer/output_writer.hpp"
#include "src/executer/progress.hpp"
#include "src/executer/rate_limiter.hpp"
#include "src/generator/bulk_generator.hpp"
#include "src/http/client/curl_global.hpp"

int main(int argc, char** argv) {
    try {
        //
        // Collect
        //

        if (argc < 2) {
            std::cerr << "usage: reqforge <job.json> [target...] [--verbose]" << std::endl;
            return 1;
        }

        bool verbose = false;
        std::vector<std::string> cli_targets;
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--verbose") == 0) {
                verbose = true;
                continue;
            }
            cli_targets.emplace_back(argv[i]);
        }

        auto job = config::load_job_file(argv[1]);
        if (!cli_targets.empty()) {
            job.targets_ = cli_targets;
        }
        if (job.targets_.empty()) {
            std::cerr << "No targets given" << std::endl;
            return 1;
        }

        spdlog::set_level(verbose || job.options_.debug_ ? spdlog::level::debug : spdlog::level::info);

        http::client::CurlGlobal curl_global;

        //
        // Build
        //

        auto request_generator = std::make_shared<generator::BulkGenerator>(job.settings_, job.templates_, job.payloads_, job.attack_);

        std::shared_ptr<executer::IRateLimiter> rate_limiter;
        if (job.rate_limit_ > 0) {
            rate_limiter = std::make_shared<executer::GlobalRateLimiter>(job.rate_limit_);
        } else {
            rate_limiter = std::make_shared<executer::UnlimitedRateLimiter>();
        }

        auto writer = std::make_shared<executer::ConsoleWriter>(
            std::cout,
            executer::WriterOptions{.json_ = job.options_.json_, .json_requests_ = job.options_.json_requests_, .colored_ = job.options_.colored_});

        auto http_executer = executer::HttpExecuterBuilder()
                            .with_options(job.options_)
                            .with_generator(request_generator)
                            .with_rate_limiter(rate_limiter)
                            .with_writer(writer)
                            .validate()
                            .build();

        //
        // Run
        //

        executer::CountingProgress progress;
        progress.add_total(request_generator->total_count() * job.targets_.size());

        size_t failed_targets = 0;
        for (const auto& target : job.targets_) {
            const auto result = http_executer->execute(progress, target);
            if (result.error_.has_value()) {
                ++failed_targets;
                spdlog::error("[{}] {}: {}", job.id_, target, *result.error_);
            }
        }

        spdlog::info("[{}] {} requests completed, {} dropped, {} of {} targets failed", job.id_, progress.completed(), progress.dropped(), failed_targets,
                     job.targets_.size());

        return failed_targets == 0 ? 0 : 2;
    } catch (const config::ConfigError& e) {
        std::cerr << "Config Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
}
