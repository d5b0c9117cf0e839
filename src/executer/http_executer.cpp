#include "http_executer.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "../http/client/client_options.hpp"
#include "../http/client/curl_connection.hpp"
#include "../http/client/curl_easy.hpp"
#include "../http/client/pipeline_client.hpp"
#include "../http/client/raw_client.hpp"
#include "../http/error/http_error.hpp"
#include "../http/response/response_processor.hpp"
#include "../utils/string_utils.hpp"
#include "evaluator.hpp"
#include "strategy.hpp"

namespace executer {

    //
    // HttpExecuterBuilder implementation
    //

    HttpExecuterBuilder::HttpExecuterBuilder() : http_executer_(std::make_unique<HttpExecuter>()) {}

    HttpExecuterBuilder& HttpExecuterBuilder::with_options(HttpExecuterOptions options) {
        http_executer_->set_options(std::move(options));
        return *this;
    }

    HttpExecuterBuilder& HttpExecuterBuilder::with_generator(std::shared_ptr<generator::IRequestGenerator> generator) {
        http_executer_->set_generator(std::move(generator));
        return *this;
    }

    HttpExecuterBuilder& HttpExecuterBuilder::with_http_client(std::unique_ptr<http::client::IHttpClient> http_client) {
        http_executer_->set_http_client(std::move(http_client));
        return *this;
    }

    HttpExecuterBuilder& HttpExecuterBuilder::with_raw_client(std::unique_ptr<http::client::IRawClient> raw_client) {
        http_executer_->set_raw_client(std::move(raw_client));
        return *this;
    }

    HttpExecuterBuilder& HttpExecuterBuilder::with_pipeline_client_factory(http::client::PipelineClientFactory pipeline_client_factory) {
        http_executer_->set_pipeline_client_factory(std::move(pipeline_client_factory));
        return *this;
    }

    HttpExecuterBuilder& HttpExecuterBuilder::with_rate_limiter(std::shared_ptr<IRateLimiter> rate_limiter) {
        http_executer_->set_rate_limiter(std::move(rate_limiter));
        return *this;
    }

    HttpExecuterBuilder& HttpExecuterBuilder::with_writer(std::shared_ptr<IOutputWriter> writer) {
        http_executer_->set_writer(std::move(writer));
        return *this;
    }

    HttpExecuterBuilder& HttpExecuterBuilder::with_cookie_jar(std::shared_ptr<http::client::CurlShare> cookie_jar) {
        cookie_jar_ = std::move(cookie_jar);
        return *this;
    }

    HttpExecuterBuilder& HttpExecuterBuilder::validate() {
        if (http_executer_->get_generator() == nullptr) {
            throw std::runtime_error("Request generator is required");
        }
        if (http_executer_->get_writer() == nullptr) {
            throw std::runtime_error("Output writer is required");
        }
        if (cookie_jar_ != nullptr && !cookie_jar_->shares_cookies()) {
            throw std::runtime_error("Cookie jar must share cookies");
        }
        const auto& settings = http_executer_->get_generator()->settings();
        if (settings.threads_ < 0 || settings.pipeline_max_workers_ < 0) {
            throw std::runtime_error("Thread and pipeline worker counts cannot be negative");
        }
        if (http_executer_->get_options().timeout_s_ <= 0) {
            throw std::runtime_error("Timeout must be positive");
        }
        return *this;
    }

    std::unique_ptr<HttpExecuter> HttpExecuterBuilder::build() {
        const auto& options = http_executer_->get_options();
        const auto& settings = http_executer_->get_generator()->settings();

        if (!http_executer_->has_http_client()) {
            auto client_options = http::client::make_client_options(http::client::ClientConfig{
                .threads_ = settings.threads_,
                .timeout_s_ = options.timeout_s_,
                .retries_ = options.retries_,
                .follow_redirects_ = settings.follow_redirects_,
                .max_redirects_ = settings.max_redirects_,
                .proxy_url_ = options.proxy_url_,
                .proxy_socks_url_ = options.proxy_socks_url_,
            });

            auto share = cookie_jar_;
            if (share == nullptr) {
                share = std::make_shared<http::client::CurlShare>(http::client::ShareOptions{
                    .connections_ = client_options.keep_alive_,
                    .cookies_ = options.cookie_reuse_,
                });
            }

            http_executer_->set_http_client(std::make_unique<http::client::CurlEasy>(std::move(client_options), std::move(share)));
        }

        const http::client::ConnectionOptions connection_options{
            .connect_timeout_ = std::chrono::milliseconds{constants::DIAL_TIMEOUT_MS},
            .io_timeout_ = std::chrono::seconds{options.timeout_s_},
        };

        if (!http_executer_->has_raw_client()) {
            http_executer_->set_raw_client(std::make_unique<http::client::RawClient>(http::client::CurlConnection::factory(connection_options)));
        }
        if (!http_executer_->has_pipeline_client_factory()) {
            http_executer_->set_pipeline_client_factory(http::client::PipelineClient::factory(http::client::CurlConnection::factory(connection_options)));
        }
        if (!http_executer_->has_rate_limiter()) {
            http_executer_->set_rate_limiter(std::make_shared<UnlimitedRateLimiter>());
        }

        return std::move(http_executer_);
    }

    //
    // HttpExecuter implementation
    //

    void HttpExecuter::set_options(HttpExecuterOptions options) { options_ = std::move(options); }

    void HttpExecuter::set_generator(std::shared_ptr<generator::IRequestGenerator> generator) { generator_ = std::move(generator); }

    void HttpExecuter::set_http_client(std::unique_ptr<http::client::IHttpClient> http_client) { http_client_ = std::move(http_client); }

    void HttpExecuter::set_raw_client(std::unique_ptr<http::client::IRawClient> raw_client) { raw_client_ = std::move(raw_client); }

    void HttpExecuter::set_pipeline_client_factory(http::client::PipelineClientFactory pipeline_client_factory) {
        pipeline_client_factory_ = std::move(pipeline_client_factory);
    }

    void HttpExecuter::set_rate_limiter(std::shared_ptr<IRateLimiter> rate_limiter) { rate_limiter_ = std::move(rate_limiter); }

    void HttpExecuter::set_writer(std::shared_ptr<IOutputWriter> writer) { writer_ = std::move(writer); }

    const HttpExecuterOptions& HttpExecuter::get_options() const { return options_; }

    const std::shared_ptr<generator::IRequestGenerator>& HttpExecuter::get_generator() const { return generator_; }

    const std::shared_ptr<IOutputWriter>& HttpExecuter::get_writer() const { return writer_; }

    Result HttpExecuter::execute(IProgress& progress, const std::string& target) {
        // another execute() is iterating this target
        if (generator_->has_state(target) || !generator_->create_state(target)) {
            return {};
        }

        const auto& settings = generator_->settings();
        const auto strategy = select_strategy(settings);

        ResultAccumulator result;
        DynamicValues dynamic_values;

        ExecutionContext ctx{
            .target_ = target,
            .generator_ = *generator_,
            .rate_limiter_ = *rate_limiter_,
            .progress_ = progress,
            .result_ = result,
            .dynamic_values_ = dynamic_values,
            .stop_at_first_match_ = options_.stop_at_first_match_,
            .handle_ = [this, &target, &result, &dynamic_values](http::model::Request& req) { handle(target, req, result, dynamic_values); },
            .pipeline_factory_ = pipeline_client_factory_,
        };

        try {
            make_strategy(strategy)->run(ctx);
        } catch (const std::exception&) {
            generator_->remove_state(target);
            throw;
        }
        generator_->remove_state(target);

        spdlog::debug("Sent for [{}] to {} ({})", settings.template_id_, target, to_string(strategy));

        return result.snapshot();
    }

    void HttpExecuter::apply_custom_headers(http::model::Request& req) const {
        for (const auto& custom_header : options_.custom_headers_) {
            const auto colon = custom_header.find(':');
            if (colon == std::string::npos) {
                continue;
            }

            std::string name = custom_header.substr(0, colon);
            std::string value = custom_header.substr(colon + 1);

            if (req.mode_ == http::model::TransmissionMode::STANDARD) {
                name = string_utils::trim(std::move(name));
                value = string_utils::trim(std::move(value));
            }

            req.headers_.set(name, std::move(value));
        }
    }

    http::model::Response HttpExecuter::transmit(const std::string& target, const http::model::Request& req) const {
        switch (req.mode_) {
            case http::model::TransmissionMode::PIPELINED:
                if (req.pipeline_client_ == nullptr) {
                    throw http::http_error::TransportError("pipelined request without a pipeline client", target);
                }
                return req.pipeline_client_->send(req);
            case http::model::TransmissionMode::RAW:
                return raw_client_->send(target, req,
                                         http::client::RawOptions{
                                             .automatic_content_length_ = req.automatic_content_length_,
                                             .automatic_host_header_ = req.automatic_host_header_,
                                         });
            case http::model::TransmissionMode::STANDARD:
                break;
        }
        return http_client_->send(req);
    }

    void HttpExecuter::handle(const std::string& target, http::model::Request& req, ResultAccumulator& result, DynamicValues& dynamic_values) const {
        const auto& settings = generator_->settings();

        apply_custom_headers(req);

        if (options_.debug_) {
            spdlog::info("Dumped HTTP request for {} ({})", target, settings.template_id_);
            std::cerr << http::response::dump_request(req, target) << std::endl;
        }

        auto response = transmit(target, req);

        if (options_.debug_) {
            spdlog::info("Dumped HTTP response for {} ({})", target, settings.template_id_);
            std::cerr << http::response::dump_response(response) << std::endl;
        }

        std::optional<http::response::ProcessedResponse> processed;
        try {
            processed.emplace(http::response::process_response(std::move(response)));
        } catch (const http::http_error::DecompressionError& e) {
            throw std::runtime_error(http::http_error::wrap("could not decompress http body", e));
        }

        evaluate(req, *processed,
                 EvaluationContext{
                     .target_ = target,
                     .settings_ = settings,
                     .result_ = result,
                     .dynamic_values_ = dynamic_values,
                     .writer_ = *writer_,
                 });
    }
}  // namespace executer
