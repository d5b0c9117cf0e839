#ifndef REQ_FORGE_HTTP_EXECUTER_HPP
#define REQ_FORGE_HTTP_EXECUTER_HPP

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../generator/interface.hpp"
#include "../http/client/curl_share.hpp"
#include "../http/client/interface.hpp"
#include "../http/model/model.hpp"
#include "../utils/constants.hpp"
#include "output_writer.hpp"
#include "progress.hpp"
#include "rate_limiter.hpp"
#include "result.hpp"

namespace executer {
    struct HttpExecuterOptions {
        bool debug_ = false;
        bool json_ = false;
        bool json_requests_ = false;
        bool colored_ = false;
        bool cookie_reuse_ = false;
        bool stop_at_first_match_ = false;

        int timeout_s_ = constants::DEFAULT_TIMEOUT_S;
        int retries_ = constants::DEFAULT_RETRIES;

        std::string proxy_url_;
        std::string proxy_socks_url_;

        // "Name: Value", applied in order to every request.
        std::vector<std::string> custom_headers_;
    };

    class HttpExecuter {
       public:
        // Runs every request the generator has for target. Returns an empty Result without sending
        // anything when the target is already being executed.
        Result execute(IProgress& progress, const std::string& target);

        // Transmits req, processes the response and evaluates it. Throws on any failure.
        void handle(const std::string& target, http::model::Request& req, ResultAccumulator& result, DynamicValues& dynamic_values) const;

        // Malformed entries are skipped. Standard requests get trimmed names and values, raw and
        // pipelined ones get them verbatim. Existing headers of the same name are replaced.
        void apply_custom_headers(http::model::Request& req) const;

        void set_options(HttpExecuterOptions options);
        void set_generator(std::shared_ptr<generator::IRequestGenerator> generator);
        void set_http_client(std::unique_ptr<http::client::IHttpClient> http_client);
        void set_raw_client(std::unique_ptr<http::client::IRawClient> raw_client);
        void set_pipeline_client_factory(http::client::PipelineClientFactory pipeline_client_factory);
        void set_rate_limiter(std::shared_ptr<IRateLimiter> rate_limiter);
        void set_writer(std::shared_ptr<IOutputWriter> writer);

        [[nodiscard]] const HttpExecuterOptions& get_options() const;
        [[nodiscard]] const std::shared_ptr<generator::IRequestGenerator>& get_generator() const;
        [[nodiscard]] const std::shared_ptr<IOutputWriter>& get_writer() const;
        [[nodiscard]] bool has_http_client() const { return http_client_ != nullptr; }
        [[nodiscard]] bool has_raw_client() const { return raw_client_ != nullptr; }
        [[nodiscard]] bool has_pipeline_client_factory() const { return pipeline_client_factory_ != nullptr; }
        [[nodiscard]] bool has_rate_limiter() const { return rate_limiter_ != nullptr; }

       private:
        http::model::Response transmit(const std::string& target, const http::model::Request& req) const;

        HttpExecuterOptions options_;
        std::shared_ptr<generator::IRequestGenerator> generator_;
        std::unique_ptr<http::client::IHttpClient> http_client_;
        std::unique_ptr<http::client::IRawClient> raw_client_;
        http::client::PipelineClientFactory pipeline_client_factory_;
        std::shared_ptr<IRateLimiter> rate_limiter_;
        std::shared_ptr<IOutputWriter> writer_;
    };

    // Missing transports are built from the options: a libcurl standard client sized for single host
    // or host spraying use, and connect-only libcurl connections for the raw and pipelined paths.
    class HttpExecuterBuilder {
       public:
        HttpExecuterBuilder();

        HttpExecuterBuilder& with_options(HttpExecuterOptions options);
        HttpExecuterBuilder& with_generator(std::shared_ptr<generator::IRequestGenerator> generator);
        HttpExecuterBuilder& with_http_client(std::unique_ptr<http::client::IHttpClient> http_client);
        HttpExecuterBuilder& with_raw_client(std::unique_ptr<http::client::IRawClient> raw_client);
        HttpExecuterBuilder& with_pipeline_client_factory(http::client::PipelineClientFactory pipeline_client_factory);
        HttpExecuterBuilder& with_rate_limiter(std::shared_ptr<IRateLimiter> rate_limiter);
        HttpExecuterBuilder& with_writer(std::shared_ptr<IOutputWriter> writer);
        // A cookie sharing handle used by several executers. Takes precedence over cookie_reuse_.
        HttpExecuterBuilder& with_cookie_jar(std::shared_ptr<http::client::CurlShare> cookie_jar);
        HttpExecuterBuilder& validate();
        std::unique_ptr<HttpExecuter> build();

       private:
        std::unique_ptr<HttpExecuter> http_executer_;
        std::shared_ptr<http::client::CurlShare> cookie_jar_;
    };
}  // namespace executer

#endif
