#ifndef REQ_FORGE_CLIENT_INTERFACE_HPP
#define REQ_FORGE_CLIENT_INTERFACE_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "../model/model.hpp"

namespace http::client {
    // Retrying, redirect-aware client for fully built requests (url_, method_, headers_, body_).
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        virtual http::model::Response send(const http::model::Request& req) = 0;
    };

    struct RawOptions {
        bool automatic_content_length_ = true;
        bool automatic_host_header_ = true;
    };

    // Writes the request exactly as authored to a fresh connection to target.
    class IRawClient {
       public:
        IRawClient() = default;
        virtual ~IRawClient() = default;
        IRawClient(const IRawClient&) = delete;
        virtual IRawClient& operator=(const IRawClient&) = delete;
        IRawClient(IRawClient&&) = delete;
        virtual IRawClient& operator=(IRawClient&&) = delete;

        virtual http::model::Response send(const std::string& target, const http::model::Request& req, const RawOptions& options) = 0;
    };

    // Persistent connections to one host; many requests in flight per connection.
    class IPipelineClient {
       public:
        IPipelineClient() = default;
        virtual ~IPipelineClient() = default;
        IPipelineClient(const IPipelineClient&) = delete;
        virtual IPipelineClient& operator=(const IPipelineClient&) = delete;
        IPipelineClient(IPipelineClient&&) = delete;
        virtual IPipelineClient& operator=(IPipelineClient&&) = delete;

        virtual http::model::Response send(const http::model::Request& req) = 0;
    };

    using PipelineClientFactory = std::function<std::unique_ptr<IPipelineClient>(const std::string& target, size_t max_connections)>;
}  // namespace http::client

#endif
