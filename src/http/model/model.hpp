#ifndef REQ_FORGE_MODEL_HPP
#define REQ_FORGE_MODEL_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace http::client {
    class IPipelineClient;
}

namespace http::model {
    using Payload = std::map<std::string, std::string>;

    // Ordered header list. Names are compared exactly by set(); find() is case-insensitive.
    class Headers {
       public:
        using Entry = std::pair<std::string, std::string>;

        Headers() = default;
        Headers(std::initializer_list<Entry> entries) : entries_(entries) {}

        void add(std::string name, std::string value);
        void set(const std::string& name, std::string value);
        bool erase(std::string_view name);

        [[nodiscard]] std::optional<std::string_view> find(std::string_view name) const;
        [[nodiscard]] bool contains(std::string_view name) const { return find(name).has_value(); }

        // "Name: Value" lines, each terminated by '\n'.
        [[nodiscard]] std::string to_text() const;

        [[nodiscard]] bool empty() const { return entries_.empty(); }
        [[nodiscard]] size_t size() const { return entries_.size(); }
        [[nodiscard]] std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
        [[nodiscard]] std::vector<Entry>::const_iterator end() const { return entries_.end(); }

       private:
        std::vector<Entry> entries_;
    };

    enum class TransmissionMode { STANDARD, RAW, PIPELINED };

    struct Request {
        std::string method_ = "GET";
        // Absolute URL for STANDARD requests, base URL of the target for RAW and PIPELINED ones.
        std::string url_;
        // Request target written on the wire by RAW and PIPELINED transmitters.
        std::string path_ = "/";
        std::string body_;
        Headers headers_;

        TransmissionMode mode_ = TransmissionMode::STANDARD;
        bool automatic_content_length_ = true;
        bool automatic_host_header_ = true;

        Payload meta_;

        // Attached by the pipelined strategy for the duration of one transmission.
        http::client::IPipelineClient* pipeline_client_ = nullptr;
    };

    struct Response {
        long status_ = 0;
        std::string protocol_;
        std::string reason_;
        Headers headers_;
        std::string body_;
        std::string effective_url_;

        // Pre-send until the final response's header block was available.
        std::chrono::nanoseconds duration_{0};
        size_t redirects_followed_ = 0;
        bool keep_alive_ = true;
        // True when the transport already removed the Content-Encoding.
        bool decoded_ = false;
    };
}  // namespace http::model

#endif
