#ifndef REQ_FORGE_TEST_FAKES_HPP
#define REQ_FORGE_TEST_FAKES_HPP

#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../src/executer/output_writer.hpp"
#include "../src/executer/rate_limiter.hpp"
#include "../src/http/client/interface.hpp"
#include "../src/http/model/model.hpp"
#include "../src/http/wire/byte_stream.hpp"

namespace fakes {
    using Responder = std::function<http::model::Response(const http::model::Request&)>;

    inline http::model::Response make_response(long status, std::string body) {
        http::model::Response resp;
        resp.status_ = status;
        resp.protocol_ = "HTTP/1.1";
        resp.body_ = std::move(body);
        return resp;
    }

    // Records every request and answers through the responder.
    class FakeHttpClient : public http::client::IHttpClient {
       public:
        explicit FakeHttpClient(Responder responder) : responder_(std::move(responder)) {}

        http::model::Response send(const http::model::Request& req) override {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                sent_->push_back(req);
            }
            return responder_(req);
        }

        // Shared so the test can still read it after the executer took ownership of the client.
        [[nodiscard]] std::shared_ptr<std::vector<http::model::Request> > sent() const { return sent_; }

       private:
        Responder responder_;
        std::mutex mutex_;
        std::shared_ptr<std::vector<http::model::Request> > sent_ = std::make_shared<std::vector<http::model::Request> >();
    };

    class FakeRawClient : public http::client::IRawClient {
       public:
        explicit FakeRawClient(Responder responder) : responder_(std::move(responder)) {}

        http::model::Response send(const std::string& /*target*/, const http::model::Request& req, const http::client::RawOptions& /*options*/) override {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                sent_->push_back(req);
            }
            return responder_(req);
        }

        [[nodiscard]] std::shared_ptr<std::vector<http::model::Request> > sent() const { return sent_; }

       private:
        Responder responder_;
        std::mutex mutex_;
        std::shared_ptr<std::vector<http::model::Request> > sent_ = std::make_shared<std::vector<http::model::Request> >();
    };

    class FakePipelineClient : public http::client::IPipelineClient {
       public:
        FakePipelineClient(Responder responder, std::shared_ptr<std::atomic<size_t> > sent)
            : responder_(std::move(responder)), sent_(std::move(sent)) {}

        http::model::Response send(const http::model::Request& req) override {
            ++*sent_;
            return responder_(req);
        }

       private:
        Responder responder_;
        std::shared_ptr<std::atomic<size_t> > sent_;
    };

    struct WrittenEvent {
        std::string matcher_;
        std::vector<std::string> extracted_;
        std::string url_;
    };

    class RecordingWriter : public executer::IOutputWriter {
       public:
        void write(const executer::OutputEvent& event) override {
            WrittenEvent written;
            if (event.matcher_ != nullptr) {
                written.matcher_ = event.matcher_->name();
            }
            if (event.extracted_ != nullptr) {
                written.extracted_ = *event.extracted_;
            }
            written.url_ = event.request_.url_;

            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(written));
        }

        [[nodiscard]] std::vector<WrittenEvent> events() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return events_;
        }

       private:
        mutable std::mutex mutex_;
        std::vector<WrittenEvent> events_;
    };

    class CountingRateLimiter : public executer::IRateLimiter {
       public:
        void take(const std::string& /*target*/) override { ++taken_; }

        [[nodiscard]] size_t taken() const { return taken_.load(); }

       private:
        std::atomic<size_t> taken_{0};
    };

    // In-memory connection: reads come from a scripted server reply, writes are captured.
    class FakeStream : public http::wire::IByteStream {
       public:
        FakeStream(std::string reply, std::shared_ptr<std::string> written, size_t max_read = 7)
            : reply_(std::move(reply)), written_(std::move(written)), max_read_(max_read) {}

        void write_all(std::string_view bytes) override { written_->append(bytes); }

        size_t read_some(char* buffer, size_t capacity) override {
            const size_t n = std::min({capacity, max_read_, reply_.size() - offset_});
            reply_.copy(buffer, n, offset_);
            offset_ += n;
            return n;
        }

       private:
        std::string reply_;
        std::shared_ptr<std::string> written_;
        size_t max_read_;
        size_t offset_ = 0;
    };
}  // namespace fakes

#endif
