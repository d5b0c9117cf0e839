#ifndef REQ_FORGE_PIPELINE_CLIENT_HPP
#define REQ_FORGE_PIPELINE_CLIENT_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "../model/model.hpp"
#include "../model/url.hpp"
#include "../wire/byte_stream.hpp"
#include "interface.hpp"

namespace http::client {
    // HTTP/1.1 pipelining over a fixed number of persistent connections to one origin. Requests are
    // spread round robin; on each connection they are written back to back and responses are read
    // strictly in write order. A connection that fails or is closed by the server fails the requests
    // still queued on it and is reopened once they have drained.
    class PipelineClient : public IPipelineClient {
       public:
        PipelineClient(http::model::Url origin, size_t max_connections, http::wire::StreamFactory factory);

        http::model::Response send(const http::model::Request& req) override;

        [[nodiscard]] size_t connection_count() const { return slots_.size(); }

        static PipelineClientFactory factory(http::wire::StreamFactory stream_factory);

       private:
        struct Slot {
            std::mutex write_mutex_;
            std::mutex state_mutex_;
            std::condition_variable turn_cv_;

            std::unique_ptr<http::wire::IByteStream> stream_;
            std::unique_ptr<http::wire::BufferedReader> reader_;

            uint64_t next_ticket_ = 0;
            uint64_t serving_ = 0;
            bool broken_ = false;
        };

        uint64_t write_request(Slot& slot, const http::model::Request& req);
        http::model::Response read_response(Slot& slot, uint64_t ticket, const http::model::Request& req, std::chrono::steady_clock::time_point started);
        static void finish_turn(Slot& slot, bool broken);

        http::model::Url origin_;
        http::wire::StreamFactory factory_;
        std::vector<std::unique_ptr<Slot>> slots_;
        std::atomic<size_t> next_slot_{0};
    };
}  // namespace http::client

#endif
