#include "pipeline_client.hpp"

#include <chrono>
#include <string>

#include "../error/http_error.hpp"
#include "../wire/wire_format.hpp"

using namespace std::chrono;

namespace http::client {
    PipelineClient::PipelineClient(http::model::Url origin, size_t max_connections, http::wire::StreamFactory factory)
        : origin_(std::move(origin)), factory_(std::move(factory)) {
        const size_t count = max_connections > 0 ? max_connections : 1;
        slots_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            slots_.push_back(std::make_unique<Slot>());
        }
    }

    void PipelineClient::finish_turn(Slot& slot, bool broken) {
        {
            std::lock_guard<std::mutex> lock(slot.state_mutex_);
            if (broken) {
                slot.broken_ = true;
            }
            ++slot.serving_;
        }
        slot.turn_cv_.notify_all();
    }

    uint64_t PipelineClient::write_request(Slot& slot, const http::model::Request& req) {
        std::lock_guard<std::mutex> write_lock(slot.write_mutex_);

        uint64_t ticket = 0;
        {
            std::unique_lock<std::mutex> lock(slot.state_mutex_);
            if (slot.broken_) {
                // wait for requests already written to the dead connection to fail out
                slot.turn_cv_.wait(lock, [&slot] { return slot.serving_ == slot.next_ticket_; });
            }
            if (slot.broken_ || slot.stream_ == nullptr) {
                slot.reader_.reset();
                slot.stream_.reset();
                slot.stream_ = factory_(origin_);
                slot.reader_ = std::make_unique<http::wire::BufferedReader>(*slot.stream_);
                slot.broken_ = false;
            }
            ticket = slot.next_ticket_++;
        }

        const auto bytes = http::wire::serialize_request(req.method_, req.path_, req.headers_, req.body_, origin_.authority(),
                                                         http::wire::SerializeOptions{
                                                             .automatic_content_length_ = req.automatic_content_length_,
                                                             .automatic_host_header_ = req.automatic_host_header_,
                                                         });
        try {
            slot.stream_->write_all(bytes);
        } catch (const std::exception&) {
            std::unique_lock<std::mutex> lock(slot.state_mutex_);
            slot.broken_ = true;
            slot.turn_cv_.wait(lock, [&slot, ticket] { return slot.serving_ == ticket; });
            ++slot.serving_;
            lock.unlock();
            slot.turn_cv_.notify_all();
            throw;
        }

        return ticket;
    }

    http::model::Response PipelineClient::read_response(Slot& slot, uint64_t ticket, const http::model::Request& req, steady_clock::time_point started) {
        {
            std::unique_lock<std::mutex> lock(slot.state_mutex_);
            slot.turn_cv_.wait(lock, [&slot, ticket] { return slot.serving_ == ticket; });
            if (slot.broken_) {
                ++slot.serving_;
                lock.unlock();
                slot.turn_cv_.notify_all();
                throw http::http_error::TransportError("pipelined connection to " + origin_.root() + " closed before the response", origin_.root());
            }
        }

        // only the ticket holder touches the reader until finish_turn()
        try {
            auto response = http::wire::read_response_head(*slot.reader_);
            response.duration_ = duration_cast<nanoseconds>(steady_clock::now() - started);
            http::wire::read_response_body(*slot.reader_, response, req.method_ == "HEAD");
            finish_turn(slot, !response.keep_alive_);
            return response;
        } catch (const std::exception&) {
            finish_turn(slot, true);
            throw;
        }
    }

    http::model::Response PipelineClient::send(const http::model::Request& req) {
        auto& slot = *slots_[next_slot_.fetch_add(1) % slots_.size()];

        const auto started = steady_clock::now();
        const auto ticket = write_request(slot, req);
        auto response = read_response(slot, ticket, req, started);
        response.effective_url_ = origin_.root() + req.path_;
        return response;
    }

    PipelineClientFactory PipelineClient::factory(http::wire::StreamFactory stream_factory) {
        return [stream_factory](const std::string& target, size_t max_connections) -> std::unique_ptr<IPipelineClient> {
            auto url = http::model::parse_url(target);
            if (!url) {
                throw http::http_error::TransportError("invalid pipeline target: " + target, target);
            }
            return std::make_unique<PipelineClient>(std::move(*url), max_connections, stream_factory);
        };
    }
}  // namespace http::client
