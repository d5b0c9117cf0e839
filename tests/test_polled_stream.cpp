#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include "../src/http/wire/polled_stream.hpp"

namespace {
    // Bytes sent come back on receive, at most MAX_CHUNK per send. Every third send would block.
    // Any handle call that starts while another one is still inside is counted as an overlap.
    class LoopbackStream : public http::wire::PolledStream {
       public:
        static constexpr size_t MAX_CHUNK = 3;

        void close_peer() {
            std::lock_guard<std::mutex> lock(data_mutex_);
            closed_ = true;
        }

        [[nodiscard]] size_t overlaps() const { return overlaps_.load(); }
        [[nodiscard]] size_t waits() const { return waits_.load(); }

       protected:
        http::wire::IoStatus try_send(const char* data, size_t length, size_t& sent) override {
            const HandleCall call(*this);
            if (++send_calls_ % 3 == 0) {
                return http::wire::IoStatus::AGAIN;
            }

            sent = std::min(length, MAX_CHUNK);
            std::lock_guard<std::mutex> lock(data_mutex_);
            pending_.append(data, sent);
            return http::wire::IoStatus::DONE;
        }

        http::wire::IoStatus try_recv(char* buffer, size_t capacity, size_t& received) override {
            const HandleCall call(*this);
            std::lock_guard<std::mutex> lock(data_mutex_);
            if (pending_.empty()) {
                received = 0;
                return closed_ ? http::wire::IoStatus::DONE : http::wire::IoStatus::AGAIN;
            }

            received = std::min(capacity, pending_.size());
            pending_.copy(buffer, received);
            pending_.erase(0, received);
            return http::wire::IoStatus::DONE;
        }

        void wait_ready(bool /*for_read*/) override {
            ++waits_;
            std::this_thread::yield();
        }

       private:
        struct HandleCall {
            explicit HandleCall(LoopbackStream& stream) : stream_(stream) {
                if (stream_.inside_.fetch_add(1) != 0) {
                    ++stream_.overlaps_;
                }
                std::this_thread::sleep_for(std::chrono::microseconds(20));
            }
            ~HandleCall() { stream_.inside_.fetch_sub(1); }
            HandleCall(const HandleCall&) = delete;
            HandleCall& operator=(const HandleCall&) = delete;

            LoopbackStream& stream_;
        };

        std::atomic<int> inside_{0};
        std::atomic<size_t> overlaps_{0};
        std::atomic<size_t> waits_{0};
        size_t send_calls_ = 0;

        std::mutex data_mutex_;
        std::string pending_;
        bool closed_ = false;
    };
}  // namespace

TEST_CASE("polled stream", "[polled_stream]") {
    LoopbackStream stream;

    SECTION("a reader and a writer never enter the handle together") {
        const std::string chunk = "abcd";
        const size_t rounds = 200;

        std::thread writer([&stream, &chunk]() {
            for (size_t i = 0; i < rounds; ++i) {
                stream.write_all(chunk);
            }
        });

        std::string received;
        char buffer[16];
        while (received.size() < chunk.size() * rounds) {
            const auto n = stream.read_some(buffer, sizeof(buffer));
            received.append(buffer, n);
        }
        writer.join();

        std::string expected;
        for (size_t i = 0; i < rounds; ++i) {
            expected += chunk;
        }

        REQUIRE(received == expected);
        REQUIRE(stream.overlaps() == 0);
        REQUIRE(stream.waits() > 0);
    }

    SECTION("short sends are continued until everything is written") {
        stream.write_all("0123456789");
        stream.close_peer();

        std::string received;
        char buffer[4];
        for (size_t n = stream.read_some(buffer, sizeof(buffer)); n > 0; n = stream.read_some(buffer, sizeof(buffer))) {
            received.append(buffer, n);
        }

        REQUIRE(received == "0123456789");
    }

    SECTION("a closed peer reads as end of stream") {
        stream.close_peer();
        char buffer[4];
        REQUIRE(stream.read_some(buffer, sizeof(buffer)) == 0);
    }
}
