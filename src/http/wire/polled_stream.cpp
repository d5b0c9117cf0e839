#include "polled_stream.hpp"

#include <mutex>

namespace http::wire {
    void PolledStream::write_all(std::string_view bytes) {
        size_t sent_total = 0;
        while (sent_total < bytes.size()) {
            size_t sent = 0;
            IoStatus status{};
            {
                std::lock_guard<std::mutex> lock(io_mutex_);
                status = try_send(bytes.data() + sent_total, bytes.size() - sent_total, sent);
            }

            if (status == IoStatus::AGAIN) {
                wait_ready(false);
                continue;
            }
            sent_total += sent;
        }
    }

    size_t PolledStream::read_some(char* buffer, size_t capacity) {
        for (;;) {
            size_t received = 0;
            IoStatus status{};
            {
                std::lock_guard<std::mutex> lock(io_mutex_);
                status = try_recv(buffer, capacity, received);
            }

            if (status == IoStatus::AGAIN) {
                wait_ready(true);
                continue;
            }
            return received;
        }
    }
}  // namespace http::wire
