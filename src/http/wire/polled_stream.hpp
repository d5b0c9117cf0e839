#ifndef REQ_FORGE_POLLED_STREAM_HPP
#define REQ_FORGE_POLLED_STREAM_HPP

#include <cstddef>
#include <mutex>
#include <string_view>

#include "byte_stream.hpp"

namespace http::wire {
    enum class IoStatus { DONE, AGAIN };

    // A byte stream over one non-blocking handle that must not be entered from two threads at once
    // (a libcurl easy handle, an SSL object). write_all and read_some may run concurrently: every
    // try_send/try_recv call is made under a single I/O mutex, waiting for readiness is not.
    class PolledStream : public IByteStream {
       public:
        void write_all(std::string_view bytes) final;
        size_t read_some(char* buffer, size_t capacity) final;

       protected:
        // DONE with sent/received set, or AGAIN when the handle would block. Errors throw.
        virtual IoStatus try_send(const char* data, size_t length, size_t& sent) = 0;
        virtual IoStatus try_recv(char* buffer, size_t capacity, size_t& received) = 0;

        // Blocks until the handle is readable (or writable); throws on timeout.
        virtual void wait_ready(bool for_read) = 0;

       private:
        std::mutex io_mutex_;
    };
}  // namespace http::wire

#endif
