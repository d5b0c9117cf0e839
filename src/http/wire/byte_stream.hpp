#ifndef REQ_FORGE_BYTE_STREAM_HPP
#define REQ_FORGE_BYTE_STREAM_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "../model/url.hpp"

namespace http::wire {
    // A connected, bidirectional byte stream (plain TCP or TLS).
    class IByteStream {
       public:
        IByteStream() = default;
        virtual ~IByteStream() = default;
        IByteStream(const IByteStream&) = delete;
        IByteStream& operator=(const IByteStream&) = delete;
        IByteStream(IByteStream&&) = delete;
        IByteStream& operator=(IByteStream&&) = delete;

        virtual void write_all(std::string_view bytes) = 0;

        // Returns 0 once the peer closed the stream.
        virtual size_t read_some(char* buffer, size_t capacity) = 0;
    };

    // Opens a connection to the origin of the given URL.
    using StreamFactory = std::function<std::unique_ptr<IByteStream>(const http::model::Url&)>;

    // Line and length oriented reads on top of an IByteStream.
    class BufferedReader {
       public:
        explicit BufferedReader(IByteStream& stream) : stream_(stream) {}

        // Reads up to and including "\n"; the terminator is stripped together with a preceding "\r".
        // Throws WireFormatError if the stream ends first.
        std::string read_line();
        std::string read_exact(size_t n);
        std::string read_to_end();

       private:
        bool fill();

        IByteStream& stream_;
        std::string buffer_;
        size_t offset_ = 0;
    };
}  // namespace http::wire

#endif
