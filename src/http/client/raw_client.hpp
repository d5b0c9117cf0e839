#ifndef REQ_FORGE_RAW_CLIENT_HPP
#define REQ_FORGE_RAW_CLIENT_HPP

#include <string>

#include "../model/model.hpp"
#include "../wire/byte_stream.hpp"
#include "interface.hpp"

namespace http::client {
    // One fresh connection per request. Method, target and headers go on the wire as authored.
    class RawClient : public IRawClient {
       public:
        explicit RawClient(http::wire::StreamFactory factory);

        http::model::Response send(const std::string& target, const http::model::Request& req, const RawOptions& options) override;

       private:
        http::wire::StreamFactory factory_;
    };
}  // namespace http::client

#endif
