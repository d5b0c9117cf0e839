#ifndef REQ_FORGE_CONSTANTS_HPP
#define REQ_FORGE_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int BASE_16 = 16;
    inline constexpr int DEFAULT_MAX_REDIRECTS = 10;
    inline constexpr int DEFAULT_PIPELINE_WORKERS = 150;
    inline constexpr int DEFAULT_PIPELINE_CONNECTIONS = 1;
    inline constexpr int DEFAULT_TIMEOUT_S = 5;
    inline constexpr int DEFAULT_RETRIES = 1;
    inline constexpr long SINGLE_HOST_MAX_CONNS = 500L;
    inline constexpr long SPRAY_MAX_CONNS = 0L;
    inline constexpr long DIAL_TIMEOUT_MS = 30'000L;
    inline constexpr long DIAL_KEEPALIVE_S = 30L;
    inline constexpr long RETRY_WAIT_MIN_MS = 1'000L;
    inline constexpr long RETRY_WAIT_MAX_MS = 10'000L;
    inline constexpr size_t READ_CHUNK_SIZE = 16 * 1024;
    inline constexpr size_t BODY_PREVIEW_LENGTH = 512;
    inline constexpr const char* USER_AGENT = "reqforge/1.0";
    inline constexpr const char* CRLF = "\r\n";

}  // namespace constants

#endif
