#ifndef REQ_FORGE_RATE_LIMITER_HPP
#define REQ_FORGE_RATE_LIMITER_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace executer {
    class IRateLimiter {
       public:
        IRateLimiter() = default;
        virtual ~IRateLimiter() = default;
        IRateLimiter(const IRateLimiter&) = delete;
        IRateLimiter& operator=(const IRateLimiter&) = delete;
        IRateLimiter(IRateLimiter&&) = delete;
        IRateLimiter& operator=(IRateLimiter&&) = delete;

        // Blocks until one more request to target is allowed.
        virtual void take(const std::string& target) = 0;
    };

    class UnlimitedRateLimiter : public IRateLimiter {
       public:
        void take(const std::string& /*target*/) override {}
    };

    // Evenly spaced sends: at most requests_per_second per target, shared by every executer that
    // holds it.
    class GlobalRateLimiter : public IRateLimiter {
       public:
        explicit GlobalRateLimiter(size_t requests_per_second);

        void take(const std::string& target) override;

       private:
        std::chrono::steady_clock::duration interval_;
        std::mutex mutex_;
        std::map<std::string, std::chrono::steady_clock::time_point> next_slot_;
    };
}  // namespace executer

#endif
