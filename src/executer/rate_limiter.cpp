#include "rate_limiter.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

using namespace std::chrono;

namespace executer {
    GlobalRateLimiter::GlobalRateLimiter(size_t requests_per_second) {
        if (requests_per_second == 0) {
            throw std::invalid_argument("rate limit must be at least one request per second");
        }
        interval_ = duration_cast<steady_clock::duration>(seconds{1}) / static_cast<long>(requests_per_second);
    }

    void GlobalRateLimiter::take(const std::string& target) {
        steady_clock::time_point slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = steady_clock::now();
            auto& next = next_slot_[target];
            slot = std::max(now, next);
            next = slot + interval_;
        }
        std::this_thread::sleep_until(slot);
    }
}  // namespace executer
