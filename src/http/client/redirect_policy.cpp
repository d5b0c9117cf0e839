#include "redirect_policy.hpp"

#include <string>

#include "../../utils/constants.hpp"

namespace http::client {
    RedirectPolicy::RedirectPolicy(bool follow_redirects, int max_redirects)
        : follow_redirects_(follow_redirects), ceiling_(max_redirects > 0 ? static_cast<size_t>(max_redirects) : constants::DEFAULT_MAX_REDIRECTS) {}

    bool RedirectPolicy::should_follow(size_t redirect_number) const {
        if (!follow_redirects_) {
            return false;
        }
        return redirect_number <= ceiling_;
    }

    bool is_redirect_status(long status) { return status == 301 || status == 302 || status == 303 || status == 307 || status == 308; }

    std::string redirect_method(long status, const std::string& method) {
        if (status == 307 || status == 308) {
            return method;
        }
        if (method == "GET" || method == "HEAD") {
            return method;
        }
        return "GET";
    }
}  // namespace http::client
