#ifndef REQ_FORGE_REDIRECT_POLICY_HPP
#define REQ_FORGE_REDIRECT_POLICY_HPP

#include <cstddef>
#include <string>

namespace http::client {
    class RedirectPolicy {
       public:
        RedirectPolicy(bool follow_redirects, int max_redirects);

        // redirect_number counts redirects followed so far including the one being decided
        // (1 for the first 3xx). Past the ceiling the 3xx response is handed back as is.
        [[nodiscard]] bool should_follow(size_t redirect_number) const;

        [[nodiscard]] size_t ceiling() const { return ceiling_; }

       private:
        bool follow_redirects_;
        size_t ceiling_;
    };

    [[nodiscard]] bool is_redirect_status(long status);

    // 301/302/303 turn anything but GET/HEAD into a bodyless GET; 307/308 keep the method.
    [[nodiscard]] std::string redirect_method(long status, const std::string& method);
}  // namespace http::client

#endif
