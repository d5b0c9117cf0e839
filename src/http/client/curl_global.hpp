#ifndef REQ_FORGE_CURL_GLOBAL_HPP
#define REQ_FORGE_CURL_GLOBAL_HPP

namespace http::client {

    // curl_global_init / curl_global_cleanup for the lifetime of the process. Create one in main()
    // before any thread touches libcurl.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace http::client

#endif
