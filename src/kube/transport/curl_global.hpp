#ifndef KUBE_CLIENT_CURL_GLOBAL_HPP
#define KUBE_CLIENT_CURL_GLOBAL_HPP

namespace kube::transport {

    // Owns libcurl's process-wide state. Create one before any client and keep it
    // alive until every client is gone.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace kube::transport

#endif
