#ifndef KUBE_CLIENT_CURL_TRANSPORT_HPP
#define KUBE_CLIENT_CURL_TRANSPORT_HPP

#include <string>

#include "../model/model.hpp"
#include "curl_easy.hpp"
#include "interface.hpp"

namespace kube::transport {
    const long CONNECT_TIMEOUT_MS = 10'000L;
    // 0 leaves the transfer uncapped; callers that need a deadline wrap the call.
    const long NO_TIMEOUT = 0L;

    struct TransportOptions {
        std::string base_url_;
        std::string token_;
        TlsOptions tls_;
        long connect_timeout_ms_ = CONNECT_TIMEOUT_MS;
        long timeout_ms_ = NO_TIMEOUT;
    };

    class CurlTransport : public ITransport {
       public:
        explicit CurlTransport(TransportOptions options);

        kube::model::Response invoke(const kube::model::Request& req) const override;

        // "?k=v&k2=v2" with both sides escaped, or "" when there is nothing to add.
        static std::string encode_query(const CurlEasy& easy, const kube::model::Query& query);
        static const char* content_type_for(const std::string& method);

       private:
        TransportOptions options_;
    };
}  // namespace kube::transport

#endif
