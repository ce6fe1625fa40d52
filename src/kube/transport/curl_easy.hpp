#ifndef KUBE_CLIENT_CURL_EASY_HPP
#define KUBE_CLIENT_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../model/model.hpp"

struct curl_slist;

namespace kube::transport {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    struct TlsOptions {
        std::string ca_pem_;
        long min_version_ = CURL_SSLVERSION_TLSv1_2;
    };

    // One easy handle, one request. The handle and its header list are released in
    // the destructor, so every exit path out of a request frees them.
    class CurlEasy {
       public:
        CurlEasy();

        ~CurlEasy();
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);
        void set_method(const std::string& method, const std::optional<std::string>& payload);
        void set_tls(const TlsOptions& tls);
        void set_timeouts(long connect_timeout_ms, long timeout_ms);
        [[nodiscard]] std::string escape(std::string_view s) const;

        // Throws error::TransportError when curl could not complete the exchange.
        kube::model::Response perform();

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void perform_throw();
        kube::model::Response make_response();
        void set_defaults_once();
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static bool extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property);

        std::string body_;
        std::string status_text_;
        std::string content_type_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace kube::transport

#endif
