#include "curl_easy.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/kube_error.hpp"
#include "../model/model.hpp"

namespace kube::transport {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long HTTP_GET = 1L;
        static constexpr const char* USER_AGENT = "kube-client/1.0";
    };

    struct HeaderKeys {
        static constexpr const char* STATUS_LINE = "HTTP/";
        static constexpr const char* CONTENT_TYPE = "content-type:";
    };

    CurlEasy::CurlEasy() : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            curl_slist* appended = curl_slist_append(headers_, h.c_str());
            if (appended == nullptr) {
                throw std::runtime_error("curl_slist_append failed");
            }
            headers_ = appended;
        }
        if (headers_ != nullptr) {
            setopt(CURLOPT_HTTPHEADER, headers_);
        }
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body_);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);
    }

    void CurlEasy::set_method(const std::string& method, const std::optional<std::string>& payload) {
        if (payload) {
            // size first, COPYPOSTFIELDS reads it
            setopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(payload->size()));
            setopt(CURLOPT_COPYPOSTFIELDS, payload->c_str());
            setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
            return;
        }

        if (method == kube::model::Methods::GET) {
            setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
            return;
        }

        setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    void CurlEasy::set_tls(const TlsOptions& tls) {
        setopt(CURLOPT_SSLVERSION, tls.min_version_);

        if (!tls.ca_pem_.empty()) {
            curl_blob blob{};
            blob.data = const_cast<char*>(tls.ca_pem_.data());  // NOLINT(cppcoreguidelines-pro-type-const-cast)
            blob.len = tls.ca_pem_.size();
            blob.flags = CURL_BLOB_COPY;
            setopt(CURLOPT_CAINFO_BLOB, &blob);
        }
    }

    void CurlEasy::set_timeouts(long connect_timeout_ms, long timeout_ms) {
        setopt(CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms);
        if (timeout_ms > 0) {
            setopt(CURLOPT_TIMEOUT_MS, timeout_ms);
        }
    }

    std::string CurlEasy::escape(std::string_view s) const {
        std::unique_ptr<char, decltype(&curl_free)> escaped(curl_easy_escape(handle_, s.data(), static_cast<int>(s.size())), &curl_free);
        if (escaped == nullptr) {
            throw std::runtime_error("curl_easy_escape failed");
        }
        return {escaped.get()};
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        // A new status line starts a new header block (100-continue, proxies).
        if (string_utils::ieq_prefix(buffer, bytes, HeaderKeys::STATUS_LINE)) {
            const std::string line(buffer, bytes);
            const auto space = line.find(' ');
            self->status_text_ = space == std::string::npos ? std::string{} : string_utils::trim(line.substr(space + 1));
            self->content_type_.clear();
            return bytes;
        }

        CurlEasy::extract_header_value(buffer, bytes, HeaderKeys::CONTENT_TYPE, self->content_type_);

        return bytes;
    }

    bool CurlEasy::extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property) {
        size_t key_len = std::char_traits<char>::length(key);
        if (bytes < key_len) {
            return false;
        }
        for (size_t i = 0; i < key_len; ++i) {
            const char a = buffer[i];
            const char b = key[i];
            if ((a | constants::ASCII_LOWERCASE_BIT) != (b | constants::ASCII_LOWERCASE_BIT)) {
                return false;
            }  // ASCII-only fold
        }
        const char* start = buffer + key_len;
        const char* end = buffer + bytes;
        while (start < end && (*start == ' ' || *start == '\t')) {
            ++start;
        }
        while (end > start && (end[-1] == '\r' || end[-1] == '\n' || end[-1] == ' ' || end[-1] == '\t')) {
            --end;
        }
        out_property.assign(start, end);
        return true;
    }

    kube::model::Response CurlEasy::perform() {
        body_.clear();
        status_text_.clear();
        content_type_.clear();

        perform_throw();
        return make_response();
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::perform_throw() {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw kube::error::TransportError(static_cast<int>(rc), err);
    }

    kube::model::Response CurlEasy::make_response() {
        long code = 0;
        char* eff = nullptr;
        const auto rc = curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        if (rc != CURLE_OK) {
            throw kube::error::TransportError(static_cast<int>(rc), std::string("curl_easy_getinfo failed: ") + curl_easy_strerror(rc));
        }
        if (curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff) != CURLE_OK) {
            eff = nullptr;
        }

        kube::model::Response r;
        r.status_ = code;
        r.status_text_ = status_text_.empty() ? std::to_string(code) : std::move(status_text_);
        r.body_ = std::move(body_);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.content_type_ = std::move(content_type_);
        return r;
    }

}  // namespace kube::transport
