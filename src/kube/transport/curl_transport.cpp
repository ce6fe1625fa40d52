#include "curl_transport.hpp"

#include <optional>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../model/model.hpp"
#include "curl_easy.hpp"

namespace kube::transport {
    CurlTransport::CurlTransport(TransportOptions options) : options_(std::move(options)) {}

    kube::model::Response CurlTransport::invoke(const kube::model::Request& req) const {
        CurlEasy easy;

        easy.set_url(options_.base_url_ + req.path_ + encode_query(easy, req.query_));

        easy.set_headers({
            std::string("Content-Type: ") + content_type_for(req.method_),
            std::string("Accept: ") + constants::JSON_CONTENT_TYPE,
            "Authorization: Bearer " + options_.token_,
        });

        std::optional<std::string> payload;
        if (req.body_) {
            payload = req.body_->dump();
        }
        easy.set_method(req.method_, payload);
        easy.set_tls(options_.tls_);
        easy.set_timeouts(options_.connect_timeout_ms_, options_.timeout_ms_);

        return easy.perform();
    }

    std::string CurlTransport::encode_query(const CurlEasy& easy, const kube::model::Query& query) {
        if (query.empty()) {
            return {};
        }

        std::string out = "?";
        bool first = true;
        for (const auto& [key, value] : query) {
            if (!first) {
                out += '&';
            }
            first = false;
            out += easy.escape(key);
            out += '=';
            out += easy.escape(value);
        }
        return out;
    }

    const char* CurlTransport::content_type_for(const std::string& method) {
        if (method == kube::model::Methods::PATCH) {
            return constants::MERGE_PATCH_CONTENT_TYPE;
        }
        return constants::JSON_CONTENT_TYPE;
    }
}  // namespace kube::transport
