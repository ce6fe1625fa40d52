#ifndef KUBE_CLIENT_MODEL_HPP
#define KUBE_CLIENT_MODEL_HPP

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace kube::model {
    struct Methods {
        static constexpr const char* GET = "GET";
        static constexpr const char* POST = "POST";
        static constexpr const char* PUT = "PUT";
        static constexpr const char* PATCH = "PATCH";
        static constexpr const char* DELETE = "DELETE";
    };

    using Query = std::map<std::string, std::string>;
    using Labels = std::map<std::string, std::string>;

    struct Request {
        std::string method_ = Methods::GET;
        std::string path_;
        Query query_;
        std::optional<nlohmann::json> body_;
    };

    struct Response {
        long status_ = 0;

        std::string status_text_;
        std::string body_;
        std::string effective_url_;
        std::string content_type_;
    };
}  // namespace kube::model

#endif
