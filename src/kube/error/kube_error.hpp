#ifndef KUBE_CLIENT_KUBE_ERROR_HPP
#define KUBE_CLIENT_KUBE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace kube::error {
    // Low-level I/O failure before any HTTP status is known. The only retried kind.
    struct TransportError : public std::runtime_error {
        int code_;
        explicit TransportError(int code, const std::string &msg);
    };

    // Non-2xx status other than 409.
    struct HttpError : public std::runtime_error {
        long status_;
        std::string status_text_;
        std::string body_;
        explicit HttpError(long s, std::string status_text, std::string body, const std::string &msg);
    };

    // 409 from the server, usually a resourceVersion mismatch on update.
    struct ConflictError : public HttpError {
        explicit ConflictError(std::string status_text, std::string body);
    };

    struct DecodeError : public std::runtime_error {
        std::string body_preview_;
        explicit DecodeError(std::string preview, const std::string &msg);
    };

    struct BootstrapError : public std::runtime_error {
        std::string path_;
        explicit BootstrapError(std::string path, const std::string &msg);
    };
}  // namespace kube::error

#endif
