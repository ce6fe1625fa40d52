#include "kube_error.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"

namespace kube::error {
    TransportError::TransportError(int code, const std::string &msg) : std::runtime_error(msg), code_(code) {}

    HttpError::HttpError(long s, std::string status_text,
                         std::string body,        // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), status_(s), status_text_(std::move(status_text)), body_(std::move(body)) {}

    ConflictError::ConflictError(std::string status_text, std::string body)
        : HttpError(constants::HTTP_CONFLICT, std::move(status_text), body, "body: " + body) {}

    DecodeError::DecodeError(std::string preview, const std::string &msg) : std::runtime_error(msg), body_preview_(std::move(preview)) {}

    BootstrapError::BootstrapError(std::string path, const std::string &msg) : std::runtime_error(msg), path_(std::move(path)) {}
}  // namespace kube::error
