#include "interpreter.hpp"

#include <string>

#include "../../utils/constants.hpp"
#include "../error/kube_error.hpp"
#include "../model/model.hpp"

namespace kube::response {
    bool is_success(long status) { return status >= constants::HTTP_OK && status < constants::HTTP_SUCCESS_UPPER_BOUNDARY; }

    std::string interpret(kube::model::Response&& resp) {
        if (resp.status_ == constants::HTTP_CONFLICT) {
            throw kube::error::ConflictError(std::move(resp.status_text_), std::move(resp.body_));
        }

        if (!is_success(resp.status_)) {
            const std::string status_text = resp.status_text_.empty() ? std::to_string(resp.status_) : resp.status_text_;
            const std::string msg = "response has status \"" + status_text + "\" and body \"" + resp.body_ + "\"";
            throw kube::error::HttpError(resp.status_, status_text, std::move(resp.body_), msg);
        }

        return std::move(resp.body_);
    }
}  // namespace kube::response
