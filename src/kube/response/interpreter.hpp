#ifndef KUBE_CLIENT_INTERPRETER_HPP
#define KUBE_CLIENT_INTERPRETER_HPP

#include <string>

#include "../model/model.hpp"

namespace kube::response {
    // Returns the buffered body for 2xx. Throws error::ConflictError for 409 and
    // error::HttpError for every other status.
    std::string interpret(kube::model::Response&& resp);

    [[nodiscard]] bool is_success(long status);
}  // namespace kube::response

#endif
