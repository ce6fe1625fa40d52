#ifndef KUBE_CLIENT_JSON_CODEC_HPP
#define KUBE_CLIENT_JSON_CODEC_HPP

#include <simdjson.h>

#include <string>
#include <string_view>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/kube_error.hpp"
#include "resources.hpp"

namespace kube::model {
    // Decodes a whole response body into T. An empty body counts as "{}".
    // The body must be exactly one valid JSON document, including the fields T
    // does not read. Any simdjson failure becomes error::DecodeError.
    template <typename T>
    T decode_document(std::string_view body) {
        T out{};

        const auto fail = [body](const std::string& reason) {
            return kube::error::DecodeError(string_utils::preview(body, constants::ERROR_PREVIEW_LENGTH),
                                            "Failed to parse JSON response: " + reason);
        };

        try {
            simdjson::padded_string json(body.empty() ? std::string_view{constants::FAKE_RESPONSE_BODY} : body);

            // on-demand skips what it does not visit, so validate the whole document first
            simdjson::dom::parser validator;
            if (const simdjson::error_code err = validator.parse(json).error(); err != simdjson::SUCCESS) {
                throw fail(simdjson::error_message(err));
            }

            simdjson::ondemand::parser parser;
            simdjson::ondemand::document doc = parser.iterate(json);
            simdjson::ondemand::value root = doc.get_value();
            decode(root, out);
            if (!doc.at_end()) {
                throw fail("trailing content after the root value");
            }
        } catch (const simdjson::simdjson_error& e) {
            throw fail(e.what());
        }

        return out;
    }
}  // namespace kube::model

#endif
