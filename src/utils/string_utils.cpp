#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace string_utils {
    size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string join(const std::vector<std::string> &parts, std::string_view separator) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) {
                out += separator;
            }
            out += parts[i];
        }
        return out;
    }

    std::string preview(std::string_view s, size_t max_length) { return std::string(s.substr(0, max_length)); }
}  // namespace string_utils
