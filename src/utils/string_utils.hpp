#ifndef KUBE_CLIENT_STRING_UTILS_HPP
#define KUBE_CLIENT_STRING_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace string_utils {
    size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    std::string trim(std::string s);

    std::string join(const std::vector<std::string>& parts, std::string_view separator);

    std::string preview(std::string_view s, size_t max_length);
}  // namespace string_utils

#endif
