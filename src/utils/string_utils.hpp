#ifndef REQ_FORGE_STRING_UTILS_HPP
#define REQ_FORGE_STRING_UTILS_HPP

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool ieq(std::string_view a, std::string_view b);

    std::string to_lower(std::string_view sv);

    std::string trim(std::string s);

    std::vector<std::string> split_comma_delimited_string(std::string_view sv);

    // Replaces every "{{key}}" occurrence for each key in values.
    std::string replace_placeholders(std::string_view input, const std::map<std::string, std::string>& values);
}  // namespace string_utils

#endif
