#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
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

    bool ieq(std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
    }

    std::string to_lower(std::string_view sv) {
        std::string out(sv);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::vector<std::string> split_comma_delimited_string(std::string_view sv) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            size_t pos = sv.find(',', start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;

            std::string_view token = sv.substr(start, end - start);
            const auto first = token.find_first_not_of(" \t");
            if (first != std::string_view::npos) {
                const auto last = token.find_last_not_of(" \t");
                out.emplace_back(token.substr(first, last - first + 1));
            }

            if (pos == std::string_view::npos) {
                break;
            }

            start = pos + 1;
        }
        return out;
    }

    std::string replace_placeholders(std::string_view input, const std::map<std::string, std::string> &values) {
        std::string out;
        out.reserve(input.size());

        size_t pos = 0;
        while (pos < input.size()) {
            const size_t open = input.find("{{", pos);
            if (open == std::string_view::npos) {
                out.append(input.substr(pos));
                break;
            }

            const size_t close = input.find("}}", open + 2);
            if (close == std::string_view::npos) {
                out.append(input.substr(pos));
                break;
            }

            out.append(input.substr(pos, open - pos));

            const std::string key(input.substr(open + 2, close - open - 2));
            auto it = values.find(key);
            if (it != values.end()) {
                out.append(it->second);
            } else {
                // unknown placeholders are left for a later pass (dynamic values)
                out.append(input.substr(open, close - open + 2));
            }

            pos = close + 2;
        }

        return out;
    }
}  // namespace string_utils
