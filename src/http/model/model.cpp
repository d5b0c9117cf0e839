#include "model.hpp"

#include <algorithm>
#include <string>

#include "../../utils/string_utils.hpp"

namespace http::model {
    void Headers::add(std::string name, std::string value) { entries_.emplace_back(std::move(name), std::move(value)); }

    void Headers::set(const std::string& name, std::string value) {
        auto it = std::find_if(entries_.begin(), entries_.end(), [&name](const Entry& e) { return e.first == name; });
        if (it != entries_.end()) {
            it->second = std::move(value);
            return;
        }
        entries_.emplace_back(name, std::move(value));
    }

    bool Headers::erase(std::string_view name) {
        const auto before = entries_.size();
        std::erase_if(entries_, [name](const Entry& e) { return string_utils::ieq(e.first, name); });
        return entries_.size() != before;
    }

    std::optional<std::string_view> Headers::find(std::string_view name) const {
        for (const auto& [key, value] : entries_) {
            if (string_utils::ieq(key, name)) {
                return std::string_view(value);
            }
        }
        return std::nullopt;
    }

    std::string Headers::to_text() const {
        std::string out;
        for (const auto& [key, value] : entries_) {
            out.append(key).append(": ").append(value).push_back('\n');
        }
        return out;
    }
}  // namespace http::model
