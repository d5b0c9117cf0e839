#include "result.hpp"

#include <mutex>
#include <string>

namespace executer {
    void ResultAccumulator::record_match(const std::string& matcher_name, const http::model::Payload& meta) {
        std::lock_guard<std::mutex> lock(mutex_);
        result_.matches_.insert(matcher_name);
        result_.meta_ = meta;
        result_.got_results_ = true;
    }

    void ResultAccumulator::append_extractions(const std::string& extractor_name, const std::vector<std::string>& values, const http::model::Payload& meta) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& stored = result_.extractions_[extractor_name];
        stored.insert(stored.end(), values.begin(), values.end());
        result_.meta_ = meta;
    }

    void ResultAccumulator::mark_got_results() {
        std::lock_guard<std::mutex> lock(mutex_);
        result_.got_results_ = true;
    }

    void ResultAccumulator::mark_done() {
        std::lock_guard<std::mutex> lock(mutex_);
        result_.done_ = true;
    }

    void ResultAccumulator::set_error(std::string error) {
        std::lock_guard<std::mutex> lock(mutex_);
        result_.error_ = std::move(error);
    }

    bool ResultAccumulator::got_results() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return result_.got_results_;
    }

    bool ResultAccumulator::done() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return result_.done_;
    }

    Result ResultAccumulator::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return result_;
    }

    bool DynamicValues::try_set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.try_emplace(key, value).second;
    }

    std::optional<std::string> DynamicValues::get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    http::model::Payload DynamicValues::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_;
    }
}  // namespace executer
