#ifndef REQ_FORGE_RESULT_HPP
#define REQ_FORGE_RESULT_HPP

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../http/model/model.hpp"

namespace executer {
    // Outcome of one execute() call for one target. Plain value, owned by the caller.
    struct Result {
        bool got_results_ = false;
        bool done_ = false;
        http::model::Payload meta_;
        std::set<std::string> matches_;
        std::map<std::string, std::vector<std::string> > extractions_;
        // Only the most recent failure survives.
        std::optional<std::string> error_;
    };

    // The Result while tasks are still writing to it. Every method is one short critical section
    // and no lock is held across I/O.
    class ResultAccumulator {
       public:
        // OR match: records the matcher, snapshots meta and sets got_results.
        void record_match(const std::string& matcher_name, const http::model::Payload& meta);
        void append_extractions(const std::string& extractor_name, const std::vector<std::string>& values, const http::model::Payload& meta);
        void mark_got_results();
        void mark_done();
        void set_error(std::string error);

        [[nodiscard]] bool got_results() const;
        [[nodiscard]] bool done() const;

        [[nodiscard]] Result snapshot() const;

       private:
        mutable std::mutex mutex_;
        Result result_;
    };

    // Extractor name -> first value ever extracted for it during one target's request sequence.
    class DynamicValues {
       public:
        // False when the key already holds a value; the stored value never changes.
        bool try_set(const std::string& key, const std::string& value);

        [[nodiscard]] std::optional<std::string> get(const std::string& key) const;
        [[nodiscard]] http::model::Payload snapshot() const;

       private:
        mutable std::mutex mutex_;
        http::model::Payload values_;
    };
}  // namespace executer

#endif
