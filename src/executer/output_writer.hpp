#ifndef REQ_FORGE_OUTPUT_WRITER_HPP
#define REQ_FORGE_OUTPUT_WRITER_HPP

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "../http/model/model.hpp"
#include "../operators/matcher.hpp"

namespace executer {
    // One matched or extracted outcome. Everything is borrowed for the duration of write().
    struct OutputEvent {
        const std::string& template_id_;
        const std::string& target_;
        const http::model::Request& request_;
        const http::model::Response& response_;
        std::string_view body_;
        const operators::IMatcher* matcher_ = nullptr;
        const std::vector<std::string>* extracted_ = nullptr;
    };

    class IOutputWriter {
       public:
        IOutputWriter() = default;
        virtual ~IOutputWriter() = default;
        IOutputWriter(const IOutputWriter&) = delete;
        IOutputWriter& operator=(const IOutputWriter&) = delete;
        IOutputWriter(IOutputWriter&&) = delete;
        IOutputWriter& operator=(IOutputWriter&&) = delete;

        // Called concurrently from worker threads.
        virtual void write(const OutputEvent& event) = 0;
    };

    struct WriterOptions {
        bool json_ = false;
        // JSON lines also carry the request and response dumps.
        bool json_requests_ = false;
        bool colored_ = false;
    };

    // "[template:matcher] [http] url [values]" lines, or one JSON object per line.
    class ConsoleWriter : public IOutputWriter {
       public:
        ConsoleWriter(std::ostream& out, const WriterOptions& options);

        void write(const OutputEvent& event) override;

        [[nodiscard]] static std::string format_text(const OutputEvent& event, bool colored);
        [[nodiscard]] static std::string format_json(const OutputEvent& event, bool with_requests);

       private:
        std::ostream& out_;
        WriterOptions options_;
        std::mutex mutex_;
    };
}  // namespace executer

#endif
