#ifndef REQ_FORGE_BULK_GENERATOR_HPP
#define REQ_FORGE_BULK_GENERATOR_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "../http/model/model.hpp"
#include "interface.hpp"

namespace generator {
    enum class AttackType { CLUSTERBOMB, PITCHFORK };

    [[nodiscard]] AttackType parse_attack_type(const std::string& value);

    // One request definition. Either method/path/headers/body, where path is an absolute URL
    // template such as "{{BaseURL}}/login", or a raw HTTP/1.1 request text.
    struct RequestTemplate {
        std::string method_ = "GET";
        std::string path_;
        http::model::Headers headers_;
        std::string body_;

        std::string raw_;
        // Raw requests marked unsafe bypass the standard client.
        bool unsafe_ = false;
        bool automatic_content_length_ = true;
        bool automatic_host_header_ = true;
    };

    using PayloadSets = std::map<std::string, std::vector<std::string> >;

    // Every template is sent once per payload combination, template major.
    class BulkGenerator : public IRequestGenerator {
       public:
        BulkGenerator(GeneratorSettings settings, std::vector<RequestTemplate> templates, const PayloadSets& payloads, AttackType attack);

        [[nodiscard]] bool has_state(const std::string& target) const override;
        bool create_state(const std::string& target) override;
        void remove_state(const std::string& target) override;

        [[nodiscard]] bool has_next(const std::string& target) const override;
        [[nodiscard]] http::model::Payload current(const std::string& target) const override;
        void advance(const std::string& target) override;

        [[nodiscard]] http::model::Request build_request(const std::string& target, const http::model::Payload& dynamic_values,
                                                         const http::model::Payload& payload) const override;

        [[nodiscard]] size_t total_count() const override { return templates_.size() * combinations_.size(); }
        [[nodiscard]] const GeneratorSettings& settings() const override { return settings_; }

       private:
        // position_ / combinations_.size() is the template, the remainder the payload combination.
        struct State {
            size_t position_ = 0;
        };

        const State& state_of(const std::string& target) const;

        GeneratorSettings settings_;
        std::vector<RequestTemplate> templates_;
        std::vector<http::model::Payload> combinations_;

        mutable std::mutex states_mutex_;
        std::map<std::string, State> states_;
    };

    // Splits "METHOD target HTTP/x" + headers + body. Lines may end in "\n" or "\r\n".
    struct RawRequest {
        std::string method_;
        std::string path_;
        http::model::Headers headers_;
        std::string body_;
    };
    [[nodiscard]] RawRequest parse_raw_request(const std::string& raw);
}  // namespace generator

#endif
