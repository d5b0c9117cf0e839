#ifndef REQ_FORGE_CONFIG_JOB_FILE_HPP
#define REQ_FORGE_CONFIG_JOB_FILE_HPP

#include <simdjson.h>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../executer/http_executer.hpp"
#include "../generator/bulk_generator.hpp"
#include "../generator/interface.hpp"
#include "../utils/constants.hpp"

namespace config {
    struct ConfigError : public std::runtime_error {
        explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
    };

    template <typename T>
    struct ParserOptions {
        bool is_required_ = true;
        std::vector<T> allowed_values_;
        T fallback_value_;
        std::string error_message_;
    };

    const ParserOptions<std::string_view> ID_PARSER_OPTIONS = {.is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid id"};
    const ParserOptions<int64_t> TIMEOUT_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = constants::DEFAULT_TIMEOUT_S, .error_message_ = "Invalid timeout"};
    const ParserOptions<int64_t> RETRIES_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = constants::DEFAULT_RETRIES, .error_message_ = "Invalid retries"};
    const ParserOptions<int64_t> RATE_LIMIT_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 0, .error_message_ = "Invalid rate limit"};
    const ParserOptions<bool> FLAG_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = false, .error_message_ = "Invalid flag"};
    const ParserOptions<std::string_view> PROXY_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid proxy"};
    const ParserOptions<int64_t> THREADS_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 0, .error_message_ = "Invalid threads"};
    const ParserOptions<int64_t> PIPELINE_MAX_WORKERS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 0, .error_message_ = "Invalid pipeline max workers"};
    const ParserOptions<int64_t> MAX_REDIRECTS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 0, .error_message_ = "Invalid max redirects"};
    const ParserOptions<std::string_view> ATTACK_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {"clusterbomb", "pitchfork"}, .fallback_value_ = "clusterbomb", .error_message_ = "Invalid attack type"};
    const ParserOptions<std::string_view> CONDITION_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {"and", "or"}, .fallback_value_ = "or", .error_message_ = "Invalid matchers condition"};
    const ParserOptions<std::string_view> METHOD_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "GET", .error_message_ = "Invalid method"};
    const ParserOptions<std::string_view> TEMPLATE_TEXT_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid request template"};
    const ParserOptions<std::string_view> MATCHER_TYPE_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {"status", "size", "word", "regex"}, .fallback_value_ = "", .error_message_ = "Invalid matcher type"};
    const ParserOptions<std::string_view> EXTRACTOR_TYPE_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {"regex", "kval"}, .fallback_value_ = "", .error_message_ = "Invalid extractor type"};
    const ParserOptions<std::string_view> NAME_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid name"};
    const ParserOptions<std::string_view> PART_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {"body", "header", "all"}, .fallback_value_ = "body", .error_message_ = "Invalid part"};
    const ParserOptions<int64_t> GROUP_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 0, .error_message_ = "Invalid regex group"};

    // A scan described in JSON: targets, executer options, request templates, payloads and the
    // matchers and extractors applied to every response.
    struct JobFile {
        std::string id_;
        std::vector<std::string> targets_;
        executer::HttpExecuterOptions options_;
        // Requests per second per target, 0 for no limit.
        size_t rate_limit_ = 0;

        generator::GeneratorSettings settings_;
        std::vector<generator::RequestTemplate> templates_;
        generator::PayloadSets payloads_;
        generator::AttackType attack_ = generator::AttackType::CLUSTERBOMB;
    };

    // Throws ConfigError for unreadable files, malformed JSON and invalid values.
    [[nodiscard]] JobFile load_job_file(const std::filesystem::path& path);
    [[nodiscard]] JobFile parse_job(std::string_view json);
}  // namespace config

#endif
