#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "../src/config/job_file.hpp"

namespace {
    const char* FULL_JOB = R"json({
        "id": "admin-panel",
        "targets": ["http://a.test", "http://b.test"],
        "options": {
            "timeout": 10,
            "retries": 0,
            "json": true,
            "cookie_reuse": true,
            "stop_at_first_match": true,
            "proxy_socks": "socks5://127.0.0.1:9050",
            "headers": ["X-Scan: 1"],
            "rate_limit": 50
        },
        "requests": {
            "threads": 4,
            "redirects": true,
            "max_redirects": 3,
            "attack": "pitchfork",
            "payloads": {"user": ["admin", "root"], "pass": ["a", "b"]},
            "templates": [
                {
                    "method": "POST",
                    "path": "{{BaseURL}}/login",
                    "headers": {"Content-Type": "application/x-www-form-urlencoded", "X-Order": "2"},
                    "body": "u={{user}}&p={{pass}}"
                },
                {"raw": "GET /admin HTTP/1.1\nHost: {{Hostname}}\n\n", "unsafe": true, "disable_automatic_host": true}
            ],
            "matchers_condition": "and",
            "matchers": [
                {"type": "status", "status": [200, 302]},
                {"type": "word", "name": "panel", "words": ["Admin"], "part": "body", "condition": "or"},
                {"type": "regex", "regex": ["Set-Cookie: session"], "part": "header", "negative": true},
                {"type": "size", "size": [0]}
            ],
            "extractors": [
                {"type": "regex", "name": "csrf", "regex": ["csrf=([a-f0-9]+)"], "group": 1, "internal": true},
                {"type": "kval", "kval": ["server"]}
            ]
        }
    })json";
}  // namespace

TEST_CASE("job file parsing", "[job_file]") {
    SECTION("every field") {
        const auto job = config::parse_job(FULL_JOB);

        REQUIRE(job.id_ == "admin-panel");
        REQUIRE(job.targets_ == std::vector<std::string>{"http://a.test", "http://b.test"});

        REQUIRE(job.options_.timeout_s_ == 10);
        REQUIRE(job.options_.retries_ == 0);
        REQUIRE(job.options_.json_);
        REQUIRE_FALSE(job.options_.debug_);
        REQUIRE(job.options_.cookie_reuse_);
        REQUIRE(job.options_.stop_at_first_match_);
        REQUIRE(job.options_.proxy_url_.empty());
        REQUIRE(job.options_.proxy_socks_url_ == "socks5://127.0.0.1:9050");
        REQUIRE(job.options_.custom_headers_ == std::vector<std::string>{"X-Scan: 1"});
        REQUIRE(job.rate_limit_ == 50);

        REQUIRE(job.settings_.template_id_ == "admin-panel");
        REQUIRE(job.settings_.threads_ == 4);
        REQUIRE(job.settings_.follow_redirects_);
        REQUIRE(job.settings_.max_redirects_ == 3);
        REQUIRE_FALSE(job.settings_.pipeline_);
        REQUIRE(job.attack_ == generator::AttackType::PITCHFORK);
        REQUIRE(job.payloads_.at("user") == std::vector<std::string>{"admin", "root"});
        REQUIRE(job.payloads_.at("pass") == std::vector<std::string>{"a", "b"});
    }

    SECTION("templates") {
        const auto job = config::parse_job(FULL_JOB);
        REQUIRE(job.templates_.size() == 2);

        const auto& form = job.templates_[0];
        REQUIRE(form.method_ == "POST");
        REQUIRE(form.path_ == "{{BaseURL}}/login");
        REQUIRE(form.body_ == "u={{user}}&p={{pass}}");
        REQUIRE(form.headers_.size() == 2);
        REQUIRE(form.headers_.begin()->first == "Content-Type");
        REQUIRE(form.raw_.empty());

        const auto& raw = job.templates_[1];
        REQUIRE(raw.raw_ == "GET /admin HTTP/1.1\nHost: {{Hostname}}\n\n");
        REQUIRE(raw.method_ == "GET");
        REQUIRE(raw.unsafe_);
        REQUIRE_FALSE(raw.automatic_host_header_);
        REQUIRE(raw.automatic_content_length_);
    }

    SECTION("matchers and extractors") {
        const auto job = config::parse_job(FULL_JOB);
        const auto& settings = job.settings_;

        REQUIRE(settings.matchers_condition_ == operators::MatcherCondition::AND);
        REQUIRE(settings.matchers_.size() == 4);
        REQUIRE(settings.matchers_[0]->name() == "status");
        REQUIRE(settings.matchers_[1]->name() == "panel");
        REQUIRE(settings.matchers_[2]->name() == "regex");
        REQUIRE(settings.matchers_[3]->name() == "size");

        http::model::Response resp;
        resp.status_ = 302;
        REQUIRE(settings.matchers_[0]->match(resp, "", "", {}));
        REQUIRE(settings.matchers_[1]->match(resp, "Admin area", "", {}));
        REQUIRE(settings.matchers_[2]->match(resp, "", "Server: test\n", {}));
        REQUIRE_FALSE(settings.matchers_[2]->match(resp, "", "Set-Cookie: session=1\n", {}));
        REQUIRE(settings.matchers_[3]->match(resp, "", "", {}));

        REQUIRE(settings.extractors_.size() == 2);
        REQUIRE(settings.extractors_[0]->name() == "csrf");
        REQUIRE(settings.extractors_[0]->internal());
        REQUIRE(settings.extractors_[1]->name() == "kval");
        REQUIRE_FALSE(settings.extractors_[1]->internal());

        auto stream = settings.extractors_[0]->extract(resp, "csrf=beef01", "");
        REQUIRE(stream->next() == std::optional<std::string>("beef01"));
    }

    SECTION("defaults") {
        const auto job = config::parse_job(R"({"id": "minimal", "requests": {"templates": [{"path": "{{BaseURL}}"}]}})");

        REQUIRE(job.targets_.empty());
        REQUIRE(job.options_.timeout_s_ == 5);
        REQUIRE(job.options_.retries_ == 1);
        REQUIRE(job.options_.custom_headers_.empty());
        REQUIRE(job.rate_limit_ == 0);
        REQUIRE(job.settings_.threads_ == 0);
        REQUIRE(job.settings_.matchers_condition_ == operators::MatcherCondition::OR);
        REQUIRE(job.settings_.matchers_.empty());
        REQUIRE(job.attack_ == generator::AttackType::CLUSTERBOMB);
        REQUIRE(job.payloads_.empty());
        REQUIRE(job.templates_[0].method_ == "GET");
    }
}

TEST_CASE("job file errors", "[job_file]") {
    SECTION("malformed json") { REQUIRE_THROWS_AS(config::parse_job("{\"id\": "), config::ConfigError); }

    SECTION("missing id") { REQUIRE_THROWS_AS(config::parse_job(R"({"requests": {"templates": [{"path": "/"}]}})"), config::ConfigError); }

    SECTION("missing templates") {
        REQUIRE_THROWS_AS(config::parse_job(R"({"id": "x", "requests": {}})"), config::ConfigError);
        REQUIRE_THROWS_AS(config::parse_job(R"({"id": "x", "requests": {"templates": []}})"), config::ConfigError);
        REQUIRE_THROWS_AS(config::parse_job(R"({"id": "x", "requests": {"templates": [{"method": "GET"}]}})"), config::ConfigError);
    }

    SECTION("values outside their allowed sets") {
        REQUIRE_THROWS_WITH(config::parse_job(R"({"id": "x", "requests": {"attack": "sniper", "templates": [{"path": "/"}]}})"),
                            "Invalid attack type: sniper");
        REQUIRE_THROWS_AS(config::parse_job(R"({"id": "x", "requests": {"templates": [{"path": "/"}], "matchers": [{"type": "dsl"}]}})"),
                          config::ConfigError);
        REQUIRE_THROWS_AS(config::parse_job(R"({"id": "x", "options": {"timeout": 0}, "requests": {"templates": [{"path": "/"}]}})"),
                          config::ConfigError);
        REQUIRE_THROWS_AS(config::parse_job(R"({"id": "x", "options": {"retries": -1}, "requests": {"templates": [{"path": "/"}]}})"),
                          config::ConfigError);
    }

    SECTION("invalid regular expressions") {
        REQUIRE_THROWS_AS(
            config::parse_job(R"({"id": "x", "requests": {"templates": [{"path": "/"}], "matchers": [{"type": "regex", "regex": ["(open"]}]}})"),
            config::ConfigError);
    }

    SECTION("wrong value types") {
        REQUIRE_THROWS_AS(config::parse_job(R"({"id": "x", "options": {"timeout": "soon"}, "requests": {"templates": [{"path": "/"}]}})"),
                          config::ConfigError);
        REQUIRE_THROWS_AS(config::parse_job(R"({"id": "x", "targets": "http://a.test", "requests": {"templates": [{"path": "/"}]}})"),
                          config::ConfigError);
    }

    SECTION("missing file") { REQUIRE_THROWS_AS(config::load_job_file("/nonexistent/job.json"), config::ConfigError); }
}
