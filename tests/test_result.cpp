#include <catch2/catch.hpp>

#include <optional>
#include <string>
#include <vector>

#include "../src/executer/result.hpp"
#include "../src/utils/thread_pool.hpp"

TEST_CASE("result accumulator", "[result]") {
    SECTION("concurrent writers never lose an entry") {
        executer::ResultAccumulator result;
        {
            concurrency::ThreadPool pool(8);
            for (int i = 0; i < 100; ++i) {
                pool.enqueue([&result, i]() {
                    const auto key = "extractor-" + std::to_string(i);
                    result.append_extractions(key, {std::to_string(i)}, {{"i", std::to_string(i)}});
                    result.append_extractions("shared", {std::to_string(i)}, {});
                    result.record_match("matcher-" + std::to_string(i % 10), {});
                });
            }
            pool.wait_all();
        }

        const auto snapshot = result.snapshot();
        REQUIRE(snapshot.extractions_.size() == 101);
        REQUIRE(snapshot.extractions_.at("shared").size() == 100);
        REQUIRE(snapshot.extractions_.at("extractor-42") == std::vector<std::string>{"42"});
        REQUIRE(snapshot.matches_.size() == 10);
        REQUIRE(snapshot.got_results_);
    }

    SECTION("flags only ever go up") {
        executer::ResultAccumulator result;
        REQUIRE_FALSE(result.got_results());
        REQUIRE_FALSE(result.done());

        result.mark_got_results();
        result.mark_done();
        result.append_extractions("x", {"1"}, {});

        REQUIRE(result.got_results());
        REQUIRE(result.done());
    }

    SECTION("the most recent error wins") {
        executer::ResultAccumulator result;
        REQUIRE_FALSE(result.snapshot().error_.has_value());

        result.set_error("first");
        result.set_error("second");
        REQUIRE(result.snapshot().error_ == std::optional<std::string>("second"));
    }

    SECTION("extractions alone do not count as results") {
        executer::ResultAccumulator result;
        result.append_extractions("x", {"1", "2"}, {{"user", "admin"}});

        const auto snapshot = result.snapshot();
        REQUIRE_FALSE(snapshot.got_results_);
        REQUIRE(snapshot.meta_.at("user") == "admin");
    }
}

TEST_CASE("dynamic values", "[result]") {
    executer::DynamicValues values;

    REQUIRE(values.try_set("token", "x"));
    REQUIRE_FALSE(values.try_set("token", "y"));
    REQUIRE(values.get("token") == std::optional<std::string>("x"));
    REQUIRE_FALSE(values.get("other").has_value());
    REQUIRE(values.snapshot() == http::model::Payload{{"token", "x"}});
}
