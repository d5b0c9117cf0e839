#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "../src/utils/string_utils.hpp"

TEST_CASE("case-insensitive prefix", "[string_utils]") {
    const std::string status_line = "http/1.1 200 OK";

    SECTION("matches regardless of case") {
        REQUIRE(string_utils::ieq_prefix(status_line.data(), status_line.size(), "HTTP/"));
        REQUIRE_FALSE(string_utils::ieq_prefix(status_line.data(), status_line.size(), "HTTPS"));
    }

    SECTION("a buffer shorter than the key does not match") { REQUIRE_FALSE(string_utils::ieq_prefix("HTT", 3, "HTTP/")); }

    SECTION("bytes above 0x7f are compared safely") {
        const std::string binary = "\xff\xfe\x80 Set-Cookie";
        REQUIRE_FALSE(string_utils::ieq_prefix(binary.data(), binary.size(), "HTTP/"));

        const std::string latin1 = "\xc9t\xc9";
        REQUIRE(string_utils::ieq_prefix(latin1.data(), latin1.size(), "\xc9T"));
    }
}

TEST_CASE("string helpers", "[string_utils]") {
    SECTION("trim") { REQUIRE(string_utils::trim("  X-Token \t") == "X-Token"); }

    SECTION("comma separated lists drop empty entries") {
        REQUIRE(string_utils::split_comma_delimited_string(" a, b ,,c ") == std::vector<std::string>{"a", "b", "c"});
    }

    SECTION("placeholders without a value are kept") {
        REQUIRE(string_utils::replace_placeholders("{{BaseURL}}/{{id}}/{{token}}", {{"BaseURL", "http://h"}, {"id", "7"}}) == "http://h/7/{{token}}");
    }
}
