#include "catch2_custom.hpp"

#include <junitgrader/common/text.hpp>

#include <string_view>
#include <vector>

using namespace junitgrader;
using namespace std::string_view_literals;

TEST_CASE("trim and trim_right") {
    REQUIRE(trim("  \t hello world \r\n") == "hello world");
    REQUIRE(trim("\n\n") == "");
    REQUIRE(trim("") == "");
    REQUIRE(trim("x") == "x");

    REQUIRE(trim_right("  ..E.E  \r") == "  ..E.E");
    REQUIRE(trim_right("\v\f") == "");
}

TEST_CASE("split_lines handles every line terminator") {
    using Lines = std::vector<std::string_view>;

    REQUIRE(split_lines("a\nb\r\nc\rd") == Lines{"a", "b", "c", "d"});
    REQUIRE(split_lines("a\n") == Lines{"a"});
    REQUIRE(split_lines("a\n\nb") == Lines{"a", "", "b"});
    REQUIRE(split_lines("\r\n") == Lines{""});
    REQUIRE(split_lines("").empty());
}

TEST_CASE("pluralize") {
    REQUIRE(pluralize("test", 0) == "tests");
    REQUIRE(pluralize("test", 1) == "test");
    REQUIRE(pluralize("test", 2) == "tests");
    REQUIRE(pluralize("class", 3, "es") == "classes");
}

TEST_CASE("html_escape") {
    REQUIRE(html_escape("List<String> & \"x\"") == "List&lt;String&gt; &amp; &quot;x&quot;");
    REQUIRE(html_escape("plain") == "plain");
}

TEST_CASE("display_width counts code points") {
    REQUIRE(display_width("abc") == 3);
    REQUIRE(display_width("") == 0);
    REQUIRE(display_width("héllo") == 5);
    REQUIRE(display_width("──") == 2);
}
