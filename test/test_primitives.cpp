#include <catch2/catch_test_macros.hpp>
#include <sc/builders.h>

#include <cmath>
#include <limits>

#include "issues_of.h"

using namespace sc;

TEST_CASE("String schema accepts only strings", "[primitives][string]") {
    auto s = v::string();
    REQUIRE(s.parse("hello") == Value("hello"));
    REQUIRE(s.parse("") == Value(""));

    for (const Value& bad : {Value(5), Value(true), Value::null(), Value(), Value::array(), Value::object()}) {
        auto issue = single_issue(s, bad);
        REQUIRE(issue.path.empty());
        REQUIRE(issue.message == "Expected string");
    }
}

TEST_CASE("String length bounds", "[primitives][string]") {
    auto s = v::string().min(2).max(4);
    REQUIRE(s.parse("ab") == Value("ab"));
    REQUIRE(s.parse("abcd") == Value("abcd"));
    REQUIRE(single_issue(s, "a").message == "String must be at least 2 characters");
    REQUIRE(single_issue(s, "abcde").message == "String must be at most 4 characters");

    SECTION("Length counts code points, not bytes") {
        auto two = v::string().max(2);
        REQUIRE(two.parse("\xC3\xA9\xC3\xA9") == Value("\xC3\xA9\xC3\xA9"));
        REQUIRE(utf8_length("h\xC3\xA9llo") == 5);
        REQUIRE(utf8_length("\xF0\x9F\x98\x80") == 1);
    }
}

TEST_CASE("String checks run in attachment order and stop at the first failure", "[primitives][string]") {
    auto min_first = v::string().min(5).pattern("[0-9]+");
    REQUIRE(single_issue(min_first, "ab").message == "String must be at least 5 characters");

    auto pattern_first = v::string().pattern("[0-9]+").min(5);
    REQUIRE(single_issue(pattern_first, "ab").message == "String must match pattern /[0-9]+/");
}

TEST_CASE("String pattern must match the whole string", "[primitives][string]") {
    auto email = v::string().pattern("[^@]+@[^@]+\\.[^@]+");
    REQUIRE(email.parse("a@b.io") == Value("a@b.io"));
    REQUIRE(single_issue(email, "not an email").message == "String must match pattern /[^@]+@[^@]+\\.[^@]+/");

    auto digits = v::string().pattern("[0-9]+");
    REQUIRE_NOTHROW(digits.parse("123"));
    REQUIRE_THROWS_AS(digits.parse("123abc"), ValidationError);
}

TEST_CASE("An invalid pattern is rejected when the schema is built", "[primitives][string]") {
    REQUIRE_THROWS_AS(v::string().pattern("(unclosed"), std::regex_error);
}

TEST_CASE("Number schema accepts integers and doubles", "[primitives][number]") {
    auto n = v::number();
    REQUIRE(n.parse(42) == Value(42));
    REQUIRE(n.parse(3.5) == Value(3.5));
    REQUIRE(n.parse(std::numeric_limits<double>::infinity()).asDouble() > 0);

    SECTION("NaN is not a number") {
        REQUIRE(single_issue(n, std::nan("")).message == "Expected number");
    }
    SECTION("Numeric text is not a number without coercion") {
        REQUIRE(single_issue(n, "42").message == "Expected number");
        REQUIRE(single_issue(n, true).message == "Expected number");
    }
}

TEST_CASE("Number bounds and integer check", "[primitives][number]") {
    auto n = v::number().min(0).max(150);
    REQUIRE(n.parse(0) == Value(0));
    REQUIRE(n.parse(150) == Value(150));
    REQUIRE(single_issue(n, -1).message == "Number must be at least 0");
    REQUIRE(single_issue(n, 150.5).message == "Number must be at most 150");

    auto fractional = v::number().min(0.5);
    REQUIRE(single_issue(fractional, 0.25).message == "Number must be at least 0.5");

    auto i = v::number().integer();
    REQUIRE(i.parse(3.0) == Value(3));
    REQUIRE(single_issue(i, 3.5).message == "Number must be an integer");
    REQUIRE(single_issue(i, std::numeric_limits<double>::infinity()).message == "Number must be an integer");
}

TEST_CASE("Number checks are fail-fast", "[primitives][number]") {
    auto n = v::number().integer().min(10);
    auto issues = issues_of(n, 2.5);
    REQUIRE(issues.size() == 1);
    REQUIRE(issues[0].message == "Number must be an integer");
}

TEST_CASE("Boolean schema", "[primitives][boolean]") {
    auto b = v::boolean();
    REQUIRE(b.parse(true) == Value(true));
    REQUIRE(b.parse(false) == Value(false));
    REQUIRE(single_issue(b, "true").message == "Expected boolean");
    REQUIRE(single_issue(b, 1).message == "Expected boolean");
}

TEST_CASE("withMessage replaces only the type failure message", "[primitives][message]") {
    auto s = v::string().min(3).withMessage("Name is required");
    REQUIRE(single_issue(s, 7).message == "Name is required");
    REQUIRE(single_issue(s, "ab").message == "String must be at least 3 characters");

    auto n = v::number().withMessage("Give me a number");
    REQUIRE(single_issue(n, "x").message == "Give me a number");
}

TEST_CASE("Builders leave the original schema untouched", "[primitives][immutability]") {
    auto base = v::string();
    auto bounded = base.min(3);
    auto labelled = base.withMessage("custom");

    REQUIRE(base.checks().empty());
    REQUIRE_FALSE(base.customMessage().has_value());
    REQUIRE(bounded.checks().size() == 1);
    REQUIRE_NOTHROW(base.parse("a"));
    REQUIRE_THROWS_AS(bounded.parse("a"), ValidationError);
    REQUIRE(single_issue(base, 1).message == "Expected string");
    REQUIRE(single_issue(labelled, 1).message == "custom");
}
