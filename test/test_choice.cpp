#include <catch2/catch_all.hpp>
#include <sc/builders.h>
#include <sc/json.h>

#include <stdexcept>

#include "issues_of.h"

using namespace sc;
using namespace sc::json_literals;

TEST_CASE("Enum accepts listed strings only", "[choice][enum]") {
    auto role = v::enum_of({"admin", "user", "guest"});
    REQUIRE(role.parse("admin") == Value("admin"));
    REQUIRE(role.parse("guest") == Value("guest"));
    REQUIRE(single_issue(role, "root").message == "Expected one of: admin, user, guest");
    REQUIRE(single_issue(role, 1).message == "Expected one of: admin, user, guest");
    REQUIRE(single_issue(role, "Admin").message == "Expected one of: admin, user, guest");
}

TEST_CASE("Enum needs at least one value", "[choice][enum]") {
    REQUIRE_THROWS_AS(v::enum_of({}), std::invalid_argument);
}

TEST_CASE("Literal matches one exact value", "[choice][literal]") {
    SECTION("String") {
        auto kind = v::literal("user");
        REQUIRE(kind.parse("user") == Value("user"));
        REQUIRE(single_issue(kind, "admin").message == "Expected literal \"user\"");
    }
    SECTION("Number") {
        auto version = v::literal(2);
        REQUIRE(version.parse(2) == Value(2));
        REQUIRE(version.parse(2.0) == Value(2));
        REQUIRE(single_issue(version, 3).message == "Expected literal 2");
        REQUIRE(single_issue(version, "2").message == "Expected literal 2");
    }
    SECTION("Boolean") {
        auto yes = v::literal(true);
        REQUIRE(yes.parse(true) == Value(true));
        REQUIRE(single_issue(yes, false).message == "Expected literal true");
        REQUIRE(single_issue(yes, 1).message == "Expected literal true");
    }
}

TEST_CASE("Literal rejects values that are not scalars", "[choice][literal]") {
    REQUIRE_THROWS_AS(v::literal(Value::null()), std::invalid_argument);
    REQUIRE_THROWS_AS(v::literal(Value::array()), std::invalid_argument);
    REQUIRE_THROWS_AS(v::literal(Value()), std::invalid_argument);
}

TEST_CASE("Union returns the first member that accepts", "[choice][union]") {
    auto id = v::union_of({v::string(), v::number()});
    REQUIRE(id.parse("abc") == Value("abc"));
    REQUIRE(id.parse(7) == Value(7));

    SECTION("Earlier members win even when later ones would also accept") {
        auto either = v::union_of({v::coerce::string(), v::number()});
        auto out = either.parse(5);
        REQUIRE(out.isString());
        REQUIRE(out == Value("5"));
    }
    SECTION("Transforms of the winning member apply") {
        auto doubled = v::union_of({v::number().transform([](const Value& x) { return Value(x.asDouble() * 2); }),
                                    v::string()});
        REQUIRE(doubled.parse(4) == Value(8));
        REQUIRE(doubled.parse("x") == Value("x"));
    }
}

TEST_CASE("Union failure is one generic issue", "[choice][union]") {
    auto id = v::union_of({v::string().min(5), v::number().min(100)});
    auto issues = issues_of(id, true);
    REQUIRE(issues.size() == 1);
    REQUIRE(issues[0] == Issue{"", "Value does not match any type in the union"});

    SECTION("Member diagnostics are not surfaced") {
        auto member_failures = issues_of(id, "abc");
        REQUIRE(member_failures.size() == 1);
        REQUIRE(member_failures[0].message == "Value does not match any type in the union");
    }
    SECTION("Custom message and path apply") {
        auto custom = id.withMessage("Bad id");
        auto shape = v::object({{"id", custom}});
        REQUIRE(single_issue(shape, R"({"id": false})"_json) == Issue{"id", "Bad id"});
    }
}

TEST_CASE("Union lets foreign exceptions through", "[choice][union]") {
    auto broken = v::union_of({v::number().transform([](const Value&) -> Value { throw std::runtime_error("db down"); }),
                               v::number()});
    REQUIRE_THROWS_AS(broken.parse(1), std::runtime_error);
    REQUIRE_THROWS_WITH(broken.parse(1), "db down");
}

TEST_CASE("Union needs at least one member", "[choice][union]") {
    REQUIRE_THROWS_AS(v::union_of({}), std::invalid_argument);
}
