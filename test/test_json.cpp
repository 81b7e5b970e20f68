#include <catch2/catch_all.hpp>
#include <sc/json.h>

using namespace sc;
using namespace sc::json_literals;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Decode a request body", "[json]") {
    auto body = parse_json(R"({"name": "Pikachu", "age": 25, "height": 0.4, "tags": ["electric", "mouse"], "owner": null})");
    REQUIRE(body.at("name") == Value("Pikachu"));
    REQUIRE(body.at("age").isInt());
    REQUIRE(body.at("height").isDouble());
    REQUIRE(body.at("tags").size() == 2);
    REQUIRE(body.at("owner").isNull());
    REQUIRE(body.keys() == std::vector<std::string>{"name", "age", "height", "tags", "owner"});
}

TEST_CASE("Numbers keep integer precision where they can", "[json][number]") {
    REQUIRE(parse_json("9007199254740993").asInt() == 9007199254740993LL);
    REQUIRE(parse_json("-12").asInt() == -12);
    REQUIRE(parse_json("1e2").isDouble());
    REQUIRE(parse_json("99999999999999999999").isDouble());
    REQUIRE(parse_json("-0.5").asDouble() == -0.5);
}

TEST_CASE("String escapes", "[json][string]") {
    REQUIRE(parse_json(R"("a\nb")").asString() == "a\nb");
    REQUIRE(parse_json(R"("é")").asString() == "\xC3\xA9");
    REQUIRE(parse_json(R"("😀")").asString() == "\xF0\x9F\x98\x80");
    REQUIRE(parse_json(R"("quote \" slash \/")").asString() == "quote \" slash /");
}

TEST_CASE("Duplicate keys keep the last value", "[json]") {
    REQUIRE(parse_json(R"({"a": 1, "a": 2})") == Value{{"a", 2}});
}

TEST_CASE("Dumped JSON decodes to an equal value", "[json]") {
    auto doc = R"({"list": [1, 2.5, "x", true, null], "nested": {"k": "v"}})"_json;
    REQUIRE(parse_json(doc.dump()) == doc);
    REQUIRE(parse_json(doc.dump(4)) == doc);
}

TEST_CASE("Malformed JSON reports line and column", "[json][errors]") {
    SECTION("Missing value") {
        try {
            parse_json("{\n  \"a\": \n}");
            FAIL("expected JsonParseError");
        } catch (const JsonParseError& e) {
            REQUIRE(e.line == 3);
            REQUIRE_THAT(e.what(), ContainsSubstring("line 3"));
        }
    }
    SECTION("Trailing data") {
        REQUIRE_THROWS_AS(parse_json("{} {}"), JsonParseError);
    }
    SECTION("Leading zeros and bare words") {
        REQUIRE_THROWS_AS(parse_json("012"), JsonParseError);
        REQUIRE_THROWS_AS(parse_json("{\"a\": hello}"), JsonParseError);
        REQUIRE_THROWS_AS(parse_json(""), JsonParseError);
    }
    SECTION("Python literals get a hint") {
        REQUIRE_THROWS_WITH(parse_json("{\"ok\": True}"), ContainsSubstring("did you mean 'true'?"));
    }
    SECTION("Unclosed containers name their opener") {
        REQUIRE_THROWS_WITH(parse_json("[1, 2"), ContainsSubstring("opened at line 1"));
    }
}

TEST_CASE("Nesting depth is limited", "[json][errors]") {
    REQUIRE_THROWS_WITH(parse_json(std::string(200000, '[')), ContainsSubstring("nesting too deep"));

    std::string objects;
    for (int k = 0; k < 600; ++k) objects += "{\"a\": ";
    REQUIRE_THROWS_WITH(parse_json(objects), ContainsSubstring("nesting too deep"));

    std::string deep = std::string(500, '[') + std::string(500, ']');
    REQUIRE(parse_json(deep).isArray());
}
