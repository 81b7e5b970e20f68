#include <catch2/catch_test_macros.hpp>
#include <sc/json.h>

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

// Run a command and capture stdout and stderr together.
static std::pair<int, std::string> run_command(const std::string& cmd) {
    std::array<char, 128> buffer;
    std::string result;

    std::string full_cmd = cmd + " 2>&1";
    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) throw std::runtime_error("popen() failed!");

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) result += buffer.data();

    int status = pclose(pipe);
    if (WIFEXITED(status)) status = WEXITSTATUS(status);
    return {status, result};
}

static std::string demo(const std::string& args) { return std::string("\"") + SC_DEMO_PATH + "\" " + args; }

static std::string write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

TEST_CASE("Demo prints help", "[cli][help]") {
    auto [code, output] = run_command(demo("--help"));
    REQUIRE(code == 0);
    REQUIRE(output.find("USAGE:") != std::string::npos);
    REQUIRE(output.find("openapi") != std::string::npos);
}

TEST_CASE("Demo without arguments is a usage error", "[cli][help]") {
    auto [code, output] = run_command(demo(""));
    REQUIRE(code == 2);
    REQUIRE(output.find("USAGE:") != std::string::npos);
}

TEST_CASE("Demo suggests the closest command", "[cli][suggestions]") {
    auto [code, output] = run_command(demo("qeury x"));
    REQUIRE(code == 2);
    REQUIRE(output.find("Unknown command: qeury") != std::string::npos);
    REQUIRE(output.find("Did you mean 'query'?") != std::string::npos);
}

TEST_CASE("Demo validates a body file", "[cli][body]") {
    SECTION("Valid") {
        auto path = write_temp("shapecheck_cli_valid.json", R"({"name": "Ada", "email": "ada@example.com", "role": "user"})");
        auto [code, output] = run_command(demo("body " + path));
        REQUIRE(code == 0);
        REQUIRE(sc::parse_json(output).at("name") == sc::Value("Ada"));
    }
    SECTION("Invalid") {
        auto path = write_temp("shapecheck_cli_invalid.json", R"({"name": "", "role": "root"})");
        auto [code, output] = run_command(demo("body " + path));
        REQUIRE(code == 1);
        auto body = sc::parse_json(output);
        REQUIRE(body.at("error") == sc::Value("Validation failed"));
        REQUIRE(body.at("issues").size() == 3);
    }
    SECTION("Missing file") {
        auto [code, output] = run_command(demo("body /nonexistent/shapecheck.json"));
        REQUIRE(code == 2);
        REQUIRE(output.find("cannot open file") != std::string::npos);
    }
}

TEST_CASE("Demo validates a query string", "[cli][query]") {
    auto [code, output] = run_command(demo("query 'q=shoes&page=2&active=1'"));
    REQUIRE(code == 0);
    REQUIRE(sc::parse_json(output) == sc::Value{{"q", "shoes"}, {"page", 2}, {"active", true}});

    auto [bad_code, bad_output] = run_command(demo("query 'page=0'"));
    REQUIRE(bad_code == 1);
    REQUIRE(sc::parse_json(bad_output).at("issues").size() == 2);
}

TEST_CASE("Demo validates route parameters", "[cli][params]") {
    auto [code, output] = run_command(demo("item 12"));
    REQUIRE(code == 0);
    REQUIRE(sc::parse_json(output) == sc::Value{{"id", 12}});

    auto [bad_code, bad_output] = run_command(demo("item twelve"));
    REQUIRE(bad_code == 1);
}

TEST_CASE("Demo prints the OpenAPI document", "[cli][openapi]") {
    auto [code, output] = run_command(demo("openapi"));
    REQUIRE(code == 0);
    auto doc = sc::parse_json(output);
    REQUIRE(doc.at("openapi") == sc::Value("3.1.0"));
    REQUIRE(doc.at("paths").has("/users"));
    REQUIRE(doc.at("paths").has("/items/{id}"));
    REQUIRE_FALSE(doc.at("paths").has("/static/*"));
}
