#include <catch2/catch_test_macros.hpp>
#include <sc/builders.h>
#include <sc/json.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace sc;
using namespace sc::json_literals;

TEST_CASE("One schema serves many threads", "[concurrency]") {
    const auto schema = v::object({
            {"id", v::number().integer().min(0)},
            {"tags", v::array(v::string().min(1)).optional()},
    });
    const Value good = R"({"id": 7, "tags": ["a", "b"], "extra": 1})"_json;
    const Value bad = R"({"id": -1.5, "tags": ["", 3]})"_json;
    const Value expected = R"({"id": 7, "tags": ["a", "b"]})"_json;

    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::atomic<int> wrong{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                if ((i + t) % 2 == 0) {
                    if (schema.parse(good) == expected)
                        ++accepted;
                    else
                        ++wrong;
                } else {
                    try {
                        schema.parse(bad);
                        ++wrong;
                    } catch (const ValidationError& e) {
                        const auto& issues = e.issues();
                        bool as_expected = issues.size() == 3 && issues[0].path == "id" && issues[1].path == "tags[0]" &&
                                           issues[2].path == "tags[1]";
                        if (as_expected)
                            ++rejected;
                        else
                            ++wrong;
                    }
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(wrong == 0);
    REQUIRE(accepted == 800);
    REQUIRE(rejected == 800);
}
