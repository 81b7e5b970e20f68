#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <sc/cli_utils.h>
#include <sc/shapecheck.h>

using namespace sc;

static const char* usage_text =
        "shapecheck_demo - Validate request data against the demo API schemas\n"
        "\n"
        "USAGE:\n"
        "  shapecheck_demo body <file.json>     Validate a POST /users body\n"
        "  shapecheck_demo query <query-string> Validate a GET /search query\n"
        "  shapecheck_demo item <id>            Validate GET /items/:id parameters\n"
        "  shapecheck_demo openapi              Print the OpenAPI document\n"
        "\n"
        "OPTIONS:\n"
        "  -h, --help  Show this help\n"
        "\n"
        "Exit status is 0 when the input is valid, 1 when it is rejected and 2\n"
        "for usage or I/O errors. Set SC_VALIDATE_DEBUG to trace validation.\n";

static ObjectSchema create_user_schema() {
    return v::object({
            {"name", v::string().min(1).max(100)},
            {"email", v::string().pattern("[^@]+@[^@]+\\.[^@]+")},
            {"age", v::number().min(0).max(150).optional()},
            {"role", v::enum_of({"admin", "user"})},
            {"tags", v::array(v::string()).max(10).optional()},
    });
}

static ObjectSchema search_query_schema() {
    return v::object({
            {"q", v::string().min(1)},
            {"page", v::coerce::number().min(1).optional()},
            {"limit", v::coerce::number().min(1).max(100).optional()},
            {"active", v::coerce::boolean().optional()},
    });
}

static ObjectSchema item_params_schema() { return v::object({{"id", v::coerce::number().integer()}}); }

static std::vector<RouteDoc> demo_routes() {
    RouteDoc create;
    create.method = "POST";
    create.path = "/users";
    create.summary = "Create a user";
    create.tags = {"users"};
    create.body = SchemaRef(create_user_schema());
    create.responses.emplace(201, SchemaRef(create_user_schema()));
    create.responses.emplace(400, SchemaRef(v::object({{"error", v::string()}})));

    RouteDoc search;
    search.method = "GET";
    search.path = "/search";
    search.summary = "Search users";
    search.query = SchemaRef(search_query_schema());

    RouteDoc item;
    item.method = "GET";
    item.path = "/items/:id";
    item.operationId = "getItem";

    RouteDoc fallback;
    fallback.method = "GET";
    fallback.path = "/static/*";

    return {create, search, item, fallback};
}

static int report(const ValidationError& e) {
    std::cout << e.toValue().dump(2) << "\n";
    return 1;
}

int main(int argc, char** argv) {
    const std::vector<std::string> commands = {"body", "query", "item", "openapi"};

    if (argc < 2) {
        std::cerr << usage_text;
        return 2;
    }
    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        std::cout << usage_text;
        return 0;
    }

    try {
        if (command == "body") {
            if (argc != 3) {
                std::cerr << "usage: shapecheck_demo body <file.json>\n";
                return 2;
            }
            std::ifstream in(argv[2]);
            if (!in) {
                std::cerr << "error: cannot open file: " << argv[2] << "\n";
                return 2;
            }
            std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            std::cout << validate_json(create_user_schema(), content).dump(2) << "\n";
            return 0;
        }
        if (command == "query") {
            if (argc != 3) {
                std::cerr << "usage: shapecheck_demo query <query-string>\n";
                return 2;
            }
            std::cout << validate_query(search_query_schema(), argv[2]).dump(2) << "\n";
            return 0;
        }
        if (command == "item") {
            if (argc != 3) {
                std::cerr << "usage: shapecheck_demo item <id>\n";
                return 2;
            }
            std::cout << validate_params(item_params_schema(), {{"id", argv[2]}}).dump(2) << "\n";
            return 0;
        }
        if (command == "openapi") {
            ApiInfo info;
            info.title = "shapecheck demo";
            info.version = "1.0.0";
            std::cout << build_openapi(demo_routes(), info).dump(2) << "\n";
            return 0;
        }
    } catch (const ValidationError& e) {
        return report(e);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    std::cerr << cli_utils::unknown_command_error(command, commands) << "\n" << usage_text;
    return 2;
}
