#include <sc/openapi.h>

#include <algorithm>
#include <cctype>

namespace sc {

std::string status_description(int status) {
    switch (status) {
        case 200:
            return "OK";
        case 201:
            return "Created";
        case 204:
            return "No Content";
        case 400:
            return "Bad Request";
        case 401:
            return "Unauthorized";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 422:
            return "Unprocessable Entity";
        case 500:
            return "Internal Server Error";
        default:
            return "Response";
    }
}

static bool is_wildcard(const std::string& path) {
    return path == "*" || (path.size() >= 2 && path.compare(path.size() - 2, 2, "/*") == 0);
}

std::string openapi_path(const std::string& path) {
    std::string out;
    for (size_t i = 0; i < path.size();) {
        if (path[i] == ':' && i + 1 < path.size() && path[i + 1] != '/') {
            size_t end = path.find('/', i);
            if (end == std::string::npos) end = path.size();
            out += "{" + path.substr(i + 1, end - i - 1) + "}";
            i = end;
        } else {
            out.push_back(path[i++]);
        }
    }
    return out;
}

std::vector<std::string> path_parameters(const std::string& path) {
    std::vector<std::string> names;
    for (size_t i = 0; i < path.size();) {
        if (path[i] == ':' && i + 1 < path.size() && path[i + 1] != '/') {
            size_t end = path.find('/', i);
            if (end == std::string::npos) end = path.size();
            names.push_back(path.substr(i + 1, end - i - 1));
            i = end;
        } else {
            ++i;
        }
    }
    return names;
}

static Value json_content(const SchemaRef& schema) {
    return Value{{"application/json", Value{{"schema", schema.describe()}}}};
}

static Value info_to_value(const ApiInfo& info) {
    Value out{{"title", info.title}, {"version", info.version}};
    if (!info.description.empty()) out.set("description", info.description);
    if (info.extra.isObject()) {
        for (auto const& member : info.extra.asObject()) out.set(member.first, member.second);
    }
    return out;
}

static Value operation_for(const RouteDoc& route) {
    Value::list_t parameters;
    for (auto const& name : path_parameters(route.path)) {
        parameters.push_back(Value{{"name", name}, {"in", "path"}, {"required", true}, {"schema", Value{{"type", "string"}}}});
    }

    if (route.query) {
        Value qs = route.query->describe();
        if (qs.get("type") == Value("object") && qs.get("properties").isObject()) {
            const Value required = qs.get("required");
            for (auto const& prop : qs.at("properties").asObject()) {
                bool is_required = false;
                if (required.isArray()) {
                    for (auto const& r : required.asArray())
                        if (r == Value(prop.first)) is_required = true;
                }
                parameters.push_back(Value{{"name", prop.first}, {"in", "query"}, {"required", is_required}, {"schema", prop.second}});
            }
        }
    }

    Value op = Value::object();
    if (!route.summary.empty()) op.set("summary", route.summary);
    if (!route.description.empty()) op.set("description", route.description);
    if (!route.tags.empty()) op.set("tags", Value(Value::list_t(route.tags.begin(), route.tags.end())));
    if (route.deprecated) op.set("deprecated", true);
    if (!route.operationId.empty()) op.set("operationId", route.operationId);
    if (!parameters.empty()) op.set("parameters", Value(std::move(parameters)));

    if (route.body) {
        op.set("requestBody", Value{{"required", true}, {"content", json_content(*route.body)}});
    }

    Value responses = Value::object();
    if (route.response) {
        responses.set("200", Value{{"description", "OK"}, {"content", json_content(*route.response)}});
    } else if (!route.responses.empty()) {
        for (auto const& entry : route.responses) {
            responses.set(std::to_string(entry.first),
                          Value{{"description", status_description(entry.first)}, {"content", json_content(entry.second)}});
        }
    } else {
        responses.set("200", Value{{"description", "OK"}});
    }
    op.set("responses", std::move(responses));
    return op;
}

Value build_openapi(const std::vector<RouteDoc>& routes, const ApiInfo& info) {
    Value paths = Value::object();
    for (auto const& route : routes) {
        if (is_wildcard(route.path)) continue;

        const std::string path = openapi_path(route.path);
        Value item = paths.get(path);
        if (!item.isObject()) item = Value::object();

        std::string method = route.method;
        std::transform(method.begin(), method.end(), method.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        item.set(method, operation_for(route));
        paths.set(path, std::move(item));
    }
    return Value{{"openapi", "3.1.0"}, {"info", info_to_value(info)}, {"paths", std::move(paths)}};
}

}  // namespace sc
