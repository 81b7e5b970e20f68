#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sc/schema.h"

namespace sc {

// Document title block. Members of `extra` (an object) are copied after
// title, version and description.
struct ApiInfo {
    std::string title;
    std::string version;
    std::string description;
    Value extra;
};

// Documentation metadata of one route. `path` uses ":name" segments for
// parameters; "*" and paths ending in "/*" are not documented.
struct RouteDoc {
    std::string method;
    std::string path;
    std::optional<SchemaRef> body;
    std::optional<SchemaRef> query;
    std::string summary;
    std::string description;
    std::vector<std::string> tags;
    bool deprecated = false;
    std::string operationId;
    // Either a single 200 response or a map of status code to schema.
    std::optional<SchemaRef> response;
    std::map<int, SchemaRef> responses;
};

// Standard reason text for the documented status codes, "Response" for others.
std::string status_description(int status);

// "/users/:id" -> "/users/{id}"
std::string openapi_path(const std::string& path);
std::vector<std::string> path_parameters(const std::string& path);

// OpenAPI 3.1 document {openapi, info, paths} built from route metadata
// through describe(); no schema is ever parsed.
Value build_openapi(const std::vector<RouteDoc>& routes, const ApiInfo& info);

}  // namespace sc
