#pragma once

#include <string>

#include "sc/query.h"
#include "sc/schema.h"

namespace sc {

// Validate `data` against `schema` and return the parsed value.
// Throws ValidationError listing every issue found.
Value validate(const Schema& schema, const Value& data);
inline Value validate(const SchemaRef& schema, const Value& data) { return validate(*schema, data); }

// Decode a JSON request body and validate it. Text that is not JSON is
// reported as a ValidationError with the single root issue
// "Expected JSON body".
Value validate_json(const Schema& schema, const std::string& body);

// Validate a query string; every value reaches the schema as a string.
Value validate_query(const Schema& schema, const std::string& query_string);

// Validate route parameters; every value reaches the schema as a string.
Value validate_params(const Schema& schema, const ParamList& params);

}  // namespace sc
