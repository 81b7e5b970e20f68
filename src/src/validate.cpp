#include <sc/validate.h>

#include <sc/json.h>

#include "trace.h"

namespace sc {

Value validate(const Schema& schema, const Value& data) {
    if (trace_enabled()) {
        std::cerr << "validate debug: schema=" << to_string(schema.kind()) << " data=" << data.dump() << "\n";
    }
    try {
        return schema.parse(data);
    } catch (const ValidationError& e) {
        if (trace_enabled()) {
            for (auto const& issue : e.issues()) std::cerr << "validate issue: " << issue << "\n";
        }
        throw;
    }
}

Value validate_json(const Schema& schema, const std::string& body) {
    Value decoded;
    try {
        decoded = parse_json(body);
    } catch (const JsonParseError& e) {
        if (trace_enabled()) std::cerr << "validate debug: body is not JSON: " << e.what() << "\n";
        throw ValidationError("", "Expected JSON body");
    }
    return validate(schema, decoded);
}

Value validate_query(const Schema& schema, const std::string& query_string) {
    return validate(schema, parse_query(query_string));
}

Value validate_params(const Schema& schema, const ParamList& params) {
    return validate(schema, params_to_value(params));
}

}  // namespace sc
