#pragma once

#include <string>
#include <utility>
#include <vector>

#include "sc/value.h"

namespace sc {

using ParamList = std::vector<std::pair<std::string, std::string> >;

// Decode an application/x-www-form-urlencoded query string ("a=1&b=x+y",
// optionally with a leading '?'). '+' decodes to a space and %XX escapes to
// bytes; a malformed escape is kept literally. Pairs keep their order and
// duplicates are all returned.
ParamList decode_query(const std::string& text);

// Object of strings from a query string. On a repeated key the first value
// wins; a key without '=' maps to "".
Value parse_query(const std::string& text);

// Object of strings from route parameters (first value wins).
Value params_to_value(const ParamList& params);

std::string percent_decode(const std::string& text, bool plus_as_space = true);

}  // namespace sc
