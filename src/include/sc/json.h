#pragma once

#include <sc/value.h>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace sc {

struct JsonParseError : public std::runtime_error {
    size_t line, col;
    JsonParseError(const std::string& msg, size_t l, size_t c) : std::runtime_error(msg), line(l), col(c) {}
};

// Parse strict JSON text into a Value. Throws JsonParseError on malformed input.
Value parse_json(const std::string& text);

namespace json_literals {
    inline Value operator"" _json(const char* s, std::size_t len) { return parse_json(std::string(s, len)); }
}

}  // namespace sc
