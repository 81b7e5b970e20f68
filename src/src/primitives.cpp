#include <sc/primitives.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace sc {

namespace {
    std::string trim(const std::string& s) {
        size_t a = 0;
        while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
        size_t b = s.size();
        while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
        return s.substr(a, b - a);
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    int digit_value(char c) {
        if ('0' <= c && c <= '9') return c - '0';
        if ('a' <= c && c <= 'z') return 10 + (c - 'a');
        if ('A' <= c && c <= 'Z') return 10 + (c - 'A');
        return 99;
    }

    // Integral results come back as Integer so they print and compare like
    // numbers decoded from JSON.
    Value number_value(double x) {
        if (std::floor(x) == x && std::fabs(x) < 9.0e15) return Value(static_cast<int64_t>(x));
        return Value(x);
    }
}

std::size_t utf8_length(const std::string& text) {
    std::size_t r = 0;
    for (char c : text) r += ((static_cast<unsigned char>(c) & 0xC0) != 0x80);
    return r;
}

double number_from_string(const std::string& text) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    if (text == "Infinity" || text == "+Infinity") return inf;
    if (text == "-Infinity") return -inf;

    // 0x1F, 0o17, 0b101: unsigned only
    if (text.size() > 2 && text[0] == '0') {
        const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(text[1])));
        const int base = p == 'x' ? 16 : (p == 'o' ? 8 : (p == 'b' ? 2 : 0));
        if (base != 0) {
            double value = 0;
            for (size_t i = 2; i < text.size(); ++i) {
                int d = digit_value(text[i]);
                if (d >= base) return nan;
                value = value * base + d;
            }
            return value;
        }
    }

    const size_t n = text.size();
    size_t i = 0;
    if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
    size_t mantissa_digits = 0;
    while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) ++i, ++mantissa_digits;
    if (i < n && text[i] == '.') {
        ++i;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) ++i, ++mantissa_digits;
    }
    if (mantissa_digits == 0) return nan;
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
        size_t exponent_digits = 0;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) ++i, ++exponent_digits;
        if (exponent_digits == 0) return nan;
    }
    if (i != n) return nan;
    return std::strtod(text.c_str(), nullptr);
}

StringSchema StringSchema::min(std::size_t n) const {
    StringSchema out(*this);
    out.checks_.push_back(Check{Check::Min, n, "", nullptr});
    return out;
}

StringSchema StringSchema::max(std::size_t n) const {
    StringSchema out(*this);
    out.checks_.push_back(Check{Check::Max, n, "", nullptr});
    return out;
}

StringSchema StringSchema::pattern(const std::string& regex) const {
    StringSchema out(*this);
    out.checks_.push_back(Check{Check::Pattern, 0, regex, std::make_shared<const std::regex>(regex)});
    return out;
}

Value StringSchema::parse(const Value& data, const std::string& path) const {
    std::string text;
    if (data.isString())
        text = data.asString();
    else if (coerce_ && data.isInt())
        text = std::to_string(data.asInt());
    else if (coerce_ && data.isDouble())
        text = format_number(data.asDouble());
    else if (coerce_ && data.isBool())
        text = data.asBool() ? "true" : "false";
    else
        fail(path, "Expected string");

    for (auto const& check : checks_) {
        switch (check.kind) {
            case Check::Min:
                if (utf8_length(text) < check.length)
                    throw ValidationError(path, "String must be at least " + std::to_string(check.length) +
                                                        " characters");
                break;
            case Check::Max:
                if (utf8_length(text) > check.length)
                    throw ValidationError(path, "String must be at most " + std::to_string(check.length) +
                                                        " characters");
                break;
            case Check::Pattern:
                if (!std::regex_match(text, *check.regex))
                    throw ValidationError(path, "String must match pattern /" + check.source + "/");
                break;
        }
    }
    return Value(std::move(text));
}

Value StringSchema::describe() const {
    Value out{{"type", "string"}};
    for (auto const& check : checks_) {
        if (check.kind == Check::Min) out.set("minLength", static_cast<int64_t>(check.length));
        if (check.kind == Check::Max) out.set("maxLength", static_cast<int64_t>(check.length));
        if (check.kind == Check::Pattern) out.set("pattern", check.source);
    }
    return out;
}

NumberSchema NumberSchema::min(double n) const {
    NumberSchema out(*this);
    out.checks_.push_back(Check{Check::Min, n});
    return out;
}

NumberSchema NumberSchema::max(double n) const {
    NumberSchema out(*this);
    out.checks_.push_back(Check{Check::Max, n});
    return out;
}

NumberSchema NumberSchema::integer() const {
    NumberSchema out(*this);
    out.checks_.push_back(Check{Check::Integer, 0});
    return out;
}

Value NumberSchema::parse(const Value& data, const std::string& path) const {
    const Value* input = &data;
    Value converted;
    if (coerce_ && data.isString()) {
        const std::string trimmed = trim(data.asString());
        if (trimmed.empty()) fail(path, "Expected number");
        converted = number_value(number_from_string(trimmed));
        input = &converted;
    }
    if (!input->isNumber() || std::isnan(input->asDouble())) fail(path, "Expected number");

    const double x = input->asDouble();
    for (auto const& check : checks_) {
        switch (check.kind) {
            case Check::Min:
                if (x < check.value)
                    throw ValidationError(path, "Number must be at least " + format_number(check.value));
                break;
            case Check::Max:
                if (x > check.value)
                    throw ValidationError(path, "Number must be at most " + format_number(check.value));
                break;
            case Check::Integer:
                if (!std::isfinite(x) || std::floor(x) != x)
                    throw ValidationError(path, "Number must be an integer");
                break;
        }
    }
    return *input;
}

Value NumberSchema::describe() const {
    Value out{{"type", "number"}};
    for (auto const& check : checks_) {
        if (check.kind == Check::Min) out.set("minimum", check.value);
        if (check.kind == Check::Max) out.set("maximum", check.value);
        if (check.kind == Check::Integer) out.set("type", "integer");
    }
    return out;
}

Value BooleanSchema::parse(const Value& data, const std::string& path) const {
    if (data.isBool()) return data;
    if (coerce_ && data.isString()) {
        const std::string lower = to_lower(data.asString());
        if (lower == "true" || lower == "1") return Value(true);
        if (lower == "false" || lower == "0" || lower.empty()) return Value(false);
    }
    fail(path, "Expected boolean");
}

}  // namespace sc
