#pragma once

#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "sc/schema.h"

namespace sc {

// Accepts strings. Constraints run in the order they were attached and the
// first one that fails is reported.
//
// A coercing StringSchema (v::coerce::string()) also accepts numbers and
// booleans, converted to text before the constraints run.
class StringSchema : public SchemaBase<StringSchema> {
  public:
    struct Check {
        enum Kind { Min, Max, Pattern };
        Kind kind;
        std::size_t length = 0;
        std::string source;
        std::shared_ptr<const std::regex> regex;
    };

    explicit StringSchema(bool coerce = false) : coerce_(coerce) {}

    // Length bounds count Unicode code points.
    StringSchema min(std::size_t n) const;
    StringSchema max(std::size_t n) const;
    // ECMAScript regular expression that must match the whole string.
    // Throws std::regex_error for an invalid expression.
    StringSchema pattern(const std::string& regex) const;

    SchemaKind kind() const noexcept override { return SchemaKind::String; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override;

    bool coerces() const noexcept { return coerce_; }
    const std::vector<Check>& checks() const noexcept { return checks_; }

  private:
    bool coerce_;
    std::vector<Check> checks_;
};

// Accepts numbers (integer or double) other than NaN.
//
// A coercing NumberSchema (v::coerce::number()) also accepts numeric text:
// surrounding whitespace is trimmed and blank text is rejected.
class NumberSchema : public SchemaBase<NumberSchema> {
  public:
    struct Check {
        enum Kind { Min, Max, Integer };
        Kind kind;
        double value = 0;
    };

    explicit NumberSchema(bool coerce = false) : coerce_(coerce) {}

    NumberSchema min(double n) const;
    NumberSchema max(double n) const;
    NumberSchema integer() const;

    SchemaKind kind() const noexcept override { return SchemaKind::Number; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override;

    bool coerces() const noexcept { return coerce_; }
    const std::vector<Check>& checks() const noexcept { return checks_; }

  private:
    bool coerce_;
    std::vector<Check> checks_;
};

// Accepts true and false.
//
// A coercing BooleanSchema (v::coerce::boolean()) also maps the strings
// "true"/"1" and "false"/"0"/"" (any letter case).
class BooleanSchema : public SchemaBase<BooleanSchema> {
  public:
    explicit BooleanSchema(bool coerce = false) : coerce_(coerce) {}

    SchemaKind kind() const noexcept override { return SchemaKind::Boolean; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override { return Value{{"type", "boolean"}}; }

    bool coerces() const noexcept { return coerce_; }

  private:
    bool coerce_;
};

// Numeric value of `text` under JavaScript Number() rules for trimmed,
// non-empty input: decimal literals with optional sign, fraction and
// exponent, "Infinity", and unsigned 0x/0o/0b integers. NaN when the text
// is not a number.
double number_from_string(const std::string& text);

// Count of Unicode code points in UTF-8 text.
std::size_t utf8_length(const std::string& text);

}  // namespace sc
