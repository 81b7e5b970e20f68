#pragma once

#include <string>
#include <vector>

#include "sc/instant.h"
#include "sc/schema.h"

namespace sc {

// Accepts ISO 8601 date or date-time strings and produces a Date value.
// Bounds are inclusive and compare instants.
class DateSchema : public SchemaBase<DateSchema> {
  public:
    struct Check {
        enum Kind { Min, Max };
        Kind kind;
        Instant bound;
    };

    DateSchema min(Instant bound) const;
    DateSchema max(Instant bound) const;
    // Boundary given as ISO 8601 text; throws std::invalid_argument when it
    // does not parse.
    DateSchema min(const std::string& bound) const;
    DateSchema max(const std::string& bound) const;

    SchemaKind kind() const noexcept override { return SchemaKind::Date; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override { return Value{{"type", "string"}, {"format", "date-time"}}; }

    const std::vector<Check>& checks() const noexcept { return checks_; }

  private:
    std::vector<Check> checks_;
};

}  // namespace sc
