#include <sc/date.h>

#include <stdexcept>

namespace sc {

static Instant require_instant(const std::string& text) {
    auto parsed = parse_iso8601(text);
    if (!parsed) throw std::invalid_argument("not an ISO 8601 date: '" + text + "'");
    return *parsed;
}

DateSchema DateSchema::min(Instant bound) const {
    DateSchema out(*this);
    out.checks_.push_back(Check{Check::Min, bound});
    return out;
}

DateSchema DateSchema::max(Instant bound) const {
    DateSchema out(*this);
    out.checks_.push_back(Check{Check::Max, bound});
    return out;
}

DateSchema DateSchema::min(const std::string& bound) const { return min(require_instant(bound)); }

DateSchema DateSchema::max(const std::string& bound) const { return max(require_instant(bound)); }

Value DateSchema::parse(const Value& data, const std::string& path) const {
    if (!data.isString()) fail(path, "Expected date string");
    auto parsed = parse_iso8601(data.asString());
    if (!parsed) fail(path, "Invalid date");

    const Instant when = *parsed;
    for (auto const& check : checks_) {
        if (check.kind == Check::Min && when < check.bound)
            throw ValidationError(path, "Date must be on or after " + format_iso8601(check.bound));
        if (check.kind == Check::Max && when > check.bound)
            throw ValidationError(path, "Date must be on or before " + format_iso8601(check.bound));
    }
    return Value(when);
}

}  // namespace sc
