#include <sc/containers.h>

#include <set>
#include <stdexcept>

#include "trace.h"

namespace sc {

std::string join_path(const std::string& path, const std::string& key) {
    if (path.empty()) return key;
    return path + "." + key;
}

static void trace_enter(const char* what, const std::string& path, const Value& data) {
    if (trace_enabled()) {
        std::cerr << what << " enter: path='" << path << "' size=" << data.size() << "\n";
    }
}

static void raise_collected(const char* what, const std::string& path, std::vector<Issue>&& issues) {
    if (trace_enabled()) {
        std::cerr << what << " rejected: path='" << path << "' issues=" << issues.size() << "\n";
    }
    throw ValidationError(std::move(issues));
}

ArraySchema ArraySchema::min(std::size_t n) const {
    ArraySchema out(*this);
    out.checks_.push_back(Check{Check::Min, n});
    return out;
}

ArraySchema ArraySchema::max(std::size_t n) const {
    ArraySchema out(*this);
    out.checks_.push_back(Check{Check::Max, n});
    return out;
}

Value ArraySchema::parse(const Value& data, const std::string& path) const {
    if (!data.isArray()) fail(path, "Expected array");
    const auto& items = data.asArray();

    for (auto const& check : checks_) {
        if (check.kind == Check::Min && items.size() < check.length)
            throw ValidationError(path, "Array must have at least " + std::to_string(check.length) + " items");
        if (check.kind == Check::Max && items.size() > check.length)
            throw ValidationError(path, "Array must have at most " + std::to_string(check.length) + " items");
    }

    trace_enter("array", path, data);
    std::vector<Issue> issues;
    Value::list_t result;
    result.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        try {
            result.push_back(item_.parse(items[i], path + "[" + std::to_string(i) + "]"));
        } catch (const ValidationError& e) {
            issues.insert(issues.end(), e.issues().begin(), e.issues().end());
        }
    }
    if (!issues.empty()) raise_collected("array", path, std::move(issues));
    return Value(std::move(result));
}

Value ArraySchema::describe() const {
    Value out{{"type", "array"}, {"items", item_.describe()}};
    for (auto const& check : checks_) {
        if (check.kind == Check::Min) out.set("minItems", static_cast<int64_t>(check.length));
        if (check.kind == Check::Max) out.set("maxItems", static_cast<int64_t>(check.length));
    }
    return out;
}

ObjectSchema::ObjectSchema(Shape shape) : shape_(std::move(shape)) {
    std::set<std::string> seen;
    for (auto const& field : shape_) {
        if (!seen.insert(field.first).second)
            throw std::invalid_argument("object shape declares '" + field.first + "' more than once");
    }
}

std::vector<std::string> ObjectSchema::requiredKeys() const {
    std::vector<std::string> keys;
    for (auto const& field : shape_)
        if (!field.second->isOptional()) keys.push_back(field.first);
    return keys;
}

Value ObjectSchema::parse(const Value& data, const std::string& path) const {
    if (!data.isObject()) fail(path, "Expected object");

    trace_enter("object", path, data);
    std::vector<Issue> issues;
    Value::object_t result;
    for (auto const& field : shape_) {
        const Value* member = data.find(field.first);
        try {
            Value parsed = field.second.parse(member ? *member : Value(), join_path(path, field.first));
            if (!parsed.isUndefined()) result.emplace_back(field.first, std::move(parsed));
        } catch (const ValidationError& e) {
            issues.insert(issues.end(), e.issues().begin(), e.issues().end());
        }
    }
    if (!issues.empty()) raise_collected("object", path, std::move(issues));
    return Value::object(std::move(result));
}

Value ObjectSchema::describe() const {
    Value properties = Value::object();
    for (auto const& field : shape_) properties.set(field.first, field.second.describe());

    Value out{{"type", "object"}, {"properties", std::move(properties)}};
    auto required = requiredKeys();
    if (!required.empty()) {
        Value::list_t names(required.begin(), required.end());
        out.set("required", Value(std::move(names)));
    }
    return out;
}

Value RecordSchema::parse(const Value& data, const std::string& path) const {
    if (!data.isObject()) fail(path, "Expected object");

    trace_enter("record", path, data);
    std::vector<Issue> issues;
    Value::object_t result;
    for (auto const& member : data.asObject()) {
        try {
            Value parsed = value_.parse(member.second, join_path(path, member.first));
            if (!parsed.isUndefined()) result.emplace_back(member.first, std::move(parsed));
        } catch (const ValidationError& e) {
            issues.insert(issues.end(), e.issues().begin(), e.issues().end());
        }
    }
    if (!issues.empty()) raise_collected("record", path, std::move(issues));
    return Value::object(std::move(result));
}

Value RecordSchema::describe() const {
    return Value{{"type", "object"}, {"additionalProperties", value_.describe()}};
}

}  // namespace sc
