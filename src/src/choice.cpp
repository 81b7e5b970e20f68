#include <sc/choice.h>

#include <algorithm>
#include <stdexcept>

#include "trace.h"

namespace sc {

EnumSchema::EnumSchema(std::vector<std::string> values) : values_(std::move(values)) {
    if (values_.empty()) throw std::invalid_argument("enum requires at least one value");
}

Value EnumSchema::parse(const Value& data, const std::string& path) const {
    if (!data.isString() || std::find(values_.begin(), values_.end(), data.asString()) == values_.end()) {
        std::string listed;
        for (auto const& v : values_) {
            if (!listed.empty()) listed += ", ";
            listed += v;
        }
        fail(path, "Expected one of: " + listed);
    }
    return data;
}

Value EnumSchema::describe() const {
    Value::list_t values(values_.begin(), values_.end());
    return Value{{"type", "string"}, {"enum", Value(std::move(values))}};
}

LiteralSchema::LiteralSchema(Value value) : value_(std::move(value)) {
    if (!value_.isString() && !value_.isNumber() && !value_.isBool())
        throw std::invalid_argument("literal must be a string, number or boolean, got " + value_.typeName());
}

Value LiteralSchema::parse(const Value& data, const std::string& path) const {
    if (data != value_) fail(path, "Expected literal " + value_.dump());
    return data;
}

UnionSchema::UnionSchema(std::vector<SchemaRef> members) : members_(std::move(members)) {
    if (members_.empty()) throw std::invalid_argument("union requires at least one member");
}

Value UnionSchema::parse(const Value& data, const std::string& path) const {
    for (size_t i = 0; i < members_.size(); ++i) {
        try {
            return members_[i].parse(data, path);
        } catch (const ValidationError& e) {
            if (trace_enabled()) {
                std::cerr << "union member " << i << " rejected: path='" << path << "' " << e.what() << "\n";
            }
        }
    }
    fail(path, "Value does not match any type in the union");
}

Value UnionSchema::describe() const {
    Value::list_t options;
    for (auto const& member : members_) options.push_back(member.describe());
    return Value{{"oneOf", Value(std::move(options))}};
}

}  // namespace sc
