#include <sc/schema.h>

#include <stdexcept>

namespace sc {

std::string to_string(SchemaKind kind) {
    switch (kind) {
        case SchemaKind::String:
            return "string";
        case SchemaKind::Number:
            return "number";
        case SchemaKind::Boolean:
            return "boolean";
        case SchemaKind::Array:
            return "array";
        case SchemaKind::Object:
            return "object";
        case SchemaKind::Record:
            return "record";
        case SchemaKind::Enum:
            return "enum";
        case SchemaKind::Literal:
            return "literal";
        case SchemaKind::Union:
            return "union";
        case SchemaKind::Date:
            return "date";
        case SchemaKind::Optional:
            return "optional";
        case SchemaKind::Nullable:
            return "nullable";
        case SchemaKind::Transform:
            return "transform";
    }
    throw std::logic_error("Not a valid schema kind");
}

void Schema::fail(const std::string& path, const std::string& default_message) const {
    throw ValidationError(path, message_ ? *message_ : default_message);
}

SchemaRef::SchemaRef(SchemaPtr ptr) : ptr_(std::move(ptr)) {
    if (!ptr_) throw std::invalid_argument("SchemaRef requires a schema");
}

Value OptionalSchema::parse(const Value& data, const std::string& path) const {
    if (data.isUndefined()) return Value();
    return inner_.parse(data, path);
}

Value OptionalSchema::describe() const { return inner_.describe(); }

Value NullableSchema::parse(const Value& data, const std::string& path) const {
    if (data.isNull()) return Value::null();
    return inner_.parse(data, path);
}

Value NullableSchema::describe() const {
    return Value{{"oneOf", Value::array({inner_.describe(), Value{{"type", "null"}}})}};
}

TransformSchema::TransformSchema(SchemaRef inner, TransformFn fn) : inner_(std::move(inner)), fn_(std::move(fn)) {
    if (!fn_) throw std::invalid_argument("transform requires a callable");
}

Value TransformSchema::parse(const Value& data, const std::string& path) const {
    return fn_(inner_.parse(data, path));
}

}  // namespace sc
