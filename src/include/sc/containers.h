#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "sc/schema.h"

namespace sc {

// Accepts arrays whose every element satisfies the item schema. Length
// bounds are checked first and fail fast; element failures (paths
// "<path>[i]") are then collected across the whole array.
class ArraySchema : public SchemaBase<ArraySchema> {
  public:
    struct Check {
        enum Kind { Min, Max };
        Kind kind;
        std::size_t length = 0;
    };

    explicit ArraySchema(SchemaRef item) : item_(std::move(item)) {}

    ArraySchema min(std::size_t n) const;
    ArraySchema max(std::size_t n) const;

    SchemaKind kind() const noexcept override { return SchemaKind::Array; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override;

    const SchemaRef& item() const noexcept { return item_; }
    const std::vector<Check>& checks() const noexcept { return checks_; }

  private:
    SchemaRef item_;
    std::vector<Check> checks_;
};

// Accepts objects with a fixed set of named fields. Keys not in the shape are
// dropped from the result; fields whose schema yields undefined are omitted.
class ObjectSchema : public SchemaBase<ObjectSchema> {
  public:
    using Shape = std::vector<std::pair<std::string, SchemaRef> >;

    // Throws std::invalid_argument when a field name repeats.
    explicit ObjectSchema(Shape shape);

    SchemaKind kind() const noexcept override { return SchemaKind::Object; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override;

    const Shape& shape() const noexcept { return shape_; }
    // Field names whose schema is not optional, in declaration order.
    std::vector<std::string> requiredKeys() const;

  private:
    Shape shape_;
};

// Accepts objects with arbitrary keys whose values all satisfy one schema.
class RecordSchema : public SchemaBase<RecordSchema> {
  public:
    explicit RecordSchema(SchemaRef value) : value_(std::move(value)) {}

    SchemaKind kind() const noexcept override { return SchemaKind::Record; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override;

    const SchemaRef& valueSchema() const noexcept { return value_; }

  private:
    SchemaRef value_;
};

// Child path for an object member: "key" at the root, "parent.key" below it.
std::string join_path(const std::string& path, const std::string& key);

}  // namespace sc
