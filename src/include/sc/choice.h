#pragma once

#include <string>
#include <vector>

#include "sc/schema.h"

namespace sc {

// Accepts one of a fixed list of strings.
class EnumSchema : public SchemaBase<EnumSchema> {
  public:
    // Throws std::invalid_argument for an empty list.
    explicit EnumSchema(std::vector<std::string> values);

    SchemaKind kind() const noexcept override { return SchemaKind::Enum; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override;

    const std::vector<std::string>& values() const noexcept { return values_; }

  private:
    std::vector<std::string> values_;
};

// Accepts exactly one string, number or boolean. Integer and double inputs
// compare numerically; other kinds never match across types.
class LiteralSchema : public SchemaBase<LiteralSchema> {
  public:
    // Throws std::invalid_argument unless `value` is a string, number or boolean.
    explicit LiteralSchema(Value value);

    SchemaKind kind() const noexcept override { return SchemaKind::Literal; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override { return Value{{"const", value_}}; }

    const Value& value() const noexcept { return value_; }

  private:
    Value value_;
};

// Tries each member in order and returns the first successful result.
// Member failures are discarded; when every member rejects the input a
// single generic issue is raised.
class UnionSchema : public SchemaBase<UnionSchema> {
  public:
    // Throws std::invalid_argument for an empty member list.
    explicit UnionSchema(std::vector<SchemaRef> members);

    SchemaKind kind() const noexcept override { return SchemaKind::Union; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override;

    const std::vector<SchemaRef>& members() const noexcept { return members_; }

  private:
    std::vector<SchemaRef> members_;
};

}  // namespace sc
