#pragma once

#include <string>
#include <vector>

#include "sc/choice.h"
#include "sc/containers.h"
#include "sc/date.h"
#include "sc/primitives.h"

// Short constructors for every schema kind:
//
//   auto user = sc::v::object({
//       {"name", sc::v::string().min(1).max(100)},
//       {"age", sc::v::number().integer().min(0).optional()},
//       {"role", sc::v::enum_of({"admin", "user"})},
//   });
namespace sc::v {

inline StringSchema string() { return StringSchema(); }
inline NumberSchema number() { return NumberSchema(); }
inline BooleanSchema boolean() { return BooleanSchema(); }
inline DateSchema date() { return DateSchema(); }

inline ArraySchema array(SchemaRef item) { return ArraySchema(std::move(item)); }
inline ObjectSchema object(ObjectSchema::Shape shape) { return ObjectSchema(std::move(shape)); }
inline RecordSchema record(SchemaRef value) { return RecordSchema(std::move(value)); }

inline EnumSchema enum_of(std::vector<std::string> values) { return EnumSchema(std::move(values)); }
inline LiteralSchema literal(Value value) { return LiteralSchema(std::move(value)); }
inline UnionSchema union_of(std::vector<SchemaRef> members) { return UnionSchema(std::move(members)); }

// Variants that convert transport strings (query strings, route params)
// before validating.
namespace coerce {
    inline StringSchema string() { return StringSchema(true); }
    inline NumberSchema number() { return NumberSchema(true); }
    inline BooleanSchema boolean() { return BooleanSchema(true); }
}  // namespace coerce

}  // namespace sc::v
