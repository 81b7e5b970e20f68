#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "sc/error.h"
#include "sc/value.h"

namespace sc {

enum class SchemaKind {
    String,
    Number,
    Boolean,
    Array,
    Object,
    Record,
    Enum,
    Literal,
    Union,
    Date,
    Optional,
    Nullable,
    Transform
};

std::string to_string(SchemaKind kind);

// Base of every validation rule.
//
// A schema is immutable: builder calls such as min() or withMessage() return
// a modified copy. parse() keeps its issues and paths on the caller's stack,
// so concurrent parse() calls may share one instance.
class Schema {
  public:
    virtual ~Schema() = default;

    virtual SchemaKind kind() const noexcept = 0;

    // Validate `data` and return the accepted (possibly converted) value.
    // Throws ValidationError with every issue anchored at `path` or below.
    virtual Value parse(const Value& data, const std::string& path = "") const = 0;

    // JSON-Schema-like description for documentation tooling. Reads schema
    // metadata only.
    virtual Value describe() const = 0;

    // True when an Optional appears anywhere in this schema's wrapper chain;
    // such an object field may be absent and is not listed as required.
    virtual bool isOptional() const noexcept { return false; }

    const std::optional<std::string>& customMessage() const noexcept { return message_; }

  protected:
    // Raise the primary type/shape failure, honouring withMessage().
    [[noreturn]] void fail(const std::string& path, const std::string& default_message) const;

    std::optional<std::string> message_;
};

using SchemaPtr = std::shared_ptr<const Schema>;

// Shared handle to an immutable schema node. Every concrete schema converts
// to it implicitly, which keeps shape declarations short:
//
//   v::object({{"name", v::string().min(1)}, {"age", v::number().optional()}})
class SchemaRef {
  public:
    template <typename S,
              typename = std::enable_if_t<std::is_base_of<Schema, std::decay_t<S> >::value> >
    SchemaRef(S&& schema) : ptr_(std::make_shared<std::decay_t<S> >(std::forward<S>(schema))) {}

    explicit SchemaRef(SchemaPtr ptr);

    Value parse(const Value& data, const std::string& path = "") const { return ptr_->parse(data, path); }
    Value describe() const { return ptr_->describe(); }

    const Schema& operator*() const noexcept { return *ptr_; }
    const Schema* operator->() const noexcept { return ptr_.get(); }
    const SchemaPtr& ptr() const noexcept { return ptr_; }

  private:
    SchemaPtr ptr_;
};

class OptionalSchema;
class NullableSchema;
class TransformSchema;

using TransformFn = std::function<Value(const Value&)>;

// Builder surface shared by every schema kind. Each call returns a new
// schema; `Derived` is the concrete schema type.
template <typename Derived>
class SchemaBase : public Schema {
  public:
    // Replace the default message of this schema's own type/shape failure.
    // Constraint messages and child issues are unaffected.
    Derived withMessage(std::string msg) const {
        Derived copy(self());
        copy.message_ = std::move(msg);
        return copy;
    }

    OptionalSchema optional() const;
    NullableSchema nullable() const;
    TransformSchema transform(TransformFn fn) const;

  protected:
    const Derived& self() const { return static_cast<const Derived&>(*this); }
};

// Absent (undefined) input passes through as undefined; anything else,
// including null, is handed to the inner schema.
class OptionalSchema : public SchemaBase<OptionalSchema> {
  public:
    explicit OptionalSchema(SchemaRef inner) : inner_(std::move(inner)) {}

    SchemaKind kind() const noexcept override { return SchemaKind::Optional; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override;
    bool isOptional() const noexcept override { return true; }

    const SchemaRef& inner() const noexcept { return inner_; }

  private:
    SchemaRef inner_;
};

// Null input passes through as null; anything else goes to the inner schema.
class NullableSchema : public SchemaBase<NullableSchema> {
  public:
    explicit NullableSchema(SchemaRef inner) : inner_(std::move(inner)) {}

    SchemaKind kind() const noexcept override { return SchemaKind::Nullable; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override;
    bool isOptional() const noexcept override { return inner_->isOptional(); }

    const SchemaRef& inner() const noexcept { return inner_; }

  private:
    SchemaRef inner_;
};

// Validates through the inner schema, then maps the result with `fn`.
// Exceptions thrown by `fn` reach the caller unchanged.
class TransformSchema : public SchemaBase<TransformSchema> {
  public:
    TransformSchema(SchemaRef inner, TransformFn fn);

    SchemaKind kind() const noexcept override { return SchemaKind::Transform; }
    Value parse(const Value& data, const std::string& path = "") const override;
    Value describe() const override { return inner_.describe(); }
    bool isOptional() const noexcept override { return inner_->isOptional(); }

    const SchemaRef& inner() const noexcept { return inner_; }

  private:
    SchemaRef inner_;
    TransformFn fn_;
};

template <typename Derived>
OptionalSchema SchemaBase<Derived>::optional() const {
    return OptionalSchema(SchemaRef(self()));
}

template <typename Derived>
NullableSchema SchemaBase<Derived>::nullable() const {
    return NullableSchema(SchemaRef(self()));
}

template <typename Derived>
TransformSchema SchemaBase<Derived>::transform(TransformFn fn) const {
    return TransformSchema(SchemaRef(self()), std::move(fn));
}

}  // namespace sc
