#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "sc/instant.h"

namespace sc {

// Render a double the way the validator reports numbers: integral values
// without a fraction, otherwise the shortest text that reads back the same.
// NaN and infinities render as NaN, Infinity and -Infinity.
std::string format_number(double x);

// Untyped value handed to and produced by schemas: a decoded JSON document,
// a query-string map or a route-parameter map.
//
// Undefined is distinct from Null: it marks an absent object key and is what
// a default-constructed Value holds. Objects keep insertion order.
class Value {
  public:
    enum TYPE { Undefined, Null, Boolean, Integer, Double, String, Array, Object, Date };

    using list_t = std::vector<Value>;
    using member_t = std::pair<std::string, Value>;
    using object_t = std::vector<member_t>;

    Value() = default;
    Value(std::nullptr_t) : m_data(nullptr) {}
    Value(bool b) : m_data(b) {}
    Value(int n) : m_data(int64_t(n)) {}
    Value(int64_t n) : m_data(n) {}
    Value(double x) : m_data(x) {}
    Value(const char* s) : m_data(std::string(s)) {}
    Value(const std::string& s) : m_data(s) {}
    Value(std::string&& s) : m_data(std::move(s)) {}
    Value(list_t items) : m_data(std::move(items)) {}
    Value(Instant t) : m_data(t) {}

    // Object from (key, value) pairs; a repeated key keeps the last value.
    Value(std::initializer_list<member_t> init);

    static Value null() { return Value(nullptr); }
    static Value array(list_t items = {}) { return Value(std::move(items)); }
    static Value object(object_t members = {});

    TYPE type() const { return static_cast<TYPE>(m_data.index()); }

    // Name of the kind as seen by a JSON consumer: "number" covers both
    // Integer and Double.
    std::string typeName() const;

    bool isUndefined() const { return type() == Undefined; }
    bool isNull() const { return type() == Null; }
    bool isBool() const { return type() == Boolean; }
    bool isInt() const { return type() == Integer; }
    bool isDouble() const { return type() == Double; }
    bool isNumber() const { return isInt() || isDouble(); }
    bool isString() const { return type() == String; }
    bool isArray() const { return type() == Array; }
    bool isObject() const { return type() == Object; }
    bool isDate() const { return type() == Date; }

    bool asBool() const;
    int64_t asInt() const;
    double asDouble() const;
    const std::string& asString() const;
    const list_t& asArray() const;
    const object_t& asObject() const;
    Instant asInstant() const;

    // Element count of an array or object; 0 for scalars.
    std::size_t size() const noexcept;

    bool has(const std::string& key) const { return find(key) != nullptr; }
    const Value* find(const std::string& key) const;
    // Copy of the member, or Undefined when absent (or when this is not an object).
    Value get(const std::string& key) const;
    const Value& at(const std::string& key) const;
    const Value& at(std::size_t index) const;
    std::vector<std::string> keys() const;

    // Insert or replace a member. A value that is not an object becomes an
    // empty object first.
    Value& set(const std::string& key, Value v);
    // Append an element. A value that is not an array becomes an empty array first.
    Value& push_back(Value v);

    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return !(*this == rhs); }

    // JSON text. indent == 0 gives the compact form.
    std::string dump(int indent = 0) const;

  private:
    void dumpTo(std::string& out, int indent, int level) const;

    std::variant<std::monostate, std::nullptr_t, bool, int64_t, double, std::string, list_t, object_t, Instant>
                m_data;
};

std::string escape_json_string(const std::string& s);

inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << v.dump();
    return os;
}

}  // namespace sc
