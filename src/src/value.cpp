#include <sc/value.h>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace sc {

std::string format_number(double x) {
    if (std::isnan(x)) return "NaN";
    if (std::isinf(x)) return x < 0 ? "-Infinity" : "Infinity";
    if (x == 0) return "0";
    if (std::floor(x) == x && std::fabs(x) < 9007199254740992.0) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(0) << x;
        return ss.str();
    }
    if (std::floor(x) == x && std::fabs(x) < 1e21) {
        // shortest round-trip digits, padded with zeros: 1.2345678901234568e20 -> "123456789012345680000"
        std::string sci;
        for (int precision = 15; precision <= 17; ++precision) {
            std::ostringstream ss;
            ss << std::scientific << std::setprecision(precision - 1) << x;
            sci = ss.str();
            if (std::strtod(sci.c_str(), nullptr) == x) break;
        }
        auto e = sci.find('e');
        int exponent = std::atoi(sci.c_str() + e + 1);
        std::string digits;
        for (size_t k = 0; k < e; ++k)
            if (std::isdigit(static_cast<unsigned char>(sci[k]))) digits.push_back(sci[k]);
        while (digits.size() > 1 && digits.back() == '0') digits.pop_back();
        if (static_cast<int>(digits.size()) <= exponent + 1) {
            digits.append(static_cast<size_t>(exponent + 1) - digits.size(), '0');
            return (x < 0 ? "-" : "") + digits;
        }
    }
    std::string text;
    for (int precision = 15; precision <= 17; ++precision) {
        std::ostringstream ss;
        ss << std::setprecision(precision) << x;
        text = ss.str();
        if (std::strtod(text.c_str(), nullptr) == x) break;
    }
    // "1e-07" -> "1e-7"
    auto e = text.find('e');
    if (e != std::string::npos) {
        size_t digits = e + 2;
        while (digits + 1 < text.size() && text[digits] == '0') text.erase(digits, 1);
    }
    return text;
}

Value::Value(std::initializer_list<member_t> init) : m_data(object_t{}) {
    for (auto const& p : init) set(p.first, p.second);
}

Value Value::object(object_t members) {
    Value out = Value(std::initializer_list<member_t>{});
    for (auto& p : members) out.set(p.first, std::move(p.second));
    return out;
}

std::string Value::typeName() const {
    switch (type()) {
        case Undefined:
            return "undefined";
        case Null:
            return "null";
        case Boolean:
            return "boolean";
        case Integer:
        case Double:
            return "number";
        case String:
            return "string";
        case Array:
            return "array";
        case Object:
            return "object";
        case Date:
            return "date";
    }
    return "unknown";
}

bool Value::asBool() const {
    if (isBool()) return std::get<bool>(m_data);
    throw std::runtime_error("not a bool");
}

int64_t Value::asInt() const {
    if (isInt()) return std::get<int64_t>(m_data);
    if (isDouble()) return static_cast<int64_t>(std::get<double>(m_data));
    throw std::runtime_error("not an int");
}

double Value::asDouble() const {
    if (isDouble()) return std::get<double>(m_data);
    if (isInt()) return static_cast<double>(std::get<int64_t>(m_data));
    throw std::runtime_error("not a double");
}

const std::string& Value::asString() const {
    if (isString()) return std::get<std::string>(m_data);
    throw std::runtime_error("not a string");
}

const Value::list_t& Value::asArray() const {
    if (isArray()) return std::get<list_t>(m_data);
    throw std::runtime_error("not an array");
}

const Value::object_t& Value::asObject() const {
    if (isObject()) return std::get<object_t>(m_data);
    throw std::runtime_error("not an object");
}

Instant Value::asInstant() const {
    if (isDate()) return std::get<Instant>(m_data);
    throw std::runtime_error("not a date");
}

std::size_t Value::size() const noexcept {
    if (isArray()) return std::get<list_t>(m_data).size();
    if (isObject()) return std::get<object_t>(m_data).size();
    return 0;
}

const Value* Value::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    for (auto const& p : std::get<object_t>(m_data)) {
        if (p.first == key) return &p.second;
    }
    return nullptr;
}

Value Value::get(const std::string& key) const {
    const Value* v = find(key);
    return v ? *v : Value();
}

const Value& Value::at(const std::string& key) const {
    if (const Value* v = find(key)) return *v;

    // didn't find it, throw a decent error message
    std::ostringstream ss;
    ss << "Could not find key <" << key << "> available options are: ";
    bool first = true;
    for (auto const& k : keys()) {
        if (!first) ss << ",";
        first = false;
        ss << '"' << k << '"';
    }
    throw std::out_of_range(ss.str());
}

const Value& Value::at(std::size_t index) const {
    if (!isArray()) throw std::logic_error("Not a list");
    return std::get<list_t>(m_data).at(index);
}

std::vector<std::string> Value::keys() const {
    std::vector<std::string> out;
    if (!isObject()) return out;
    for (auto const& p : std::get<object_t>(m_data)) out.push_back(p.first);
    return out;
}

Value& Value::set(const std::string& key, Value v) {
    if (!isObject()) m_data = object_t{};
    auto& members = std::get<object_t>(m_data);
    for (auto& p : members) {
        if (p.first == key) {
            p.second = std::move(v);
            return *this;
        }
    }
    members.emplace_back(key, std::move(v));
    return *this;
}

Value& Value::push_back(Value v) {
    if (!isArray()) m_data = list_t{};
    std::get<list_t>(m_data).push_back(std::move(v));
    return *this;
}

bool Value::operator==(const Value& rhs) const {
    if (isNumber() && rhs.isNumber()) {
        if (isInt() && rhs.isInt()) return asInt() == rhs.asInt();
        return asDouble() == rhs.asDouble();
    }
    if (type() != rhs.type()) return false;
    switch (type()) {
        case Undefined:
        case Null:
            return true;
        case Boolean:
            return asBool() == rhs.asBool();
        case String:
            return asString() == rhs.asString();
        case Array:
            return asArray() == rhs.asArray();
        case Object: {
            if (size() != rhs.size()) return false;
            for (auto const& p : asObject()) {
                const Value* other = rhs.find(p.first);
                if (other == nullptr || *other != p.second) return false;
            }
            return true;
        }
        case Date:
            return asInstant() == rhs.asInstant();
        default:
            break;
    }
    return false;
}

std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    result.push_back('"');
    return result;
}

std::string Value::dump(int indent) const {
    std::string out;
    dumpTo(out, indent, 0);
    return out;
}

void Value::dumpTo(std::string& out, int indent, int level) const {
    auto newline = [&](int lvl) {
        if (indent <= 0) return;
        out.push_back('\n');
        out.append(static_cast<size_t>(lvl * indent), ' ');
    };

    switch (type()) {
        case Undefined:
        case Null:
            out += "null";
            return;
        case Boolean:
            out += asBool() ? "true" : "false";
            return;
        case Integer:
            out += std::to_string(asInt());
            return;
        case Double: {
            double x = asDouble();
            out += std::isfinite(x) ? format_number(x) : "null";
            return;
        }
        case String:
            out += escape_json_string(asString());
            return;
        case Date:
            out += escape_json_string(format_iso8601(asInstant()));
            return;
        case Array: {
            const auto& items = asArray();
            if (items.empty()) {
                out += "[]";
                return;
            }
            out.push_back('[');
            for (size_t i = 0; i < items.size(); ++i) {
                if (i) out.push_back(',');
                newline(level + 1);
                items[i].dumpTo(out, indent, level + 1);
            }
            newline(level);
            out.push_back(']');
            return;
        }
        case Object: {
            bool first = true;
            out.push_back('{');
            for (auto const& p : asObject()) {
                // undefined members are not part of the JSON text
                if (p.second.isUndefined()) continue;
                if (!first) out.push_back(',');
                first = false;
                newline(level + 1);
                out += escape_json_string(p.first);
                out += indent > 0 ? ": " : ":";
                p.second.dumpTo(out, indent, level + 1);
            }
            if (!first) newline(level);
            out.push_back('}');
            return;
        }
    }
}

}  // namespace sc
