#include <sc/query.h>

namespace sc {

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

std::string percent_decode(const std::string& text, bool plus_as_space) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+' && plus_as_space) {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size() && hex_digit(text[i + 1]) >= 0 && hex_digit(text[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_digit(text[i + 1]) * 16 + hex_digit(text[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

ParamList decode_query(const std::string& text) {
    ParamList pairs;
    size_t start = (!text.empty() && text[0] == '?') ? 1 : 0;
    while (start <= text.size()) {
        size_t end = text.find('&', start);
        if (end == std::string::npos) end = text.size();
        std::string part = text.substr(start, end - start);
        if (!part.empty()) {
            size_t eq = part.find('=');
            if (eq == std::string::npos)
                pairs.emplace_back(percent_decode(part), "");
            else
                pairs.emplace_back(percent_decode(part.substr(0, eq)), percent_decode(part.substr(eq + 1)));
        }
        start = end + 1;
    }
    return pairs;
}

Value params_to_value(const ParamList& params) {
    Value out = Value::object();
    for (auto const& p : params) {
        if (!out.has(p.first)) out.set(p.first, p.second);
    }
    return out;
}

Value parse_query(const std::string& text) { return params_to_value(decode_query(text)); }

}  // namespace sc
