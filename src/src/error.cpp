#include <sc/error.h>

namespace sc {

ValidationError::ValidationError(std::vector<Issue> issues)
    : std::runtime_error(summarize(issues)), issues_(std::move(issues)) {}

ValidationError::ValidationError(const std::string& path, const std::string& message)
    : ValidationError(std::vector<Issue>{{path, message}}) {}

std::string ValidationError::summarize(const std::vector<Issue>& issues) {
    if (issues.empty()) throw std::invalid_argument("ValidationError requires at least one issue");
    std::string out = "Validation failed: ";
    for (size_t i = 0; i < issues.size(); ++i) {
        if (i) out += ", ";
        out += issues[i].message;
    }
    return out;
}

Value ValidationError::toValue() const {
    Value list = Value::array();
    for (auto const& issue : issues_) list.push_back(Value{{"path", issue.path}, {"message", issue.message}});
    return Value{{"error", "Validation failed"}, {"issues", list}};
}

}  // namespace sc
