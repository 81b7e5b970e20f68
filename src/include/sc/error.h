#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "sc/value.h"

namespace sc {

// A single validation failure. `path` addresses the offending value from the
// validation root: "" for the root, "user.name", "items[2]", "[0].id".
struct Issue {
    std::string path;
    std::string message;

    bool operator==(const Issue& rhs) const { return path == rhs.path && message == rhs.message; }
    bool operator!=(const Issue& rhs) const { return !(*this == rhs); }
};

inline std::ostream& operator<<(std::ostream& os, const Issue& issue) {
    os << (issue.path.empty() ? std::string("<root>") : issue.path) << ": " << issue.message;
    return os;
}

// The only exception the schemas raise for bad input. Always carries at
// least one issue; what() reads "Validation failed: <m1>, <m2>, ...".
class ValidationError : public std::runtime_error {
  public:
    // Throws std::invalid_argument when `issues` is empty.
    explicit ValidationError(std::vector<Issue> issues);
    ValidationError(const std::string& path, const std::string& message);

    const std::vector<Issue>& issues() const noexcept { return issues_; }

    // Response body for a rejected request:
    //   {"error": "Validation failed", "issues": [{"path": ..., "message": ...}, ...]}
    Value toValue() const;

  private:
    static std::string summarize(const std::vector<Issue>& issues);

    std::vector<Issue> issues_;
};

}  // namespace sc
