#pragma once

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace sc {
namespace cli_utils {

// Number of single-character insertions, deletions and substitutions
// needed to turn `a` into `b`.
inline int edit_distance(const std::string& a, const std::string& b) {
    std::vector<int> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = static_cast<int>(i);
        for (size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1])
                cur[j] = prev[j - 1];
            else
                cur[j] = 1 + std::min({prev[j], cur[j - 1], prev[j - 1]});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// Closest candidate to `word`, or "" when nothing is within three edits
// (or 40% of the word's length, whichever is larger).
inline std::string closest_match(const std::string& word, const std::vector<std::string>& candidates) {
    int best = std::numeric_limits<int>::max();
    std::string match;
    for (auto const& c : candidates) {
        int d = edit_distance(word, c);
        if (d < best) {
            best = d;
            match = c;
        }
    }
    int threshold = std::max(3, static_cast<int>(word.length() * 0.4));
    return best <= threshold ? match : std::string();
}

inline std::string unknown_command_error(const std::string& command, const std::vector<std::string>& commands) {
    std::string error = "Unknown command: " + command;
    std::string suggestion = closest_match(command, commands);
    if (!suggestion.empty()) error += "\n  Did you mean '" + suggestion + "'?";
    return error;
}

}  // namespace cli_utils
}  // namespace sc
