#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace jx {
namespace cli_utils {

// Levenshtein distance, two rolling rows
inline size_t edit_distance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t substitution = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, substitution});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// Closest known option, or "" when nothing is within 3 edits (or 40% of the
// argument's length for long arguments).
inline std::string closest_option(const std::string& arg, const std::vector<std::string>& options) {
    std::string best;
    size_t best_distance = 0;
    for (const auto& option : options) {
        size_t d = edit_distance(arg, option);
        if (best.empty() or d < best_distance) {
            best = option;
            best_distance = d;
        }
    }
    size_t threshold = std::max<size_t>(3, static_cast<size_t>(arg.size() * 0.4));
    if (best.empty() or best_distance > threshold) return "";
    return best;
}

inline std::string unknown_option_message(const std::string& arg, const std::vector<std::string>& options) {
    std::string msg = "Unknown argument: " + arg;
    std::string suggestion = closest_option(arg, options);
    if (not suggestion.empty()) msg += "\n  Did you mean '" + suggestion + "'?";
    return msg;
}

} // namespace cli_utils
} // namespace jx
