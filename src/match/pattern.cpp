/*
 * Console pattern matching implementation - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cmd-runner/match/pattern.hpp>

namespace cmdrun {

std::vector<std::string> split_pattern(const std::string& pattern) {
    std::vector<std::string> parts;
    size_t start=0;
    while (true) {
        size_t star = pattern.find('*', start);
        if (star == std::string::npos) { parts.push_back(pattern.substr(start)); break; }
        parts.push_back(pattern.substr(start, star-start));
        start = star+1;
    }
    return parts;
}

bool match_pattern(const std::string& text, const std::string& pattern) {
    if (pattern.empty()) return text.empty();
    size_t cursor = 0;
    for (auto &frag : split_pattern(pattern)) {
        // Greedy: first occurrence at or after cursor, no backtracking.
        size_t pos = text.find(frag, cursor);
        if (pos == std::string::npos) return false;
        cursor = pos + frag.size();
    }
    return true;
}

} // namespace cmdrun
