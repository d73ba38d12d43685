/*
 * Console pattern matching - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Patterns are literal fragments separated by '*'. Each fragment must occur
 *   in the text, in order, without overlapping. Matching is a substring test,
 *   not anchored to the start or end of the text.
 */
#pragma once
#include <string>
#include <vector>

namespace cmdrun {

// True if text contains every '*'-separated fragment of pattern in order.
// An empty pattern matches only empty text.
bool match_pattern(const std::string& text, const std::string& pattern);

// Split pattern on '*' (empty fragments preserved).
std::vector<std::string> split_pattern(const std::string& pattern);

} // namespace cmdrun
