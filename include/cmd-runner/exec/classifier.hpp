/*
 * Console error classifier - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cmd-runner/log/error_category.hpp>
#include <string>
#include <vector>

namespace cmdrun {

struct CategoryPatterns {
    std::string category; // mapping key, e.g. "config", "build"
    std::vector<std::string> patterns;
};

// Ordered: categories are scanned front to back.
using ErrorCategoryMapping = std::vector<CategoryPatterns>;

class ErrorClassifier {
public:
    ErrorClassifier(const ErrorCategoryMapping& mapping, CategorySink& sink)
        : m_mapping(mapping), m_sink(sink) {}

    // First matching pattern wins and is reported to the sink. No match
    // leaves the sink untouched. Returns whether a pattern matched.
    bool classify(const std::string& line) const;

private:
    const ErrorCategoryMapping& m_mapping;
    CategorySink& m_sink;
};

} // namespace cmdrun
