/*
 * Console error classifier implementation - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cmd-runner/exec/classifier.hpp>
#include <cmd-runner/match/pattern.hpp>

namespace cmdrun {

bool ErrorClassifier::classify(const std::string& line) const {
    for (auto &entry : m_mapping) {
        for (auto &pat : entry.patterns) {
            if (match_pattern(line, pat)) {
                m_sink.set(error_category_from_string(entry.category), entry.category);
                return true;
            }
        }
    }
    return false;
}

} // namespace cmdrun
