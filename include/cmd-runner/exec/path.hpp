/*
 * PATH resolution utilities - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace cmdrun {

// Resolve command name against a colon-separated search path.
// If cmd contains '/' it is returned as-is (exec reports missing files).
std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& search_path);

// Same, searching the PATH of the current process.
std::optional<std::string> resolve_executable(const std::string& cmd);

} // namespace cmdrun
