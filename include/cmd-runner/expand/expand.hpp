/*
 * Argument interpolation - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Replaces $VAR and ${VAR} references in arguments using an explicit
 *   environment overlay (KEY=VALUE entries), never the process environment.
 *   Unresolved references are kept verbatim.
 */
#pragma once
#include <map>
#include <string>
#include <vector>

namespace cmdrun {

using EnvMap = std::map<std::string, std::string>;

// Build a lookup table from KEY=VALUE entries. Later entries win; entries
// without '=' are ignored.
EnvMap env_map(const std::vector<std::string>& overlay);

std::string interpolate(const std::string& in, const EnvMap& env);

std::vector<std::string> interpolate_all(const std::vector<std::string>& args, const EnvMap& env);

} // namespace cmdrun
