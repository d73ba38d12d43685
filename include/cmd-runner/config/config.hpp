/*
 * Runner configuration - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   key=value rc file (default $HOME/.cmd-runnerrc). Recognised keys:
 *     shell=PATH            interpreter for scripts (default /bin/sh)
 *     dir=PATH              child working directory
 *     env=KEY=VALUE         environment overlay entry (repeatable)
 *     pattern.CATEGORY=PAT  console error pattern (repeatable)
 *     log_level=LEVEL       debug|info|warn|error
 *   Blank lines and lines starting with '#' are skipped; unknown keys are
 *   ignored.
 */
#pragma once
#include <cmd-runner/exec/classifier.hpp>
#include <cmd-runner/log/logger.hpp>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace cmdrun {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RunnerConfig {
    std::string shell = "/bin/sh";
    std::string dir;
    std::vector<std::string> env;
    ErrorCategoryMapping mapping;
    std::optional<LogLevel> log_level;
};

// Parse rc content; origin is used in error messages.
RunnerConfig parse_config(std::istream& in, const std::string& origin);

// Load from path. A missing file yields defaults unless required is set.
RunnerConfig load_config(const std::string& path, bool required);

// $HOME/.cmd-runnerrc, or empty when HOME is unset.
std::string default_config_path();

} // namespace cmdrun
