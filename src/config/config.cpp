/*
 * Runner configuration implementation - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cmd-runner/config/config.hpp>
#include <cstdlib>
#include <fstream>
#include <istream>

namespace cmdrun {

static void add_pattern(ErrorCategoryMapping& mapping, const std::string& category, const std::string& pattern) {
    for (auto &entry : mapping) {
        if (entry.category == category) { entry.patterns.push_back(pattern); return; }
    }
    mapping.push_back(CategoryPatterns{category, {pattern}});
}

RunnerConfig parse_config(std::istream& in, const std::string& origin) {
    RunnerConfig cfg;
    std::string line;
    int lineno = 0;
    static const std::string pattern_prefix = "pattern.";
    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back()=='\r') line.pop_back();
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos)
            throw ConfigError(origin + ":" + std::to_string(lineno) + ": expected key=value");
        auto key = line.substr(0, eq);
        auto val = line.substr(eq+1);
        if (key=="shell") cfg.shell = val;
        else if (key=="dir") cfg.dir = val;
        else if (key=="env") cfg.env.push_back(val);
        else if (key=="log_level") {
            cfg.log_level = log_level_from_string(val);
            if (!cfg.log_level)
                throw ConfigError(origin + ":" + std::to_string(lineno) + ": invalid log_level '" + val + "'");
        }
        else if (key.compare(0, pattern_prefix.size(), pattern_prefix)==0 && key.size() > pattern_prefix.size()) {
            add_pattern(cfg.mapping, key.substr(pattern_prefix.size()), val);
        }
    }
    return cfg;
}

RunnerConfig load_config(const std::string& path, bool required) {
    std::ifstream in(path);
    if (!in) {
        if (required) throw ConfigError(path + ": cannot open config file");
        return RunnerConfig{};
    }
    return parse_config(in, path);
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.cmd-runnerrc";
}

} // namespace cmdrun
