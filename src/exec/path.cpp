/*
 * PATH resolution implementation - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cmd-runner/exec/path.hpp>
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace cmdrun {

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return (st.st_mode & (S_IXUSR|S_IXGRP|S_IXOTH)) != 0;
}

static std::vector<std::string> split_path(const std::string& paths) {
    std::vector<std::string> parts;
    size_t start=0;
    while (true) {
        size_t colon = paths.find(':', start);
        if (colon == std::string::npos) { parts.push_back(paths.substr(start)); break; }
        parts.push_back(paths.substr(start, colon-start));
        start = colon+1;
    }
    return parts;
}

std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& search_path) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) return cmd;
    for (auto &d : split_path(search_path)) {
        // Empty entry means current directory.
        std::string full = (d.empty() ? std::string(".") : d) + '/' + cmd;
        if (is_executable(full)) return full;
    }
    return std::nullopt;
}

std::optional<std::string> resolve_executable(const std::string& cmd) {
    const char* pathEnv = std::getenv("PATH");
    return resolve_executable(cmd, pathEnv ? std::string(pathEnv) : std::string("/usr/local/bin:/usr/bin:/bin"));
}

} // namespace cmdrun
