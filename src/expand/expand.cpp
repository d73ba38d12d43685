/*
 * Argument interpolation implementation - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cmd-runner/expand/expand.hpp>
#include <cctype>

namespace cmdrun {

EnvMap env_map(const std::vector<std::string>& overlay) {
    EnvMap m;
    for (auto &e : overlay) {
        auto eq = e.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        m[e.substr(0, eq)] = e.substr(eq+1);
    }
    return m;
}

static bool is_name_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c=='_'; }
static bool is_name_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c=='_'; }

std::string interpolate(const std::string& in, const EnvMap& env) {
    std::string out; out.reserve(in.size());
    for (size_t i=0;i<in.size();) {
        if (in[i]=='$') {
            if (i+1 < in.size() && in[i+1]=='{') {
                size_t end = in.find('}', i+2);
                if (end != std::string::npos) {
                    std::string key = in.substr(i+2, end-(i+2));
                    auto it = env.find(key);
                    if (it != env.end()) out += it->second;
                    else out.append(in, i, end+1-i);
                    i = end+1; continue;
                }
            }
            size_t j=i+1;
            if (j < in.size() && is_name_start(in[j])) {
                ++j; while (j<in.size() && is_name_char(in[j])) ++j;
                std::string key = in.substr(i+1, j-(i+1));
                auto it = env.find(key);
                if (it != env.end()) out += it->second;
                else out.append(in, i, j-i);
                i=j; continue;
            }
        }
        out.push_back(in[i++]);
    }
    return out;
}

std::vector<std::string> interpolate_all(const std::vector<std::string>& args, const EnvMap& env) {
    std::vector<std::string> out; out.reserve(args.size());
    for (auto &a : args) out.push_back(interpolate(a, env));
    return out;
}

} // namespace cmdrun
