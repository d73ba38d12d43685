/*
 * Diagnostics logging implementation - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cmd-runner/log/logger.hpp>
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace cmdrun {

static LogLevel initial_level() {
    const char* v = std::getenv("CMD_RUNNER_DEBUG");
    if (v && *v && std::string(v) != "0") return LogLevel::Debug;
    return LogLevel::Info;
}

static std::atomic<LogLevel> g_level{initial_level()};
static std::ostream* g_stream = nullptr;
static std::mutex g_log_mutex;

void set_log_level(LogLevel lvl) { g_level.store(lvl); }
LogLevel log_level() { return g_level.load(); }

void set_log_stream(std::ostream* os) {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    g_stream = os;
}

std::optional<LogLevel> log_level_from_string(const std::string& s) {
    if (s=="debug") return LogLevel::Debug;
    if (s=="info") return LogLevel::Info;
    if (s=="warn" || s=="warning") return LogLevel::Warn;
    if (s=="error") return LogLevel::Error;
    return std::nullopt;
}

static const char* tag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "?";
}

void log(LogLevel lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < static_cast<int>(g_level.load())) return;
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::ostream& os = g_stream ? *g_stream : std::cerr;
    os << "[" << tag(lvl) << "] " << msg << '\n';
    os.flush();
}

} // namespace cmdrun
