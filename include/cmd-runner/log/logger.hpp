/*
 * Diagnostics logging - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <iosfwd>
#include <optional>
#include <string>

namespace cmdrun {

enum class LogLevel { Debug, Info, Warn, Error };

void set_log_level(LogLevel lvl);
LogLevel log_level();

// nullptr restores std::cerr.
void set_log_stream(std::ostream* os);

std::optional<LogLevel> log_level_from_string(const std::string& s);

// Emit "[level] msg\n" when lvl is enabled. Serialized across threads.
void log(LogLevel lvl, const std::string& msg);

inline void log_debug(const std::string& m) { log(LogLevel::Debug, m); }
inline void log_info(const std::string& m) { log(LogLevel::Info, m); }
inline void log_warn(const std::string& m) { log(LogLevel::Warn, m); }
inline void log_error(const std::string& m) { log(LogLevel::Error, m); }

} // namespace cmdrun
