/*
 * Run errors - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace cmdrun {

// Base for every failure of a run; names the command.
class RunError : public std::runtime_error {
public:
    RunError(const std::string& command, const std::string& msg)
        : std::runtime_error(command + ": " + msg), m_command(command) {}
    const std::string& command() const { return m_command; }
private:
    std::string m_command;
};

// The child could not be started (not found, permission denied, bad dir).
class SpawnError : public RunError {
public:
    SpawnError(const std::string& command, int err, const std::string& msg)
        : RunError(command, "start failed: " + msg), m_errno(err) {}
    int error_code() const { return m_errno; }
private:
    int m_errno;
};

// The child ran and exited with a non-zero status.
class ExitError : public RunError {
public:
    ExitError(const std::string& command, int code)
        : RunError(command, "failed with exit code " + std::to_string(code)), m_code(code) {}
    int exit_code() const { return m_code; }
private:
    int m_code;
};

// Copying child output to a destination stream failed.
class RelayError : public RunError {
public:
    RelayError(const std::string& command, const std::string& msg)
        : RunError(command, "output relay failed: " + msg) {}
};

} // namespace cmdrun
