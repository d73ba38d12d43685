/*
 * Command-line driver - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Usage:
 *   cmd-runner [--config FILE] [--debug] [--shell PATH] (--script FILE | -- EXE ARGS...)
 *
 * Exit status: the child's exit code, 127 when it could not be started,
 * 2 on usage or configuration errors, 1 on any other failure. When console
 * output was classified, "error category: <name>" is printed to stderr.
 */
#pragma once
#include <cmd-runner/exec/spawn.hpp>
#include <memory>

namespace cmdrun {

constexpr int kCliUsageError = 2;
constexpr int kCliSpawnError = 127;

// spawner defaults to PosixSpawner.
int run_cli(int argc, char* argv[], std::shared_ptr<ProcessSpawner> spawner = nullptr);

} // namespace cmdrun
