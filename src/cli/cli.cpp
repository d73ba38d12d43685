/*
 * Command-line driver implementation - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cmd-runner/cli/cli.hpp>
#include <cmd-runner/config/config.hpp>
#include <cmd-runner/exec/errors.hpp>
#include <cmd-runner/exec/runner.hpp>
#include <cmd-runner/log/error_category.hpp>
#include <cmd-runner/log/logger.hpp>

#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace cmdrun {

static void usage() {
    std::cerr << "usage: cmd-runner [--config FILE] [--debug] [--shell PATH] (--script FILE | -- EXE ARGS...)\n";
}

int run_cli(int argc, char* argv[], std::shared_ptr<ProcessSpawner> spawner) {
    std::string config_path, script_path, shell;
    bool debug = false;
    std::vector<std::string> command;
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        if (a=="--") { command.assign(argv+i+1, argv+argc); break; }
        else if (a=="--debug"||a=="-d") debug = true;
        else if ((a=="--config"||a=="--shell"||a=="--script") && i+1<argc) {
            std::string v = argv[++i];
            if (a=="--config") config_path = v; else if (a=="--shell") shell = v; else script_path = v;
        }
        else { usage(); return kCliUsageError; }
    }
    if (script_path.empty() == command.empty()) { usage(); return kCliUsageError; }

    RunnerConfig cfg;
    try {
        if (!config_path.empty()) cfg = load_config(config_path, true);
        else if (auto def = default_config_path(); !def.empty()) cfg = load_config(def, false);
    } catch (const ConfigError& e) {
        std::cerr << "cmd-runner: " << e.what() << '\n';
        return kCliUsageError;
    }
    if (cfg.log_level) set_log_level(*cfg.log_level);
    if (debug) set_log_level(LogLevel::Debug);
    if (!shell.empty()) cfg.shell = shell;

    std::string script;
    if (!script_path.empty()) {
        std::ifstream in(script_path);
        if (!in) { std::cerr << "cmd-runner: cannot read " << script_path << '\n'; return kCliUsageError; }
        script.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    Runner runner(spawner ? std::move(spawner) : std::make_shared<PosixSpawner>());
    runner.set_env(cfg.env);
    runner.set_dir(cfg.dir);
    runner.set_error_category_mapping(cfg.mapping);

    int rc = 0;
    try {
        if (!script_path.empty()) runner.run_shell(cfg.shell, script);
        else runner.run_executable(command[0], std::vector<std::string>(command.begin()+1, command.end()));
    } catch (const SpawnError& e) {
        log_error(e.what());
        rc = kCliSpawnError;
    } catch (const ExitError& e) {
        log_error(e.what());
        rc = e.exit_code();
    } catch (const RelayError& e) {
        log_error(e.what());
        rc = 1;
    } catch (const std::exception& e) {
        log_error(std::string("cmd-runner: ") + e.what());
        rc = 1;
    }
    if (runner.error_category() != ErrorCategory::Undefined)
        std::cerr << "error category: " << runner.error_category_name() << '\n';
    return rc;
}

} // namespace cmdrun
