/*
 * Process runner - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Runs a shell script (fed over stdin) or an executable, relays the
 *   child's stdout/stderr to the configured streams while classifying
 *   console lines, and records the exit code. A Runner is not safe for
 *   concurrent runs; use one instance per thread.
 */
#pragma once
#include <cmd-runner/exec/classifier.hpp>
#include <cmd-runner/exec/spawn.hpp>
#include <cmd-runner/log/error_category.hpp>
#include <exception>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cmdrun {

constexpr int kExitCodeNotStarted = -1;

struct RunOptions {
    std::ostream* out = nullptr;    // nullptr = std::cout
    std::ostream* err = nullptr;    // nullptr = std::cerr
    ErrorCategoryMapping mapping;   // empty = no classification
    std::vector<std::string> env;   // empty = inherit parent environment
    std::string dir;
};

// A started child together with the tasks draining its pipes.
class Execution {
public:
    Execution(ProcessSpawner& spawner, const SpawnRequest& req, const RunOptions& opts,
              std::string stdin_data);
    ~Execution();
    Execution(const Execution&) = delete;
    Execution& operator=(const Execution&) = delete;

    pid_t pid() const { return m_child->pid(); }

    // Joins every drain task, then reaps the child. Throws ExitError on a
    // non-zero exit, RelayError when output could not be written.
    void wait();
    // SIGKILL the child. wait() is still required to reap it.
    void kill();

    int exit_code() const { return m_exit_code; }
    ErrorCategory error_category() const { return m_sink.get(); }
    std::string error_category_name() const { return m_sink.name(); }

private:
    void join_tasks();

    std::string m_command;
    std::unique_ptr<ChildProcess> m_child;
    ErrorCategoryMapping m_mapping;
    RunCategorySink m_sink;
    std::unique_ptr<ErrorClassifier> m_classifier;
    std::mutex m_out_mu, m_err_mu;
    std::vector<std::thread> m_tasks;
    std::vector<std::exception_ptr> m_task_errors;
    bool m_waited = false;
    int m_exit_code = kExitCodeNotStarted;
};

class Runner {
public:
    Runner();
    explicit Runner(std::shared_ptr<ProcessSpawner> spawner);

    void set_stdout(std::ostream* os) { m_opts.out = os; }
    void set_stderr(std::ostream* os) { m_opts.err = os; }
    void set_error_category_mapping(ErrorCategoryMapping m) { m_opts.mapping = std::move(m); }
    // Replaces the overlay used for the child's environment and for
    // $VAR interpolation.
    void set_env(std::vector<std::string> env) { m_opts.env = std::move(env); }
    void append_env(const std::vector<std::string>& env);
    void set_dir(std::string dir) { m_opts.dir = std::move(dir); }
    // Stdin for executable runs, read fully at start. nullptr = /dev/null.
    void set_stdin(std::istream* in) { m_stdin = in; }

    const std::vector<std::string>& env() const { return m_opts.env; }

    void run_shell(const std::string& shell, const std::string& script);
    void run_executable(const std::string& name, const std::vector<std::string>& args = {});
    // Exit code and category are reported on the handle, not the runner.
    std::unique_ptr<Execution> run_executable_in_background(const std::string& name,
                                                            const std::vector<std::string>& args = {});

    // kExitCodeNotStarted until a child has been reaped.
    int exit_code() const { return m_exit_code; }
    // Category classified during the last run (Undefined if none).
    ErrorCategory error_category() const { return m_category; }
    // Mapping key that produced error_category(), as configured. Empty
    // when nothing matched.
    const std::string& error_category_name() const { return m_category_name; }

private:
    SpawnRequest make_request(const std::string& name, const std::vector<std::string>& args) const;
    void finish(Execution& ex);

    std::shared_ptr<ProcessSpawner> m_spawner;
    RunOptions m_opts;
    std::istream* m_stdin = nullptr;
    int m_exit_code = kExitCodeNotStarted;
    ErrorCategory m_category = ErrorCategory::Undefined;
    std::string m_category_name;
};

} // namespace cmdrun
