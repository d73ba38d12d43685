/*
 * Process runner implementation - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cmd-runner/exec/runner.hpp>
#include <cmd-runner/exec/errors.hpp>
#include <cmd-runner/exec/relay.hpp>
#include <cmd-runner/expand/expand.hpp>
#include <cmd-runner/log/logger.hpp>
#include <iostream>
#include <iterator>
#include <sstream>

namespace cmdrun {

static std::string describe(const SpawnRequest& req) {
    std::ostringstream os;
    os << req.program;
    for (auto &a : req.args) os << ' ' << a;
    if (!req.dir.empty()) os << " (in " << req.dir << ")";
    return os.str();
}

Execution::Execution(ProcessSpawner& spawner, const SpawnRequest& req, const RunOptions& opts,
                     std::string stdin_data)
    : m_command(req.program), m_mapping(opts.mapping) {
    log_debug("running " + describe(req));
    m_child = spawner.spawn(req);
    if (!m_mapping.empty()) m_classifier = std::make_unique<ErrorClassifier>(m_mapping, m_sink);

    std::ostream* out = opts.out ? opts.out : &std::cout;
    std::ostream* err = opts.err ? opts.err : &std::cerr;
    RelayTarget out_target{out, &m_out_mu};
    RelayTarget err_target{err, err == out ? &m_out_mu : &m_err_mu};
    const ErrorClassifier* cls = m_classifier.get();

    UniqueFd in_fd = m_child->take_stdin();
    UniqueFd out_fd = m_child->take_stdout();
    UniqueFd err_fd = m_child->take_stderr();

    m_task_errors.resize(3);
    try {
        if (in_fd) {
            m_tasks.emplace_back([this, fd = std::move(in_fd), data = std::move(stdin_data)]() mutable {
                try { feed_stream(fd.release(), data); }
                catch (...) { m_task_errors[0] = std::current_exception(); }
            });
        }
        m_tasks.emplace_back([this, fd = std::move(out_fd), out_target, cls]() {
            try { relay_stream(fd.get(), out_target, cls); }
            catch (...) { m_task_errors[1] = std::current_exception(); }
        });
        m_tasks.emplace_back([this, fd = std::move(err_fd), err_target, cls]() {
            try { relay_stream(fd.get(), err_target, cls); }
            catch (...) { m_task_errors[2] = std::current_exception(); }
        });
    } catch (...) {
        // Thread creation failed: do not leave a child or joinable task behind.
        m_child->kill();
        join_tasks();
        m_child->wait();
        throw;
    }
}

Execution::~Execution() {
    if (m_waited) return;
    m_child->kill();
    join_tasks();
    m_child->wait();
}

void Execution::join_tasks() {
    for (auto &t : m_tasks) if (t.joinable()) t.join();
}

void Execution::kill() {
    if (!m_waited) m_child->kill();
}

void Execution::wait() {
    if (m_waited) return;
    // Pipes are drained before reaping; the child may block on a full pipe.
    join_tasks();
    m_exit_code = m_child->wait();
    m_waited = true;
    log_debug(m_command + " exited with code " + std::to_string(m_exit_code));
    if (m_exit_code != 0) throw ExitError(m_command, m_exit_code);
    for (auto &e : m_task_errors) {
        if (!e) continue;
        try {
            std::rethrow_exception(e);
        } catch (const std::exception& ex) {
            throw RelayError(m_command, ex.what());
        }
    }
}

Runner::Runner() : Runner(std::make_shared<PosixSpawner>()) {}

Runner::Runner(std::shared_ptr<ProcessSpawner> spawner) : m_spawner(std::move(spawner)) {}

void Runner::append_env(const std::vector<std::string>& env) {
    m_opts.env.insert(m_opts.env.end(), env.begin(), env.end());
}

SpawnRequest Runner::make_request(const std::string& name, const std::vector<std::string>& args) const {
    SpawnRequest req;
    req.program = name;
    req.args = args;
    req.env = m_opts.env;
    req.inherit_env = m_opts.env.empty();
    req.dir = m_opts.dir;
    return req;
}

void Runner::finish(Execution& ex) {
    // Record the outcome on every exit path of wait().
    struct Record {
        Runner& r; Execution& ex;
        ~Record() {
            r.m_exit_code = ex.exit_code();
            r.m_category = ex.error_category();
            r.m_category_name = ex.error_category_name();
        }
    } rec{*this, ex};
    ex.wait();
}

void Runner::run_shell(const std::string& shell, const std::string& script) {
    m_exit_code = kExitCodeNotStarted;
    m_category = ErrorCategory::Undefined;
    m_category_name.clear();
    SpawnRequest req = make_request(shell, {});
    req.pipe_stdin = true;
    Execution ex(*m_spawner, req, m_opts, script);
    finish(ex);
}

void Runner::run_executable(const std::string& name, const std::vector<std::string>& args) {
    m_exit_code = kExitCodeNotStarted;
    m_category = ErrorCategory::Undefined;
    m_category_name.clear();
    auto ex = run_executable_in_background(name, args);
    finish(*ex);
}

std::unique_ptr<Execution> Runner::run_executable_in_background(const std::string& name,
                                                               const std::vector<std::string>& args) {
    SpawnRequest req = make_request(name, interpolate_all(args, env_map(m_opts.env)));
    std::string input;
    if (m_stdin) {
        req.pipe_stdin = true;
        input.assign(std::istreambuf_iterator<char>(*m_stdin), std::istreambuf_iterator<char>());
    }
    return std::make_unique<Execution>(*m_spawner, req, m_opts, std::move(input));
}

} // namespace cmdrun
