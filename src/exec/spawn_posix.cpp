/*
 * POSIX process spawning - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cmd-runner/exec/spawn.hpp>
#include <cmd-runner/exec/errors.hpp>
#include <cmd-runner/exec/path.hpp>
#include <cmd-runner/expand/expand.hpp>
#include <unistd.h>
#include <fcntl.h>
#include <sys/wait.h>
#include <cerrno>
#include <csignal>
#include <cstring>

extern char** environ;

namespace cmdrun {

void UniqueFd::reset(int fd) {
    if (m_fd >= 0) ::close(m_fd);
    m_fd = fd;
}

namespace {

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

Pipe make_pipe(const std::string& program) {
    int p[2];
    if (pipe2(p, O_CLOEXEC) != 0) {
        int err = errno;
        throw SpawnError(program, err, std::string("pipe: ") + std::strerror(err));
    }
    return Pipe{UniqueFd(p[0]), UniqueFd(p[1])};
}

class PosixChild : public ChildProcess {
public:
    PosixChild(pid_t pid, UniqueFd in, UniqueFd out, UniqueFd err)
        : m_pid(pid), m_stdin(std::move(in)), m_stdout(std::move(out)), m_stderr(std::move(err)) {}
    ~PosixChild() override {
        if (!m_reaped) {
            kill();
            wait();
        }
    }
    pid_t pid() const override { return m_pid; }
    UniqueFd take_stdin() override { return std::move(m_stdin); }
    UniqueFd take_stdout() override { return std::move(m_stdout); }
    UniqueFd take_stderr() override { return std::move(m_stderr); }
    int wait() override {
        if (m_reaped) return m_status;
        int st=0;
        while (waitpid(m_pid, &st, 0) < 0) {
            if (errno != EINTR) { m_reaped = true; m_status = -1; return m_status; }
        }
        m_reaped = true;
        if (WIFEXITED(st)) m_status = WEXITSTATUS(st);
        else if (WIFSIGNALED(st)) m_status = 128 + WTERMSIG(st);
        else m_status = 1;
        return m_status;
    }
    void kill() override {
        if (!m_reaped) ::kill(m_pid, SIGKILL);
    }
private:
    pid_t m_pid;
    UniqueFd m_stdin, m_stdout, m_stderr;
    bool m_reaped = false;
    int m_status = -1;
};

// Child side after fork: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(int in_fd, int out_fd, int err_fd, int status_fd,
                             const char* dir, const char* path,
                             char* const* argv, char* const* envp) {
    std::signal(SIGPIPE, SIG_DFL);
    int err = 0;
    if (dup2(in_fd, STDIN_FILENO) < 0 || dup2(out_fd, STDOUT_FILENO) < 0 || dup2(err_fd, STDERR_FILENO) < 0) {
        err = errno;
    } else if (dir && chdir(dir) != 0) {
        err = errno;
    } else {
        execve(path, argv, envp);
        err = errno;
    }
    ssize_t ignored = write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

} // namespace

std::unique_ptr<ChildProcess> PosixSpawner::spawn(const SpawnRequest& req) {
    std::string search_path;
    bool have_path = false;
    if (!req.inherit_env) {
        auto env = env_map(req.env);
        auto it = env.find("PATH");
        if (it != env.end()) { search_path = it->second; have_path = true; }
    }
    auto exe = have_path ? resolve_executable(req.program, search_path) : resolve_executable(req.program);
    if (!exe) throw SpawnError(req.program, ENOENT, "executable file not found in $PATH");

    // argv/envp are built before fork; the child must not allocate.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(req.args.size()+1);
    argv_storage.push_back(req.program);
    argv_storage.insert(argv_storage.end(), req.args.begin(), req.args.end());
    std::vector<char*> cargv; cargv.reserve(argv_storage.size()+1);
    for (auto &s : argv_storage) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    std::vector<char*> cenv;
    if (!req.inherit_env) {
        cenv.reserve(req.env.size()+1);
        for (auto &e : req.env) cenv.push_back(const_cast<char*>(e.c_str()));
        cenv.push_back(nullptr);
    }
    char* const* envp = req.inherit_env ? environ : cenv.data();

    UniqueFd child_in;
    Pipe in_pipe;
    if (req.pipe_stdin) {
        in_pipe = make_pipe(req.program);
    } else {
        child_in.reset(::open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (!child_in) {
            int err = errno;
            throw SpawnError(req.program, err, std::string("open /dev/null: ") + std::strerror(err));
        }
    }
    Pipe out_pipe = make_pipe(req.program);
    Pipe err_pipe = make_pipe(req.program);
    Pipe status_pipe = make_pipe(req.program);

    int in_fd = req.pipe_stdin ? in_pipe.read_end.get() : child_in.get();
    const char* dir = req.dir.empty() ? nullptr : req.dir.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        throw SpawnError(req.program, err, std::string("fork: ") + std::strerror(err));
    }
    if (pid == 0) {
        exec_child(in_fd, out_pipe.write_end.get(), err_pipe.write_end.get(),
                   status_pipe.write_end.get(), dir, exe->c_str(), cargv.data(), envp);
    }

    // Parent keeps only its own ends.
    child_in.reset();
    in_pipe.read_end.reset();
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    status_pipe.write_end.reset();

    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(status_pipe.read_end.get(), &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    if (n > 0) {
        int st=0; while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        throw SpawnError(req.program, child_errno, std::strerror(child_errno));
    }

    return std::make_unique<PosixChild>(pid, std::move(in_pipe.write_end),
                                        std::move(out_pipe.read_end), std::move(err_pipe.read_end));
}

} // namespace cmdrun
