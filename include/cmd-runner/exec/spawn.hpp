/*
 * Process spawning - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

namespace cmdrun {

// Owning file descriptor; closes on destruction.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : m_fd(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(UniqueFd&& o) noexcept : m_fd(o.release()) {}
    UniqueFd& operator=(UniqueFd&& o) noexcept { if (this != &o) { reset(); m_fd = o.release(); } return *this; }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return m_fd; }
    int release() { int fd = m_fd; m_fd = -1; return fd; }
    void reset(int fd = -1);
    explicit operator bool() const { return m_fd >= 0; }
private:
    int m_fd = -1;
};

struct SpawnRequest {
    std::string program;            // name or path, looked up in PATH if no '/'
    std::vector<std::string> args;  // excluding argv[0]
    std::vector<std::string> env;   // KEY=VALUE
    bool inherit_env = true;        // ignore env and use the parent's
    std::string dir;                // working directory, empty = inherit
    bool pipe_stdin = false;        // else stdin is /dev/null
};

// A started child with its parent-side pipe ends.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;
    virtual pid_t pid() const = 0;
    // Ownership moves to the caller; invalid when stdin was not piped.
    virtual UniqueFd take_stdin() = 0;
    virtual UniqueFd take_stdout() = 0;
    virtual UniqueFd take_stderr() = 0;
    // Block until exit. Returns the exit status, or 128+signal.
    virtual int wait() = 0;
    virtual void kill() = 0;
};

class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;
    // Throws SpawnError when the program cannot be started.
    virtual std::unique_ptr<ChildProcess> spawn(const SpawnRequest& req) = 0;
};

// fork + execve. Exec failures in the child are reported back through a
// close-on-exec pipe and thrown as SpawnError.
class PosixSpawner : public ProcessSpawner {
public:
    std::unique_ptr<ChildProcess> spawn(const SpawnRequest& req) override;
};

} // namespace cmdrun
