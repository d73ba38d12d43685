/*
 * Stream relay implementation - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cmd-runner/exec/relay.hpp>
#include <cmd-runner/log/logger.hpp>
#include <unistd.h>
#include <signal.h>
#include <pthread.h>
#include <cerrno>
#include <ctime>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <system_error>

namespace cmdrun {

void LineScanner::feed(const char* data, std::size_t n) {
    std::size_t start = 0;
    for (std::size_t i=0;i<n;++i) {
        if (data[i] != '\n') continue;
        if (!m_overflow) m_line.append(data+start, i-start);
        emit();
        start = i+1;
    }
    if (start < n && !m_overflow) {
        m_line.append(data+start, n-start);
        if (m_line.size() > m_max) {
            m_overflow = true;
            m_line.clear();
            m_line.shrink_to_fit();
        }
    }
}

void LineScanner::finish() {
    if (!m_line.empty() || m_overflow) emit();
}

void LineScanner::emit() {
    if (!m_line.empty() && m_line.back()=='\r') m_line.pop_back();
    if (m_overflow || m_line.size() > m_max) {
        ++m_skipped;
        log_debug("console line exceeds " + std::to_string(m_max) + " bytes, not classified");
    } else {
        m_cls.classify(m_line);
    }
    m_line.clear();
    m_overflow = false;
}

void relay_stream(int fd, RelayTarget target, const ErrorClassifier* cls) {
    std::optional<LineScanner> scanner;
    if (cls) scanner.emplace(*cls);
    bool write_failed = false;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "read");
        }
        if (n == 0) break;
        if (!write_failed) {
            std::lock_guard<std::mutex> lk(*target.mu);
            target.os->write(buf, n);
            target.os->flush();
            if (!*target.os) write_failed = true;
        }
        if (scanner) scanner->feed(buf, static_cast<std::size_t>(n));
    }
    if (scanner) scanner->finish();
    if (write_failed) throw std::runtime_error("write to output stream failed");
}

void feed_stream(int fd, const std::string& data) {
    // Runs on its own thread: block SIGPIPE here so a child that exits
    // without reading its stdin yields EPIPE instead of killing us.
    sigset_t pipe_set, old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);
    std::size_t off = 0;
    int err = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data()+off, data.size()-off);
        if (n < 0) {
            if (errno == EINTR) continue;
            err = errno;
            break;
        }
        off += static_cast<std::size_t>(n);
    }
    ::close(fd);
    if (err == EPIPE) {
        struct timespec zero{0, 0};
        while (sigtimedwait(&pipe_set, nullptr, &zero) < 0 && errno == EINTR) {}
    }
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    if (err && err != EPIPE) throw std::system_error(err, std::generic_category(), "write stdin");
}

} // namespace cmdrun
