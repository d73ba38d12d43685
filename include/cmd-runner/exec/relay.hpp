/*
 * Stream relay - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Copies a child's output pipe to a destination stream unchanged and, when
 *   a classifier is present, splits the bytes into lines and feeds each
 *   complete line to it. Classification is a read-only side channel.
 */
#pragma once
#include <cmd-runner/exec/classifier.hpp>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>

namespace cmdrun {

// Lines longer than this are still relayed but never classified.
constexpr std::size_t kMaxClassifiedLine = 16 * 1024;

// Destination stream plus the mutex guarding it. stdout and stderr share
// one mutex when they point at the same stream.
struct RelayTarget {
    std::ostream* os;
    std::mutex* mu;
};

class LineScanner {
public:
    explicit LineScanner(const ErrorClassifier& cls, std::size_t max_line = kMaxClassifiedLine)
        : m_cls(cls), m_max(max_line) {}
    void feed(const char* data, std::size_t n);
    // Classify a trailing line without newline, if any.
    void finish();
    std::size_t skipped_lines() const { return m_skipped; }
private:
    void emit();
    const ErrorClassifier& m_cls;
    std::size_t m_max;
    std::string m_line;
    bool m_overflow = false;
    std::size_t m_skipped = 0;
};

// Drain fd until EOF. The pipe is always read to the end, even after a
// write to the target fails; the failure is thrown once EOF is reached.
// Throws std::system_error on read errors and std::runtime_error on
// write errors. Does not close fd.
void relay_stream(int fd, RelayTarget target, const ErrorClassifier* cls);

// Write all of data into fd, then close it. EPIPE (child stopped reading)
// is not an error.
void feed_stream(int fd, const std::string& data);

} // namespace cmdrun
