/*
 * Error categories - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Labels assigned to a run when console output matches a configured
 *   pattern. Orchestration code reads them to choose remediation messages.
 */
#pragma once
#include <atomic>
#include <mutex>
#include <string>

namespace cmdrun {

enum class ErrorCategory { Undefined, Build, Compliance, Configuration, Custom, Infrastructure, Service, Test };

// Canonical lower-case name ("config" for Configuration).
std::string to_string(ErrorCategory c);

// Parse a mapping key. Known names (and the alias "configuration") map to
// their category; anything else maps to Custom. Empty maps to Undefined.
ErrorCategory error_category_from_string(const std::string& name);

// Process-wide state, last writer wins. Never reset by the runner.
ErrorCategory error_category();
void set_error_category(ErrorCategory c);

// Receives classification results. name is the mapping key that matched,
// kept as configured (e.g. "licensing" for a Custom category).
class CategorySink {
public:
    virtual ~CategorySink() = default;
    virtual void set(ErrorCategory c, const std::string& name) = 0;
};

// Writes straight to the process-wide state.
class GlobalCategorySink : public CategorySink {
public:
    void set(ErrorCategory c, const std::string&) override { set_error_category(c); }
};

// Holds the category of a single run; optionally forwards to the
// process-wide state as well. Safe to set from several drain threads.
class RunCategorySink : public CategorySink {
public:
    explicit RunCategorySink(bool publish_global = true) : m_publish(publish_global) {}
    void set(ErrorCategory c, const std::string& name) override;
    ErrorCategory get() const { return m_value.load(); }
    // Mapping key of the last match, empty when nothing matched.
    std::string name() const;
    void reset();
private:
    std::atomic<ErrorCategory> m_value{ErrorCategory::Undefined};
    mutable std::mutex m_name_mu;
    std::string m_name;
    bool m_publish;
};

} // namespace cmdrun
