/*
 * Error categories implementation - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cmd-runner/log/error_category.hpp>
#include <unordered_map>

namespace cmdrun {

static std::atomic<ErrorCategory> g_error_category{ErrorCategory::Undefined};

std::string to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::Undefined: return "undefined";
        case ErrorCategory::Build: return "build";
        case ErrorCategory::Compliance: return "compliance";
        case ErrorCategory::Configuration: return "config";
        case ErrorCategory::Custom: return "custom";
        case ErrorCategory::Infrastructure: return "infrastructure";
        case ErrorCategory::Service: return "service";
        case ErrorCategory::Test: return "test";
    }
    return "undefined";
}

ErrorCategory error_category_from_string(const std::string& name) {
    static const std::unordered_map<std::string, ErrorCategory> names = {
        {"undefined", ErrorCategory::Undefined},
        {"build", ErrorCategory::Build},
        {"compliance", ErrorCategory::Compliance},
        {"config", ErrorCategory::Configuration},
        {"configuration", ErrorCategory::Configuration},
        {"custom", ErrorCategory::Custom},
        {"infrastructure", ErrorCategory::Infrastructure},
        {"service", ErrorCategory::Service},
        {"test", ErrorCategory::Test},
    };
    if (name.empty()) return ErrorCategory::Undefined;
    auto it = names.find(name);
    return it != names.end() ? it->second : ErrorCategory::Custom;
}

ErrorCategory error_category() { return g_error_category.load(); }

void set_error_category(ErrorCategory c) { g_error_category.store(c); }

void RunCategorySink::set(ErrorCategory c, const std::string& name) {
    {
        std::lock_guard<std::mutex> lk(m_name_mu);
        m_name = name;
        m_value.store(c);
    }
    if (m_publish) set_error_category(c);
}

std::string RunCategorySink::name() const {
    std::lock_guard<std::mutex> lk(m_name_mu);
    return m_name;
}

void RunCategorySink::reset() {
    std::lock_guard<std::mutex> lk(m_name_mu);
    m_name.clear();
    m_value.store(ErrorCategory::Undefined);
}

} // namespace cmdrun
