#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace urival::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

// One recorded event. `module` names the emitting component
// ("validator"), `stage` the check that produced it ("password",
// "required", ...).
struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

// Collects events in emission order. Not synchronized: one emitter per
// thread.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& stage) const;

    void clear();
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> events_;
};

} // namespace urival::core
