#include <urival/core/diagnostics.h>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

namespace urival::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
        if (!event.stage.empty()) {
            oss << "." << event.stage;
        }
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    events_.push_back(std::move(event));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [severity](const DiagnosticEvent& e) { return e.severity == severity; });
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(const std::string& stage) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [&stage](const DiagnosticEvent& e) { return e.stage == stage; });
    return result;
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

} // namespace urival::core
