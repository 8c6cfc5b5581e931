#include "sitecheck/core/diagnostics.h"

#include <algorithm>
#include <iterator>
#include <ostream>
#include <utility>

namespace sitecheck::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::string line = std::string("[") + severity_name(event.severity) + "]";
    if (!event.module.empty()) {
        line += " " + event.module;
    }
    if (!event.stage.empty()) {
        line += "/" + event.stage;
    }
    if (event.record_id != 0) {
        line += " (cid:" + std::to_string(event.record_id) + ")";
    }
    return line + ": " + event.message;
}

DiagnosticObserver make_stream_observer(std::ostream& stream, Severity min) {
    return [&stream, min](const DiagnosticEvent& event) {
        if (event.severity >= min) {
            stream << format_diagnostic(event) << '\n';
        }
    };
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) {
        return;
    }

    const DiagnosticEvent event{severity, module, stage, message, record_id_};
    for (const DiagnosticObserver& observer : observers_) {
        observer(event);
    }
    if (history_limit_ == 0) {
        return;
    }
    if (history_.size() == history_limit_) {
        history_.pop_front();
    }
    history_.push_back(event);
}

void DiagnosticEmitter::set_record_id(std::uint64_t id) {
    record_id_ = id;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

void DiagnosticEmitter::set_history_limit(std::size_t limit) {
    history_limit_ = limit;
    while (history_.size() > history_limit_) {
        history_.pop_front();
    }
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::deque<DiagnosticEvent>& DiagnosticEmitter::history() const {
    return history_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::recent(Severity severity) const {
    std::vector<DiagnosticEvent> matching;
    std::copy_if(history_.begin(), history_.end(), std::back_inserter(matching),
                 [severity](const DiagnosticEvent& event) { return event.severity == severity; });
    return matching;
}

}  // namespace sitecheck::core
