#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace sitecheck::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

// One line of crawl narration. `record_id` is the crawl record being
// processed when the event was raised, or 0 outside record processing.
struct DiagnosticEvent {
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t record_id = 0;
};

// "[severity] module/stage (cid:N): message"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Writes every event at or above `min` to `stream`, one line each.
// The stream must outlive the observer.
DiagnosticObserver make_stream_observer(std::ostream& stream,
                                        Severity min = Severity::Warning);

// Fans events out to observers and keeps the most recent ones in a bounded
// history.
class DiagnosticEmitter {
public:
    static constexpr std::size_t kDefaultHistoryLimit = 512;

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void set_record_id(std::uint64_t id);

    void set_min_severity(Severity min);

    // 0 turns the history off; observers still see every event.
    void set_history_limit(std::size_t limit);

    void add_observer(DiagnosticObserver observer);

    const std::deque<DiagnosticEvent>& history() const;
    std::vector<DiagnosticEvent> recent(Severity severity) const;

private:
    std::deque<DiagnosticEvent> history_;
    std::size_t history_limit_ = kDefaultHistoryLimit;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t record_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

}  // namespace sitecheck::core
