#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace axial::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Records diagnostic events and forwards each one to the observers as it is
// emitted. Only the most recent `capacity()` events are retained; observers
// still see every event. Not thread-safe on its own.
class DiagnosticEmitter {
public:
    static constexpr std::size_t kDefaultCapacity = 1024;

    explicit DiagnosticEmitter(std::size_t capacity = kDefaultCapacity);

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const { return correlation_id_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    // Shrinking the capacity drops the oldest retained events.
    void set_capacity(std::size_t capacity);
    std::size_t capacity() const { return capacity_; }

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& stage) const;
    std::size_t count(Severity severity) const;

    // Total number of events accepted since construction or the last clear(),
    // including ones no longer retained.
    std::uint64_t total_emitted() const { return total_emitted_; }

    void clear();
    std::size_t size() const { return events_.size(); }

private:
    std::vector<DiagnosticEvent> select(
        const std::function<bool(const DiagnosticEvent&)>& predicate) const;
    void trim_to_capacity();

    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t capacity_;
    std::uint64_t total_emitted_ = 0;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

}  // namespace axial::core
