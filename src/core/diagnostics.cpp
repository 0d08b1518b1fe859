#include "axial/core/diagnostics.h"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace axial::core {

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
            oss << "/" << event.stage;
        }
    } else if (!event.stage.empty()) {
        oss << " " << event.stage;
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticEmitter::DiagnosticEmitter(std::size_t capacity) : capacity_(capacity) {}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.correlation_id = correlation_id_;
    ++total_emitted_;

    for (const auto& observer : observers_) {
        observer(event);
    }

    if (capacity_ == 0) {
        return;
    }
    events_.push_back(std::move(event));
    trim_to_capacity();
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    correlation_id_ = id;
}

void DiagnosticEmitter::set_capacity(std::size_t capacity) {
    capacity_ = capacity;
    trim_to_capacity();
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    if (observer) {
        observers_.push_back(std::move(observer));
    }
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    return std::vector<DiagnosticEvent>(events_.begin(), events_.end());
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    return select([&module](const DiagnosticEvent& e) { return e.module == module; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(const std::string& stage) const {
    return select([&stage](const DiagnosticEvent& e) { return e.stage == stage; });
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [severity](const DiagnosticEvent& e) { return e.severity == severity; }));
}

void DiagnosticEmitter::clear() {
    events_.clear();
    total_emitted_ = 0;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::select(
    const std::function<bool(const DiagnosticEvent&)>& predicate) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result), predicate);
    return result;
}

void DiagnosticEmitter::trim_to_capacity() {
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

}  // namespace axial::core
