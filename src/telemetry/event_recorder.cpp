/**
 * @file event_recorder.cpp
 * @brief EventRecorder implementation.
 */

#include "telemetry/event_recorder.hpp"

#include "core/time_format.hpp"

#include <chrono>
#include <sstream>

namespace kube_balance {

EventRecorder::EventRecorder(std::unique_ptr<ILogSink> sink, size_t history_limit)
    : sink_(std::move(sink)), history_limit_(history_limit) {}

void EventRecorder::record(EventType type, ObjectRef object, std::string_view reason,
                           std::string message) {
    Event event{
        .type = type,
        .reason = std::string{reason},
        .object = std::move(object),
        .message = std::move(message),
        .timestamp = std::chrono::system_clock::now()
    };

    std::ostringstream oss;
    oss << R"({"event":")" << event.reason << "\""
        << R"(,"type":")" << to_string(event.type) << "\""
        << R"(,"ts":")" << format_rfc3339(event.timestamp) << "\""
        << R"(,"kind":")" << event.object.kind << "\"";
    if (!event.object.ns.empty()) {
        oss << R"(,"namespace":")" << json_escape(event.object.ns) << "\"";
    }
    oss << R"(,"name":")" << json_escape(event.object.name) << "\""
        << R"(,"message":")" << json_escape(event.message) << "\""
        << "}";

    std::lock_guard lock(mutex_);
    sink_->write(oss.str());
    ++counts_[event.reason];
    history_.push_back(std::move(event));
    while (history_.size() > history_limit_) history_.pop_front();
}

void EventRecorder::normal(ObjectRef object, std::string_view reason, std::string message) {
    record(EventType::Normal, std::move(object), reason, std::move(message));
}

void EventRecorder::warning(ObjectRef object, std::string_view reason, std::string message) {
    record(EventType::Warning, std::move(object), reason, std::move(message));
}

uint64_t EventRecorder::count(std::string_view reason) const {
    std::lock_guard lock(mutex_);
    auto it = counts_.find(reason);
    return it == counts_.end() ? 0 : it->second;
}

std::vector<Event> EventRecorder::recent() const {
    std::lock_guard lock(mutex_);
    return {history_.begin(), history_.end()};
}

void EventRecorder::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

}  // namespace kube_balance
