/**
 * @file event_recorder.hpp
 * @brief Structured decision events, one NDJSON line per significant decision.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace kube_balance {

enum class EventType : uint8_t {
    Normal,
    Warning
};

[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    return type == EventType::Normal ? "Normal" : "Warning";
}

/// Event reasons emitted by the rebalancer.
namespace reason {
inline constexpr std::string_view kNodeDegraded = "NodeDegraded";
inline constexpr std::string_view kEvictionSkipped = "EvictionSkipped";
inline constexpr std::string_view kPdbViolation = "PDBViolation";
inline constexpr std::string_view kPodEvicted = "PodEvicted";
inline constexpr std::string_view kEvictionRateLimited = "EvictionRateLimited";
inline constexpr std::string_view kEvictionFailed = "EvictionFailed";
inline constexpr std::string_view kCooldownSet = "CooldownSet";
inline constexpr std::string_view kCooldownAnnotationFailed = "CooldownAnnotationFailed";
}  // namespace reason

struct ObjectRef {
    std::string kind;
    std::string ns;     ///< Empty for cluster-scoped objects (nodes)
    std::string name;
};

struct Event {
    EventType type{EventType::Normal};
    std::string reason;
    ObjectRef object;
    std::string message;
    Timestamp timestamp;
};

/**
 * @brief Emits decision events as NDJSON and keeps a bounded in-memory history.
 */
class EventRecorder {
public:
    explicit EventRecorder(std::unique_ptr<ILogSink> sink, size_t history_limit = 256);

    void record(EventType type, ObjectRef object, std::string_view reason, std::string message);
    void normal(ObjectRef object, std::string_view reason, std::string message);
    void warning(ObjectRef object, std::string_view reason, std::string message);

    /// Number of events recorded with `reason` since construction.
    [[nodiscard]] uint64_t count(std::string_view reason) const;
    [[nodiscard]] std::vector<Event> recent() const;

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    size_t history_limit_;

    mutable std::mutex mutex_;
    std::deque<Event> history_;
    std::map<std::string, uint64_t, std::less<>> counts_;
};

}  // namespace kube_balance
