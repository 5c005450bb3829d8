/**
 * @file types.hpp
 * @brief Fundamental vocabulary types used throughout kube_balance.
 *
 * Defines object identities, well-known annotation/label keys and the
 * small closed enumerations (pod phase, QoS class, owner kind) shared by
 * the cluster model and the rebalancing engine.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kube_balance {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeName = std::string;
using WorkloadType = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Seconds = std::chrono::seconds;

/**
 * @brief Namespaced object identity ("namespace/name").
 */
struct ObjectKey {
    std::string ns;
    std::string name;

    [[nodiscard]] std::string str() const { return ns + "/" + name; }

    auto operator<=>(const ObjectKey&) const = default;
};

// ─────────────────────────────────────────────
// Well-known keys
// ─────────────────────────────────────────────

/// Presence of this node annotation marks the node as degraded.
inline constexpr std::string_view kDegradedAnnotation = "kube-balance.io/degraded-io";

/// Pod label naming the workload type, looked up in the profile store.
inline constexpr std::string_view kWorkloadTypeLabel = "workload.k8s.io/type";

/// Owner annotation holding the RFC 3339 cooldown deadline.
inline constexpr std::string_view kCooldownAnnotation = "kube-balance.io/eviction-cooldown-until";

/// Grace period handed to every eviction request.
inline constexpr Seconds kEvictionGracePeriod{30};

// ─────────────────────────────────────────────
// Pod Phase
// ─────────────────────────────────────────────

enum class PodPhase : uint8_t {
    Pending,
    Running,
    Succeeded,
    Failed,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(PodPhase phase) noexcept {
    switch (phase) {
        case PodPhase::Pending:   return "Pending";
        case PodPhase::Running:   return "Running";
        case PodPhase::Succeeded: return "Succeeded";
        case PodPhase::Failed:    return "Failed";
        case PodPhase::Unknown:   return "Unknown";
    }
    return "Unknown";
}

[[nodiscard]] std::optional<PodPhase> parse_pod_phase(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// QoS Class
// ─────────────────────────────────────────────

enum class QosClass : uint8_t {
    Unknown,
    Guaranteed,
    Burstable,
    BestEffort
};

[[nodiscard]] constexpr std::string_view to_string(QosClass qos) noexcept {
    switch (qos) {
        case QosClass::Guaranteed: return "Guaranteed";
        case QosClass::Burstable:  return "Burstable";
        case QosClass::BestEffort: return "BestEffort";
        case QosClass::Unknown:    return "Unknown";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────
// Owner Kind
// ─────────────────────────────────────────────

/**
 * @brief The closed set of controllers whose pods may be rebalanced.
 *
 * ReplicaSet is both terminal and a pass-through: a ReplicaSet controlled
 * by a Deployment resolves to that Deployment.
 */
enum class OwnerKind : uint8_t {
    Deployment,
    StatefulSet,
    ReplicaSet
};

[[nodiscard]] constexpr std::string_view to_string(OwnerKind kind) noexcept {
    switch (kind) {
        case OwnerKind::Deployment:  return "Deployment";
        case OwnerKind::StatefulSet: return "StatefulSet";
        case OwnerKind::ReplicaSet:  return "ReplicaSet";
    }
    return "Unknown";
}

[[nodiscard]] std::optional<OwnerKind> parse_owner_kind(std::string_view text) noexcept;

}  // namespace kube_balance
