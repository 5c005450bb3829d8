/**
 * @file ranking.hpp
 * @brief Eviction order for the pods of a degraded node.
 */

#pragma once

#include "cluster/objects.hpp"
#include "core/types.hpp"
#include "profiles/workload_profile.hpp"

#include <optional>
#include <vector>

namespace kube_balance {

/**
 * @brief A pod annotated with the attributes it is ranked by.
 */
struct RankedCandidate {
    Pod pod;
    QosClass qos{QosClass::Unknown};
    std::optional<WorkloadProfile> profile;     ///< Profile of the pod's workload type, if any
};

/**
 * @brief Strict weak ordering: true if `a` should be evicted before `b`.
 *
 * QoS rank descending; within equal rank, profiled pods before unprofiled
 * ones, then eviction_priority descending. Unprofiled pods compare equal.
 */
[[nodiscard]] bool evicts_before(const RankedCandidate& a, const RankedCandidate& b) noexcept;

/**
 * @brief Rank `candidates` for eviction using `profiles`.
 *
 * Pure and deterministic: a stable sort, so pods that compare equal keep
 * their input order.
 */
[[nodiscard]] std::vector<RankedCandidate> rank_for_eviction(const std::vector<Pod>& candidates,
                                                             const ProfileMap& profiles);

}  // namespace kube_balance
