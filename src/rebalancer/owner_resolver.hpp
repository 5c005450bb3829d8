/**
 * @file owner_resolver.hpp
 * @brief Resolve the top-level controller a pod belongs to.
 */

#pragma once

#include "cluster/cluster.hpp"
#include "cluster/objects.hpp"

#include <optional>
#include <stop_token>

namespace kube_balance {

/**
 * @brief Resolve the owner that carries the pod's eviction cooldown.
 *
 * Deployment and StatefulSet controllers are returned as-is. A ReplicaSet
 * is followed one level to its controlling Deployment when it has one.
 *
 * @return std::nullopt when the pod has no controller reference or its
 *         controller kind is not one we rebalance; an ApiError when a
 *         fetch fails.
 */
[[nodiscard]] ApiResult<std::optional<Owner>> resolve_owner(ICluster& cluster,
                                                            const Pod& pod,
                                                            std::stop_token stop);

}  // namespace kube_balance
