/**
 * @file qos.hpp
 * @brief QoS classification of pods from container requests and limits.
 */

#pragma once

#include "cluster/objects.hpp"
#include "core/types.hpp"

namespace kube_balance {

/**
 * @brief Classify a pod as BestEffort, Burstable or Guaranteed.
 *
 * Scan order, each step over all containers:
 *   1. no containers, or any container with neither requests nor limits
 *      -> BestEffort
 *   2. any container whose cpu or memory request differs from its limit
 *      (absent counts as zero) -> Burstable
 *   3. any container with a zero cpu or memory request -> BestEffort
 *   4. otherwise -> Guaranteed
 */
[[nodiscard]] QosClass classify_qos(const Pod& pod);

/**
 * @brief Eviction rank; higher is evicted first.
 */
[[nodiscard]] constexpr int eviction_rank(QosClass qos) noexcept {
    switch (qos) {
        case QosClass::BestEffort: return 3;
        case QosClass::Burstable:  return 2;
        case QosClass::Guaranteed: return 1;
        case QosClass::Unknown:    return 0;
    }
    return 0;
}

}  // namespace kube_balance
