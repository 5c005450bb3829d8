/**
 * @file workload_profile.hpp
 * @brief Declarative per-workload-type eviction metadata.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace kube_balance {

/**
 * @brief Operator-declared profile for one workload type.
 *
 * The request hints are carried for operators and never interpreted by the
 * rebalancer. Higher eviction_priority means the workload is moved first.
 */
struct WorkloadProfile {
    WorkloadType name;
    std::string cpu_requests;
    std::string memory_requests;
    int32_t eviction_priority{0};

    bool operator==(const WorkloadProfile&) const = default;
};

using ProfileMap = std::unordered_map<WorkloadType, WorkloadProfile>;

}  // namespace kube_balance
