/**
 * @file cluster_state.hpp
 * @brief Load an InMemoryCluster from a TOML cluster-state description.
 *
 * Layout:
 *   [[nodes]]     name, degraded, annotations = { ... }
 *   [[profiles]]  name, cpu_requests, memory_requests, eviction_priority
 *   [[owners]]    kind, namespace, name, annotations, controller = { kind, name }
 *   [[pods]]      name, namespace, node, phase, labels, owner = { kind, name }
 *                 [[pods.containers]] name, requests = { cpu, memory }, limits = { ... }
 *   [[budgets]]   namespace, name, disruptions_allowed,
 *                 selector = { match_labels = { ... },
 *                              match_expressions = [ { key, operator, values } ] }
 *
 * `namespace` defaults to "default" and pod `phase` to "Running".
 */

#pragma once

#include "cluster/in_memory_cluster.hpp"
#include "core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace kube_balance {

struct ClusterStateSummary {
    size_t nodes = 0;
    size_t pods = 0;
    size_t owners = 0;
    size_t budgets = 0;
    size_t profiles = 0;
};

/**
 * @brief Parse TOML text and add every object it describes to `cluster`.
 *
 * Nothing is added if any entry is invalid.
 */
Result<ClusterStateSummary> parse_cluster_state(std::string_view toml_text, InMemoryCluster& cluster);

/**
 * @brief Read and parse a cluster-state file.
 */
Result<ClusterStateSummary> load_cluster_state(const std::filesystem::path& path,
                                               InMemoryCluster& cluster);

}  // namespace kube_balance
