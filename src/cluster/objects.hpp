/**
 * @file objects.hpp
 * @brief Read-only snapshots of the cluster objects the rebalancer consumes.
 *
 * Nodes, pods, owners and disruption budgets are fetched fresh on every
 * reconcile; the engine never mutates them locally. Only owner annotations
 * are written back, through ICluster::patch_owner_annotations.
 */

#pragma once

#include "cluster/quantity.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kube_balance {

using Labels = std::map<std::string, std::string, std::less<>>;
using Annotations = std::map<std::string, std::string, std::less<>>;

// ─────────────────────────────────────────────
// Node
// ─────────────────────────────────────────────

struct Node {
    NodeName name;
    Annotations annotations;

    /// Degraded iff the marker annotation is present; its value is ignored.
    [[nodiscard]] bool is_degraded() const {
        return annotations.find(kDegradedAnnotation) != annotations.end();
    }
};

// ─────────────────────────────────────────────
// Pod
// ─────────────────────────────────────────────

struct Container {
    std::string name;
    ResourceList requests;
    ResourceList limits;
};

struct OwnerReference {
    std::string kind;       ///< Free-form; only Deployment/StatefulSet/ReplicaSet are resolved
    std::string name;
    bool controller{false};
};

struct Pod {
    std::string name;
    std::string ns;
    NodeName node_name;
    PodPhase phase{PodPhase::Pending};
    Labels labels;
    std::vector<Container> containers;
    std::vector<OwnerReference> owner_references;

    [[nodiscard]] ObjectKey key() const { return {ns, name}; }

    /// Value of the workload-type label, if set.
    [[nodiscard]] std::optional<WorkloadType> workload_type() const {
        auto it = labels.find(kWorkloadTypeLabel);
        if (it == labels.end()) return std::nullopt;
        return it->second;
    }

    /// First owner reference flagged as controller, or nullptr.
    [[nodiscard]] const OwnerReference* controller_reference() const {
        for (const auto& ref : owner_references) {
            if (ref.controller) return &ref;
        }
        return nullptr;
    }
};

// ─────────────────────────────────────────────
// Owner
// ─────────────────────────────────────────────

struct Owner {
    OwnerKind kind{OwnerKind::Deployment};
    std::string ns;
    std::string name;
    Annotations annotations;
    std::vector<OwnerReference> owner_references;

    /// "Kind ns/name", used in logs and events.
    [[nodiscard]] std::string display_name() const {
        return std::string{to_string(kind)} + " " + ns + "/" + name;
    }
};

// ─────────────────────────────────────────────
// Disruption Budget
// ─────────────────────────────────────────────

struct LabelSelectorRequirement {
    std::string key;
    std::string op;                     ///< "In", "NotIn", "Exists", "DoesNotExist"
    std::vector<std::string> values;
};

struct LabelSelector {
    Labels match_labels;
    std::vector<LabelSelectorRequirement> match_expressions;
};

struct DisruptionBudget {
    std::string ns;
    std::string name;
    std::optional<LabelSelector> selector;  ///< Absent selector selects nothing
    int32_t disruptions_allowed{0};
};

}  // namespace kube_balance
