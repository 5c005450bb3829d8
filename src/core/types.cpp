/**
 * @file types.cpp
 * @brief Parsing helpers for the vocabulary enumerations.
 */

#include "core/types.hpp"

namespace kube_balance {

std::optional<PodPhase> parse_pod_phase(std::string_view text) noexcept {
    if (text == "Pending")   return PodPhase::Pending;
    if (text == "Running")   return PodPhase::Running;
    if (text == "Succeeded") return PodPhase::Succeeded;
    if (text == "Failed")    return PodPhase::Failed;
    if (text == "Unknown")   return PodPhase::Unknown;
    return std::nullopt;
}

std::optional<OwnerKind> parse_owner_kind(std::string_view text) noexcept {
    if (text == "Deployment")  return OwnerKind::Deployment;
    if (text == "StatefulSet") return OwnerKind::StatefulSet;
    if (text == "ReplicaSet")  return OwnerKind::ReplicaSet;
    return std::nullopt;
}

}  // namespace kube_balance
