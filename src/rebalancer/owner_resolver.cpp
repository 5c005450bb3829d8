/**
 * @file owner_resolver.cpp
 * @brief resolve_owner implementation.
 */

#include "rebalancer/owner_resolver.hpp"

namespace kube_balance {

namespace {

std::optional<OwnerKind> controller_kind(const OwnerReference* ref) {
    if (ref == nullptr) return std::nullopt;
    return parse_owner_kind(ref->kind);
}

const OwnerReference* deployment_controller(const Owner& replica_set) {
    for (const auto& ref : replica_set.owner_references) {
        if (ref.controller && parse_owner_kind(ref.kind) == OwnerKind::Deployment) return &ref;
    }
    return nullptr;
}

}  // namespace

ApiResult<std::optional<Owner>> resolve_owner(ICluster& cluster,
                                              const Pod& pod,
                                              std::stop_token stop) {
    const OwnerReference* ref = pod.controller_reference();
    auto kind = controller_kind(ref);
    if (!kind) return std::optional<Owner>{};

    auto owner = cluster.get_owner(*kind, pod.ns, ref->name, stop);
    if (!owner) return owner.error();

    if (*kind != OwnerKind::ReplicaSet) return std::optional<Owner>{std::move(owner).value()};

    const OwnerReference* parent = deployment_controller(*owner);
    if (parent == nullptr) return std::optional<Owner>{std::move(owner).value()};

    auto deployment = cluster.get_owner(OwnerKind::Deployment, pod.ns, parent->name, stop);
    if (!deployment) return deployment.error();
    return std::optional<Owner>{std::move(deployment).value()};
}

}  // namespace kube_balance
