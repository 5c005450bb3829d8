/**
 * @file ranking.cpp
 * @brief rank_for_eviction: QoS first, then workload profile priority.
 *
 * Complexity: O(P log P) for P candidate pods; QoS and profile lookups are
 * computed once per pod before sorting.
 */

#include "rebalancer/ranking.hpp"

#include "rebalancer/qos.hpp"

#include <algorithm>

namespace kube_balance {

bool evicts_before(const RankedCandidate& a, const RankedCandidate& b) noexcept {
    int rank_a = eviction_rank(a.qos);
    int rank_b = eviction_rank(b.qos);
    if (rank_a != rank_b) return rank_a > rank_b;

    if (a.profile.has_value() != b.profile.has_value()) return a.profile.has_value();
    if (!a.profile) return false;

    return a.profile->eviction_priority > b.profile->eviction_priority;
}

std::vector<RankedCandidate> rank_for_eviction(const std::vector<Pod>& candidates,
                                               const ProfileMap& profiles) {
    std::vector<RankedCandidate> ranked;
    ranked.reserve(candidates.size());

    for (const auto& pod : candidates) {
        RankedCandidate candidate{.pod = pod, .qos = classify_qos(pod), .profile = std::nullopt};
        if (auto type = pod.workload_type()) {
            if (auto it = profiles.find(*type); it != profiles.end()) {
                candidate.profile = it->second;
            }
        }
        ranked.push_back(std::move(candidate));
    }

    std::stable_sort(ranked.begin(), ranked.end(), evicts_before);
    return ranked;
}

}  // namespace kube_balance
