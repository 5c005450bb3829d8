/**
 * @file rebalancer.cpp
 * @brief Rebalancer reconcile cycle.
 */

#include "rebalancer/rebalancer.hpp"

#include "core/time_format.hpp"
#include "rebalancer/cooldown.hpp"
#include "rebalancer/ranking.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace kube_balance {

namespace {

ObjectRef node_ref(const Node& node) {
    return {"Node", "", node.name};
}

ObjectRef pod_ref(const Pod& pod) {
    return {"Pod", pod.ns, pod.name};
}

ObjectRef owner_ref(const Owner& owner) {
    return {std::string{to_string(owner.kind)}, owner.ns, owner.name};
}

bool is_candidate(const Pod& pod, const NodeName& node) {
    return pod.node_name == node &&
           (pod.phase == PodPhase::Running || pod.phase == PodPhase::Pending);
}

}  // namespace

Rebalancer::Rebalancer(RebalancerConfig config,
                       ICluster& cluster,
                       const ProfileStore& profiles,
                       Logger& logger,
                       EventRecorder& events,
                       Clock clock)
    : config_(config)
    , cluster_(cluster)
    , profiles_(profiles)
    , logger_(logger)
    , events_(events)
    , clock_(std::move(clock))
    , gate_(cluster, logger)
    , evictor_(cluster, logger) {}

// ─────────────────────────────────────────────
// Cycle
// ─────────────────────────────────────────────

ReconcileResult Rebalancer::reconcile(std::stop_token stop) {
    ReconcileResult result{.status = ReconcileResult::Status::Idle,
                           .requeue_after = recheck_interval(),
                           .evicted = {}};

    if (stop.stop_requested()) {
        result.status = ReconcileResult::Status::Cancelled;
        return finish(std::move(result));
    }

    ProfileMap profiles = profiles_.get_all();
    if (profiles.empty()) {
        logger_.debug("no workload profiles loaded, nothing to rebalance");
        return finish(std::move(result));
    }

    auto nodes = cluster_.list_nodes(stop);
    if (!nodes) {
        if (nodes.error().is_cancelled()) {
            result.status = ReconcileResult::Status::Cancelled;
        } else {
            logger_.error("listing nodes failed: " + nodes.error().message);
            result.status = ReconcileResult::Status::Aborted;
        }
        return finish(std::move(result));
    }

    std::vector<Node> degraded;
    std::copy_if(nodes->begin(), nodes->end(), std::back_inserter(degraded),
                 [](const Node& n) { return n.is_degraded(); });
    if (degraded.empty()) {
        logger_.debug("no degraded nodes");
        return finish(std::move(result));
    }
    for (const auto& node : degraded) {
        events_.normal(node_ref(node), reason::kNodeDegraded, "node is degraded, draining pods");
    }

    auto pods = cluster_.list_pods(stop);
    if (!pods) {
        if (pods.error().is_cancelled()) {
            result.status = ReconcileResult::Status::Cancelled;
        } else {
            logger_.error("listing pods failed: " + pods.error().message);
            result.status = ReconcileResult::Status::Aborted;
        }
        return finish(std::move(result));
    }

    for (const auto& node : degraded) {
        if (rebalance_node(node, *pods, profiles, result, stop) == NodePass::Stop) {
            return finish(std::move(result));
        }
    }

    if (!result.evicted.empty()) {
        result.status = ReconcileResult::Status::Evicted;
        result.requeue_after = Seconds{config_.requeue_after_eviction_s};
    }
    return finish(std::move(result));
}

Rebalancer::NodePass Rebalancer::rebalance_node(const Node& node,
                                                const std::vector<Pod>& pods,
                                                const ProfileMap& profiles,
                                                ReconcileResult& result,
                                                std::stop_token stop) {
    std::vector<Pod> candidates;
    std::copy_if(pods.begin(), pods.end(), std::back_inserter(candidates),
                 [&](const Pod& p) { return is_candidate(p, node.name); });

    logger_.log(LogLevel::Info,
                "node " + node.name + " is degraded, ranking " +
                    std::to_string(candidates.size()) + " candidate pods",
                {{"node", node.name}});

    auto ranked = rank_for_eviction(candidates, profiles);
    uint32_t evicted_here = 0;

    for (const auto& candidate : ranked) {
        if (evicted_here >= config_.max_evictions_per_node_per_cycle) break;

        const Pod& pod = candidate.pod;
        if (config_.skip_unprofiled && !candidate.profile) {
            logger_.debug("skipping unprofiled pod " + pod.key().str());
            continue;
        }

        AdmissionDecision decision = gate_.evaluate(pod, clock_(), stop);
        if (stop.stop_requested()) {
            result.status = ReconcileResult::Status::Cancelled;
            return NodePass::Stop;
        }

        switch (decision.verdict) {
            case AdmissionDecision::Verdict::CooldownActive:
                events_.normal(pod_ref(pod), reason::kEvictionSkipped, decision.detail);
                continue;
            case AdmissionDecision::Verdict::BudgetExhausted:
                events_.warning(pod_ref(pod), reason::kPdbViolation, decision.detail);
                continue;
            case AdmissionDecision::Verdict::BudgetCheckFailed:
                events_.warning(pod_ref(pod), reason::kEvictionSkipped, decision.detail);
                continue;
            case AdmissionDecision::Verdict::Admitted:
                break;
        }

        EvictionResult eviction = evictor_.evict(pod, stop);
        switch (eviction.outcome) {
            case EvictionOutcome::Evicted:
                break;
            case EvictionOutcome::Cancelled:
                result.status = ReconcileResult::Status::Cancelled;
                return NodePass::Stop;
            case EvictionOutcome::RateLimited:
                events_.warning(pod_ref(pod), reason::kEvictionRateLimited,
                                "eviction rate limited, backing off: " + eviction.error->message);
                result.status = ReconcileResult::Status::RateLimited;
                result.requeue_after = Seconds{config_.rate_limit_backoff_s};
                return NodePass::Stop;
            case EvictionOutcome::Failed:
                events_.warning(pod_ref(pod), reason::kEvictionFailed,
                                "eviction failed: " + eviction.error->message);
                continue;
        }

        result.evicted.push_back(pod.key());
        ++evicted_here;
        logger_.log(LogLevel::Info, "evicted pod " + pod.key().str(),
                    {{"node", node.name},
                     {"pod", pod.key().str()},
                     {"qos", to_string(candidate.qos)},
                     {"owner", decision.owner ? decision.owner->display_name() : std::string{}}});
        events_.normal(pod_ref(pod), reason::kPodEvicted,
                       "evicted from degraded node " + node.name + " (" +
                       std::string{to_string(candidate.qos)} + ")");

        record_cooldown(pod, decision.owner, stop);
        if (stop.stop_requested()) {
            result.status = ReconcileResult::Status::Cancelled;
            return NodePass::Stop;
        }

        if (config_.single_eviction_per_cycle) {
            result.status = ReconcileResult::Status::Evicted;
            result.requeue_after = Seconds{config_.requeue_after_eviction_s};
            return NodePass::Stop;
        }
    }
    return NodePass::Continue;
}

void Rebalancer::record_cooldown(const Pod& pod, const std::optional<Owner>& owner, std::stop_token stop) {
    if (!owner) {
        logger_.debug("pod " + pod.key().str() + " has no resolvable owner, no cooldown recorded");
        return;
    }

    auto deadline = set_cooldown(cluster_, *owner, clock_(), recheck_interval(), stop);
    if (!deadline && deadline.error().is_cancelled()) {
        logger_.info("cooldown on " + owner->display_name() + " not recorded, cycle cancelled");
        return;
    }
    if (!deadline) {
        // The eviction stands; the owner is simply eligible again next cycle.
        logger_.error("setting cooldown on " + owner->display_name() + " failed: " +
                      deadline.error().message);
        events_.warning(owner_ref(*owner), reason::kCooldownAnnotationFailed,
                        "could not record eviction cooldown: " + deadline.error().message);
        return;
    }
    events_.normal(owner_ref(*owner), reason::kCooldownSet,
                   "eviction cooldown until " + format_rfc3339(*deadline));
}

ReconcileResult Rebalancer::finish(ReconcileResult result) const {
    logger_.log(result.status == ReconcileResult::Status::Idle ? LogLevel::Debug : LogLevel::Info,
                "reconcile finished: status=" + std::string{to_string(result.status)} +
                    " evicted=" + std::to_string(result.evicted.size()) +
                    " requeue_after=" + std::to_string(result.requeue_after.count()) + "s",
                {{"status", to_string(result.status)},
                 {"requeue_after_s", std::to_string(result.requeue_after.count())}});
    return result;
}

}  // namespace kube_balance
