/**
 * @file evictor.cpp
 * @brief Evictor implementation.
 */

#include "rebalancer/evictor.hpp"

namespace kube_balance {

Evictor::Evictor(ICluster& cluster, Logger& logger)
    : cluster_(cluster), logger_(logger) {}

EvictionResult Evictor::evict(const Pod& pod, std::stop_token stop) {
    auto evicted = cluster_.evict_pod(pod.ns, pod.name, kEvictionGracePeriod, stop);
    if (evicted) {
        logger_.info("evicted pod " + pod.key().str() + " from node " + pod.node_name);
        return {EvictionOutcome::Evicted, std::nullopt};
    }

    const ApiError& err = evicted.error();
    if (err.is_cancelled()) {
        return {EvictionOutcome::Cancelled, err};
    }
    if (err.is_too_many_requests()) {
        logger_.warn("eviction of pod " + pod.key().str() + " rate limited: " + err.message);
        return {EvictionOutcome::RateLimited, err};
    }
    logger_.error("eviction of pod " + pod.key().str() + " failed (" +
                  std::string{to_string(err.code)} + "): " + err.message);
    return {EvictionOutcome::Failed, err};
}

}  // namespace kube_balance
