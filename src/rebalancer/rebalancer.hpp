/**
 * @file rebalancer.hpp
 * @brief One reconcile cycle: find degraded nodes and move pods off them.
 *
 * The cycle is stateless between invocations. Nodes, pods, owners and
 * budgets are fetched fresh through ICluster; the only local input is the
 * ProfileStore snapshot taken at the start of the cycle. Owner cooldowns
 * persist on the owners themselves.
 *
 * Per cycle:
 *   1. Snapshot profiles; nothing to do if there are none.
 *   2. List nodes and keep the degraded ones (list order).
 *   3. List pods once; for each degraded node rank its Running/Pending pods.
 *   4. Walk the ranking through the AdmissionGate, evicting admitted pods
 *      until the per-node cap is reached.
 */

#pragma once

#include "cluster/cluster.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "profiles/profile_store.hpp"
#include "rebalancer/admission_gate.hpp"
#include "rebalancer/evictor.hpp"
#include "telemetry/event_recorder.hpp"

#include <cstdint>
#include <functional>
#include <stop_token>
#include <string_view>
#include <vector>

namespace kube_balance {

struct ReconcileResult {
    enum class Status : uint8_t {
        Idle,           ///< Nothing evicted
        Evicted,        ///< At least one pod evicted
        RateLimited,    ///< Cluster requested backoff; cycle abandoned
        Aborted,        ///< Node or pod listing failed
        Cancelled       ///< Stop was requested mid-cycle
    };

    Status status{Status::Idle};
    Seconds requeue_after{0};
    std::vector<ObjectKey> evicted;     ///< Pods evicted by this cycle, in order
};

[[nodiscard]] constexpr std::string_view to_string(ReconcileResult::Status s) noexcept {
    switch (s) {
        case ReconcileResult::Status::Idle:        return "Idle";
        case ReconcileResult::Status::Evicted:     return "Evicted";
        case ReconcileResult::Status::RateLimited: return "RateLimited";
        case ReconcileResult::Status::Aborted:     return "Aborted";
        case ReconcileResult::Status::Cancelled:   return "Cancelled";
    }
    return "Unknown";
}

class Rebalancer {
public:
    using Clock = std::function<Timestamp()>;

    Rebalancer(RebalancerConfig config,
               ICluster& cluster,
               const ProfileStore& profiles,
               Logger& logger,
               EventRecorder& events,
               Clock clock = [] { return std::chrono::system_clock::now(); });

    /// Run one cycle. Never throws on collaborator failure.
    [[nodiscard]] ReconcileResult reconcile(std::stop_token stop = {});

    [[nodiscard]] const RebalancerConfig& config() const noexcept { return config_; }

private:
    enum class NodePass : uint8_t { Continue, Stop };

    NodePass rebalance_node(const Node& node,
                            const std::vector<Pod>& pods,
                            const ProfileMap& profiles,
                            ReconcileResult& result,
                            std::stop_token stop);

    void record_cooldown(const Pod& pod, const std::optional<Owner>& owner, std::stop_token stop);

    [[nodiscard]] ReconcileResult finish(ReconcileResult result) const;
    [[nodiscard]] Seconds recheck_interval() const noexcept { return Seconds{config_.recheck_interval_s}; }

    RebalancerConfig config_;
    ICluster& cluster_;
    const ProfileStore& profiles_;
    Logger& logger_;
    EventRecorder& events_;
    Clock clock_;

    AdmissionGate gate_;
    Evictor evictor_;
};

}  // namespace kube_balance
