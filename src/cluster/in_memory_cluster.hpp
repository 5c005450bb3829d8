/**
 * @file in_memory_cluster.hpp
 * @brief Process-local cluster used by the daemon's simulation mode and by tests.
 *
 * Implements both ICluster (nodes, pods, budgets, owners, eviction) and
 * IProfileEventSource (workload profile add/update/delete stream). Faults
 * can be injected per operation to exercise the rebalancer's error paths.
 */

#pragma once

#include "cluster/cluster.hpp"
#include "profiles/profile_events.hpp"

#include <array>
#include <map>
#include <mutex>
#include <optional>
#include <tuple>
#include <vector>

namespace kube_balance {

class InMemoryCluster : public ICluster, public IProfileEventSource {
public:
    enum class Operation : uint8_t {
        ListNodes,
        ListPods,
        ListBudgets,
        GetOwner,
        PatchOwner,
        Evict,
        Count_
    };

    struct EvictionRecord {
        ObjectKey pod;
        NodeName node;
        Seconds grace_period;
    };

    // ── ICluster ─────────────────────────────
    ApiResult<std::vector<Node>> list_nodes(std::stop_token stop) override;
    ApiResult<std::vector<Pod>> list_pods(std::stop_token stop) override;
    ApiResult<std::vector<DisruptionBudget>> list_disruption_budgets(
        const std::string& ns, std::stop_token stop) override;
    ApiResult<Owner> get_owner(OwnerKind kind, const std::string& ns,
                               const std::string& name, std::stop_token stop) override;
    ApiResult<void> patch_owner_annotations(OwnerKind kind, const std::string& ns,
                                            const std::string& name,
                                            const Annotations& annotations,
                                            std::stop_token stop) override;
    ApiResult<void> evict_pod(const std::string& ns, const std::string& name,
                              Seconds grace_period, std::stop_token stop) override;

    // ── IProfileEventSource ──────────────────
    SubscriptionId subscribe(ProfileEventHandler handler) override;
    void unsubscribe(SubscriptionId id) override;

    // ── State mutation ───────────────────────
    void upsert_node(Node node);
    void upsert_pod(Pod pod);
    bool remove_pod(const ObjectKey& key);
    void upsert_budget(DisruptionBudget budget);
    void upsert_owner(Owner owner);

    /// Store `profile` and publish Added (new) or Updated (existing).
    void apply_profile(const WorkloadProfile& profile);
    /// Remove the profile and publish Deleted; absent names are ignored.
    void delete_profile(const WorkloadType& name);
    /// Deliver a raw event to subscribers without touching stored profiles.
    void publish_profile_event(const ProfileEvent& event);

    // ── Fault injection ──────────────────────
    /**
     * @brief Fail `op` with `error` until cleared.
     *
     * `target` narrows the fault: the pod name for Evict, the owner name for
     * GetOwner/PatchOwner, the namespace for ListBudgets. Empty matches all.
     */
    void inject_fault(Operation op, ApiError error, std::string target = {});
    void clear_faults();

    // ── Inspection ───────────────────────────
    [[nodiscard]] std::optional<Owner> owner(OwnerKind kind, const std::string& ns,
                                             const std::string& name) const;
    [[nodiscard]] std::vector<EvictionRecord> evictions() const;
    [[nodiscard]] std::vector<Pod> pods() const;
    [[nodiscard]] std::vector<WorkloadProfile> profiles() const;
    [[nodiscard]] size_t call_count(Operation op) const;

private:
    using OwnerKey = std::tuple<OwnerKind, std::string, std::string>;

    struct Fault {
        Operation op;
        ApiError error;
        std::string target;
    };

    std::optional<ApiError> begin_call(Operation op, std::string_view target,
                                       const std::stop_token& stop);
    void publish_locked(const ProfileEvent& event);

    mutable std::mutex mutex_;
    std::vector<Node> nodes_;
    std::vector<Pod> pods_;
    std::vector<DisruptionBudget> budgets_;
    std::map<OwnerKey, Owner> owners_;
    std::map<WorkloadType, WorkloadProfile> profiles_;

    std::map<SubscriptionId, ProfileEventHandler> subscribers_;
    SubscriptionId next_subscription_{1};

    std::vector<Fault> faults_;
    std::vector<EvictionRecord> evictions_;
    std::array<size_t, static_cast<size_t>(Operation::Count_)> calls_{};
};

}  // namespace kube_balance
