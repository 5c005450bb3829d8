/**
 * @file in_memory_cluster.cpp
 * @brief InMemoryCluster implementation.
 */

#include "cluster/in_memory_cluster.hpp"

#include <algorithm>

namespace kube_balance {

namespace {

template <typename T, typename Pred>
void upsert_by(std::vector<T>& items, T item, Pred same) {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const T& existing) { return same(existing, item); });
    if (it != items.end()) {
        *it = std::move(item);
    } else {
        items.push_back(std::move(item));
    }
}

}  // namespace

// ── Call bookkeeping ─────────────────────────

std::optional<ApiError> InMemoryCluster::begin_call(Operation op, std::string_view target,
                                                    const std::stop_token& stop) {
    ++calls_[static_cast<size_t>(op)];
    if (stop.stop_requested()) {
        return ApiError{ApiError::Code::Cancelled, "request cancelled"};
    }
    for (const auto& fault : faults_) {
        if (fault.op == op && (fault.target.empty() || fault.target == target)) {
            return fault.error;
        }
    }
    return std::nullopt;
}

// ── ICluster ─────────────────────────────────

ApiResult<std::vector<Node>> InMemoryCluster::list_nodes(std::stop_token stop) {
    std::lock_guard lock(mutex_);
    if (auto err = begin_call(Operation::ListNodes, {}, stop)) return *err;
    return nodes_;
}

ApiResult<std::vector<Pod>> InMemoryCluster::list_pods(std::stop_token stop) {
    std::lock_guard lock(mutex_);
    if (auto err = begin_call(Operation::ListPods, {}, stop)) return *err;
    return pods_;
}

ApiResult<std::vector<DisruptionBudget>> InMemoryCluster::list_disruption_budgets(
    const std::string& ns, std::stop_token stop) {
    std::lock_guard lock(mutex_);
    if (auto err = begin_call(Operation::ListBudgets, ns, stop)) return *err;

    std::vector<DisruptionBudget> result;
    for (const auto& budget : budgets_) {
        if (budget.ns == ns) result.push_back(budget);
    }
    return result;
}

ApiResult<Owner> InMemoryCluster::get_owner(OwnerKind kind, const std::string& ns,
                                            const std::string& name, std::stop_token stop) {
    std::lock_guard lock(mutex_);
    if (auto err = begin_call(Operation::GetOwner, name, stop)) return *err;

    auto it = owners_.find(OwnerKey{kind, ns, name});
    if (it == owners_.end()) {
        return ApiError{ApiError::Code::NotFound,
                        std::string{to_string(kind)} + " " + ns + "/" + name + " not found"};
    }
    return it->second;
}

ApiResult<void> InMemoryCluster::patch_owner_annotations(OwnerKind kind, const std::string& ns,
                                                         const std::string& name,
                                                         const Annotations& annotations,
                                                         std::stop_token stop) {
    std::lock_guard lock(mutex_);
    if (auto err = begin_call(Operation::PatchOwner, name, stop)) return *err;

    auto it = owners_.find(OwnerKey{kind, ns, name});
    if (it == owners_.end()) {
        return ApiError{ApiError::Code::NotFound,
                        std::string{to_string(kind)} + " " + ns + "/" + name + " not found"};
    }
    for (const auto& [key, value] : annotations) {
        it->second.annotations[key] = value;
    }
    return {};
}

ApiResult<void> InMemoryCluster::evict_pod(const std::string& ns, const std::string& name,
                                           Seconds grace_period, std::stop_token stop) {
    std::lock_guard lock(mutex_);
    if (auto err = begin_call(Operation::Evict, name, stop)) return *err;

    auto it = std::find_if(pods_.begin(), pods_.end(), [&](const Pod& pod) {
        return pod.ns == ns && pod.name == name;
    });
    if (it == pods_.end()) {
        return ApiError{ApiError::Code::NotFound, "pod " + ns + "/" + name + " not found"};
    }
    evictions_.push_back({it->key(), it->node_name, grace_period});
    pods_.erase(it);
    return {};
}

// ── IProfileEventSource ──────────────────────

SubscriptionId InMemoryCluster::subscribe(ProfileEventHandler handler) {
    std::lock_guard lock(mutex_);
    auto id = next_subscription_++;
    for (const auto& [name, profile] : profiles_) {
        handler(ProfileEvent{ProfileEventType::Added, profile});
    }
    subscribers_.emplace(id, std::move(handler));
    return id;
}

void InMemoryCluster::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    subscribers_.erase(id);
}

void InMemoryCluster::publish_locked(const ProfileEvent& event) {
    for (const auto& [id, handler] : subscribers_) {
        handler(event);
    }
}

// ── State mutation ───────────────────────────

void InMemoryCluster::upsert_node(Node node) {
    std::lock_guard lock(mutex_);
    upsert_by(nodes_, std::move(node),
              [](const Node& a, const Node& b) { return a.name == b.name; });
}

void InMemoryCluster::upsert_pod(Pod pod) {
    std::lock_guard lock(mutex_);
    upsert_by(pods_, std::move(pod),
              [](const Pod& a, const Pod& b) { return a.key() == b.key(); });
}

bool InMemoryCluster::remove_pod(const ObjectKey& key) {
    std::lock_guard lock(mutex_);
    auto removed = std::erase_if(pods_, [&](const Pod& pod) { return pod.key() == key; });
    return removed > 0;
}

void InMemoryCluster::upsert_budget(DisruptionBudget budget) {
    std::lock_guard lock(mutex_);
    upsert_by(budgets_, std::move(budget), [](const DisruptionBudget& a, const DisruptionBudget& b) {
        return a.ns == b.ns && a.name == b.name;
    });
}

void InMemoryCluster::upsert_owner(Owner owner) {
    std::lock_guard lock(mutex_);
    OwnerKey key{owner.kind, owner.ns, owner.name};
    owners_[key] = std::move(owner);
}

void InMemoryCluster::apply_profile(const WorkloadProfile& profile) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = profiles_.insert_or_assign(profile.name, profile);
    publish_locked(ProfileEvent{inserted ? ProfileEventType::Added : ProfileEventType::Updated,
                                profile});
}

void InMemoryCluster::delete_profile(const WorkloadType& name) {
    std::lock_guard lock(mutex_);
    auto it = profiles_.find(name);
    if (it == profiles_.end()) return;
    ProfileEvent event{ProfileEventType::Deleted, it->second};
    profiles_.erase(it);
    publish_locked(event);
}

void InMemoryCluster::publish_profile_event(const ProfileEvent& event) {
    std::lock_guard lock(mutex_);
    publish_locked(event);
}

// ── Fault injection ──────────────────────────

void InMemoryCluster::inject_fault(Operation op, ApiError error, std::string target) {
    std::lock_guard lock(mutex_);
    faults_.push_back({op, std::move(error), std::move(target)});
}

void InMemoryCluster::clear_faults() {
    std::lock_guard lock(mutex_);
    faults_.clear();
}

// ── Inspection ───────────────────────────────

std::optional<Owner> InMemoryCluster::owner(OwnerKind kind, const std::string& ns,
                                            const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = owners_.find(OwnerKey{kind, ns, name});
    if (it == owners_.end()) return std::nullopt;
    return it->second;
}

std::vector<InMemoryCluster::EvictionRecord> InMemoryCluster::evictions() const {
    std::lock_guard lock(mutex_);
    return evictions_;
}

std::vector<Pod> InMemoryCluster::pods() const {
    std::lock_guard lock(mutex_);
    return pods_;
}

std::vector<WorkloadProfile> InMemoryCluster::profiles() const {
    std::lock_guard lock(mutex_);
    std::vector<WorkloadProfile> result;
    result.reserve(profiles_.size());
    for (const auto& [name, profile] : profiles_) result.push_back(profile);
    return result;
}

size_t InMemoryCluster::call_count(Operation op) const {
    std::lock_guard lock(mutex_);
    return calls_[static_cast<size_t>(op)];
}

}  // namespace kube_balance
