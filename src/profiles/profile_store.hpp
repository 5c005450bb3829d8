/**
 * @file profile_store.hpp
 * @brief Thread-safe cache of workload profiles keyed by workload type.
 */

#pragma once

#include "core/concepts.hpp"
#include "profiles/workload_profile.hpp"

#include <optional>
#include <shared_mutex>

namespace kube_balance {

/**
 * @brief Concurrent key-value store of WorkloadProfile.
 *
 * Written only by the profile event consumer, read by every reconcile.
 * Guarded by a shared_mutex: readers share, writers are exclusive. All
 * reads return copies, so a caller's snapshot never observes later writes.
 */
class ProfileStore {
public:
    /// Insert or replace the profile stored under profile.name.
    void upsert(const WorkloadProfile& profile);

    /// Remove `key`. Returns false (and does nothing) if it was absent.
    bool remove(const WorkloadType& key);

    void clear();

    [[nodiscard]] ProfileMap get_all() const;
    [[nodiscard]] std::optional<WorkloadProfile> get(const WorkloadType& key) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

private:
    mutable std::shared_mutex mutex_;
    ProfileMap profiles_;
};

static_assert(ProfileSinkLike<ProfileStore>);

}  // namespace kube_balance
