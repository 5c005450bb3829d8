/**
 * @file profile_store.cpp
 * @brief ProfileStore implementation.
 */

#include "profiles/profile_store.hpp"

#include <mutex>

namespace kube_balance {

void ProfileStore::upsert(const WorkloadProfile& profile) {
    std::unique_lock lock(mutex_);
    profiles_[profile.name] = profile;
}

bool ProfileStore::remove(const WorkloadType& key) {
    std::unique_lock lock(mutex_);
    return profiles_.erase(key) > 0;
}

void ProfileStore::clear() {
    std::unique_lock lock(mutex_);
    profiles_.clear();
}

ProfileMap ProfileStore::get_all() const {
    std::shared_lock lock(mutex_);
    return profiles_;
}

std::optional<WorkloadProfile> ProfileStore::get(const WorkloadType& key) const {
    std::shared_lock lock(mutex_);
    auto it = profiles_.find(key);
    if (it == profiles_.end()) return std::nullopt;
    return it->second;
}

size_t ProfileStore::size() const {
    std::shared_lock lock(mutex_);
    return profiles_.size();
}

bool ProfileStore::empty() const {
    std::shared_lock lock(mutex_);
    return profiles_.empty();
}

}  // namespace kube_balance
