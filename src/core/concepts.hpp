/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for kube_balance seams.
 *
 * The profile event consumer is written against ProfileSinkLike rather than
 * the concrete ProfileStore, so event handling can be exercised against any
 * key-value sink without a live event source.
 */

#pragma once

#include "profiles/workload_profile.hpp"

#include <concepts>
#include <string>

namespace kube_balance {

// ─────────────────────────────────────────────
// ProfileSinkLike
// ─────────────────────────────────────────────

/**
 * @concept ProfileSinkLike
 * @brief Constrains types that accept profile upserts and removals.
 *
 * Both operations must be idempotent; removing an absent key is not an error.
 */
template <typename T>
concept ProfileSinkLike = requires(T sink, const WorkloadProfile& profile, const WorkloadType& key) {
    { sink.upsert(profile) } -> std::same_as<void>;
    { sink.remove(key) } -> std::convertible_to<bool>;
};

}  // namespace kube_balance
