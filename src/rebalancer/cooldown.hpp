/**
 * @file cooldown.hpp
 * @brief Per-owner eviction cooldown stored as an owner annotation.
 *
 * The deadline lives on the owner object itself, so it survives restarts
 * and is shared by every replica of the controller. Concurrent writers are
 * last-writer-wins.
 */

#pragma once

#include "cluster/cluster.hpp"
#include "cluster/objects.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <stop_token>

namespace kube_balance {

/**
 * @brief Read the owner's cooldown deadline.
 *
 * @return std::nullopt if the annotation is absent, an Error if it is
 *         present but not a valid RFC 3339 timestamp.
 */
[[nodiscard]] Result<std::optional<Timestamp>> cooldown_deadline(const Owner& owner);

/**
 * @brief Deadline to write after an eviction at `now`.
 *
 * now + 2 * recheck_interval, truncated to whole seconds and always at
 * least one second after `previous`.
 */
[[nodiscard]] Timestamp next_cooldown_deadline(Timestamp now,
                                               Seconds recheck_interval,
                                               std::optional<Timestamp> previous);

/**
 * @brief Patch the cooldown annotation onto `owner`.
 *
 * @return The deadline written.
 */
[[nodiscard]] ApiResult<Timestamp> set_cooldown(ICluster& cluster,
                                                const Owner& owner,
                                                Timestamp now,
                                                Seconds recheck_interval,
                                                std::stop_token stop);

}  // namespace kube_balance
