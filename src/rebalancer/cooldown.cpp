/**
 * @file cooldown.cpp
 * @brief Cooldown annotation read/write.
 */

#include "rebalancer/cooldown.hpp"

#include "core/time_format.hpp"

#include <algorithm>

namespace kube_balance {

Result<std::optional<Timestamp>> cooldown_deadline(const Owner& owner) {
    auto it = owner.annotations.find(kCooldownAnnotation);
    if (it == owner.annotations.end()) return std::optional<Timestamp>{};

    auto parsed = parse_rfc3339(it->second);
    if (!parsed) {
        return Error{"unparsable cooldown deadline \"" + it->second + "\" on " +
                     owner.display_name() + ": " + parsed.error().message};
    }
    return std::optional<Timestamp>{*parsed};
}

Timestamp next_cooldown_deadline(Timestamp now,
                                 Seconds recheck_interval,
                                 std::optional<Timestamp> previous) {
    using std::chrono::floor;

    Timestamp deadline = floor<Seconds>(now + 2 * recheck_interval);
    if (previous) {
        deadline = std::max(deadline, Timestamp{floor<Seconds>(*previous) + Seconds{1}});
    }
    return deadline;
}

ApiResult<Timestamp> set_cooldown(ICluster& cluster,
                                  const Owner& owner,
                                  Timestamp now,
                                  Seconds recheck_interval,
                                  std::stop_token stop) {
    // An unreadable previous value only loses the monotonicity floor.
    std::optional<Timestamp> previous;
    if (auto current = cooldown_deadline(owner)) previous = *current;

    Timestamp deadline = next_cooldown_deadline(now, recheck_interval, previous);

    Annotations patch{{std::string{kCooldownAnnotation}, format_rfc3339(deadline)}};
    auto patched = cluster.patch_owner_annotations(owner.kind, owner.ns, owner.name, patch, stop);
    if (!patched) return patched.error();
    return deadline;
}

}  // namespace kube_balance
