/**
 * @file evictor.hpp
 * @brief Issues graceful evictions and classifies their outcome.
 */

#pragma once

#include "cluster/cluster.hpp"
#include "cluster/objects.hpp"
#include "core/logger.hpp"

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string_view>

namespace kube_balance {

enum class EvictionOutcome : uint8_t {
    Evicted,
    RateLimited,    ///< Cluster asked us to back off; stop the cycle
    Failed,         ///< Any other error; try the next candidate
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(EvictionOutcome o) noexcept {
    switch (o) {
        case EvictionOutcome::Evicted:     return "Evicted";
        case EvictionOutcome::RateLimited: return "RateLimited";
        case EvictionOutcome::Failed:      return "Failed";
        case EvictionOutcome::Cancelled:   return "Cancelled";
    }
    return "Unknown";
}

struct EvictionResult {
    EvictionOutcome outcome{EvictionOutcome::Evicted};
    std::optional<ApiError> error;
};

class Evictor {
public:
    Evictor(ICluster& cluster, Logger& logger);

    /// Evict with the fixed grace period.
    [[nodiscard]] EvictionResult evict(const Pod& pod, std::stop_token stop);

private:
    ICluster& cluster_;
    Logger& logger_;
};

}  // namespace kube_balance
