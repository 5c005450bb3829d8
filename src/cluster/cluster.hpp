/**
 * @file cluster.hpp
 * @brief Abstract access to the cluster API consumed by the rebalancer.
 *
 * Every call takes the reconcile invocation's stop_token; implementations
 * must return ApiError::Code::Cancelled promptly once stop is requested.
 */

#pragma once

#include "cluster/objects.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace kube_balance {

/**
 * @brief Failure reported by a cluster API call.
 */
struct ApiError {
    enum class Code : uint8_t {
        NotFound,
        TooManyRequests,    ///< HTTP 429: cluster-wide backoff signal
        Conflict,
        Timeout,
        Cancelled,
        Invalid,
        Internal
    };

    Code code{Code::Internal};
    std::string message;

    ApiError(Code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool is_too_many_requests() const noexcept { return code == Code::TooManyRequests; }
    [[nodiscard]] bool is_not_found() const noexcept { return code == Code::NotFound; }
    [[nodiscard]] bool is_cancelled() const noexcept { return code == Code::Cancelled; }
};

[[nodiscard]] constexpr std::string_view to_string(ApiError::Code code) noexcept {
    switch (code) {
        case ApiError::Code::NotFound:        return "NotFound";
        case ApiError::Code::TooManyRequests: return "TooManyRequests";
        case ApiError::Code::Conflict:        return "Conflict";
        case ApiError::Code::Timeout:         return "Timeout";
        case ApiError::Code::Cancelled:       return "Cancelled";
        case ApiError::Code::Invalid:         return "Invalid";
        case ApiError::Code::Internal:        return "Internal";
    }
    return "Unknown";
}

template <typename T>
using ApiResult = Result<T, ApiError>;

/**
 * @brief Cluster API used by one reconcile invocation.
 *
 * Lists return fresh snapshots; nothing is cached behind this interface.
 */
class ICluster {
public:
    virtual ~ICluster() = default;

    virtual ApiResult<std::vector<Node>> list_nodes(std::stop_token stop) = 0;
    virtual ApiResult<std::vector<Pod>> list_pods(std::stop_token stop) = 0;
    virtual ApiResult<std::vector<DisruptionBudget>> list_disruption_budgets(
        const std::string& ns, std::stop_token stop) = 0;

    virtual ApiResult<Owner> get_owner(OwnerKind kind,
                                       const std::string& ns,
                                       const std::string& name,
                                       std::stop_token stop) = 0;

    /**
     * @brief Merge `annotations` into the owner's annotations.
     *
     * Keys not present in `annotations` are left untouched.
     */
    virtual ApiResult<void> patch_owner_annotations(OwnerKind kind,
                                                    const std::string& ns,
                                                    const std::string& name,
                                                    const Annotations& annotations,
                                                    std::stop_token stop) = 0;

    /// Graceful eviction; the owner is expected to recreate the pod elsewhere.
    virtual ApiResult<void> evict_pod(const std::string& ns,
                                      const std::string& name,
                                      Seconds grace_period,
                                      std::stop_token stop) = 0;
};

}  // namespace kube_balance
