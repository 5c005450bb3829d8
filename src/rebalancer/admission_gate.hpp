/**
 * @file admission_gate.hpp
 * @brief Safety checks a candidate pod must pass before it may be evicted.
 */

#pragma once

#include "cluster/cluster.hpp"
#include "cluster/objects.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace kube_balance {

struct AdmissionDecision {
    enum class Verdict : uint8_t {
        Admitted,
        CooldownActive,     ///< Owner evicted from too recently
        BudgetExhausted,    ///< A matching disruption budget allows no disruption
        BudgetCheckFailed   ///< Budgets could not be listed
    };

    Verdict verdict{Verdict::Admitted};
    std::optional<Owner> owner;     ///< Resolved owner, when resolution succeeded
    std::string detail;             ///< Human-readable reason for a rejection

    [[nodiscard]] bool admitted() const noexcept { return verdict == Verdict::Admitted; }
};

[[nodiscard]] constexpr std::string_view to_string(AdmissionDecision::Verdict v) noexcept {
    switch (v) {
        case AdmissionDecision::Verdict::Admitted:          return "Admitted";
        case AdmissionDecision::Verdict::CooldownActive:    return "CooldownActive";
        case AdmissionDecision::Verdict::BudgetExhausted:   return "BudgetExhausted";
        case AdmissionDecision::Verdict::BudgetCheckFailed: return "BudgetCheckFailed";
    }
    return "Unknown";
}

/**
 * @brief Applies the owner cooldown check, then the disruption budget check.
 *
 * The first failing check decides. Owner resolution failures are logged and
 * the cooldown check is skipped; budget listing failures reject.
 */
class AdmissionGate {
public:
    AdmissionGate(ICluster& cluster, Logger& logger);

    [[nodiscard]] AdmissionDecision evaluate(const Pod& pod, Timestamp now, std::stop_token stop);

private:
    [[nodiscard]] std::optional<AdmissionDecision> check_cooldown(const Pod& pod,
                                                                  Timestamp now,
                                                                  std::optional<Owner>& owner,
                                                                  std::stop_token stop);
    [[nodiscard]] std::optional<AdmissionDecision> check_budgets(const Pod& pod, std::stop_token stop);

    ICluster& cluster_;
    Logger& logger_;
};

}  // namespace kube_balance
