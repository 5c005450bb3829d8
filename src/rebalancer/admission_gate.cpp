/**
 * @file admission_gate.cpp
 * @brief AdmissionGate implementation.
 */

#include "rebalancer/admission_gate.hpp"

#include "core/time_format.hpp"
#include "rebalancer/cooldown.hpp"
#include "rebalancer/label_selector.hpp"
#include "rebalancer/owner_resolver.hpp"

namespace kube_balance {

AdmissionGate::AdmissionGate(ICluster& cluster, Logger& logger)
    : cluster_(cluster), logger_(logger) {}

AdmissionDecision AdmissionGate::evaluate(const Pod& pod, Timestamp now, std::stop_token stop) {
    std::optional<Owner> owner;

    if (auto rejected = check_cooldown(pod, now, owner, stop)) {
        rejected->owner = std::move(owner);
        return *rejected;
    }
    if (auto rejected = check_budgets(pod, stop)) {
        rejected->owner = std::move(owner);
        return *rejected;
    }

    return AdmissionDecision{
        .verdict = AdmissionDecision::Verdict::Admitted,
        .owner = std::move(owner),
        .detail = {}
    };
}

std::optional<AdmissionDecision> AdmissionGate::check_cooldown(const Pod& pod,
                                                               Timestamp now,
                                                               std::optional<Owner>& owner,
                                                               std::stop_token stop) {
    auto resolved = resolve_owner(cluster_, pod, stop);
    if (!resolved) {
        logger_.warn("owner lookup failed for pod " + pod.key().str() +
                     ", skipping cooldown check: " + resolved.error().message);
        return std::nullopt;
    }

    owner = *resolved;
    if (!owner) return std::nullopt;

    auto deadline = cooldown_deadline(*owner);
    if (!deadline) {
        logger_.warn(deadline.error().message + ", ignoring");
        return std::nullopt;
    }
    if (!*deadline || **deadline <= now) return std::nullopt;

    return AdmissionDecision{
        .verdict = AdmissionDecision::Verdict::CooldownActive,
        .owner = std::nullopt,
        .detail = owner->display_name() + " is cooling down until " + format_rfc3339(**deadline)
    };
}

std::optional<AdmissionDecision> AdmissionGate::check_budgets(const Pod& pod, std::stop_token stop) {
    auto budgets = cluster_.list_disruption_budgets(pod.ns, stop);
    if (!budgets) {
        logger_.error("listing disruption budgets in namespace " + pod.ns +
                      " failed: " + budgets.error().message);
        return AdmissionDecision{
            .verdict = AdmissionDecision::Verdict::BudgetCheckFailed,
            .owner = std::nullopt,
            .detail = "disruption budgets unavailable: " + budgets.error().message
        };
    }

    for (const auto& budget : *budgets) {
        auto selector = compile_selector(budget.selector);
        if (!selector) {
            logger_.warn("skipping disruption budget " + budget.ns + "/" + budget.name + ": " +
                         selector.error().message);
            continue;
        }
        if (!selector->matches(pod.labels)) continue;

        if (budget.disruptions_allowed <= 0) {
            return AdmissionDecision{
                .verdict = AdmissionDecision::Verdict::BudgetExhausted,
                .owner = std::nullopt,
                .detail = "disruption budget " + budget.ns + "/" + budget.name +
                          " allows no further disruptions"
            };
        }
    }
    return std::nullopt;
}

}  // namespace kube_balance
