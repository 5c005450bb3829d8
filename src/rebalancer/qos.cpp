/**
 * @file qos.cpp
 * @brief QoS classification.
 */

#include "rebalancer/qos.hpp"

#include <algorithm>

namespace kube_balance {

namespace {

bool declares_nothing(const Container& c) {
    return c.requests.empty() && c.limits.empty();
}

bool requests_differ_from_limits(const Container& c) {
    return resource_or_zero(c.requests, kResourceCpu) != resource_or_zero(c.limits, kResourceCpu) ||
           resource_or_zero(c.requests, kResourceMemory) != resource_or_zero(c.limits, kResourceMemory);
}

bool has_zero_request(const Container& c) {
    return resource_or_zero(c.requests, kResourceCpu).is_zero() ||
           resource_or_zero(c.requests, kResourceMemory).is_zero();
}

}  // namespace

QosClass classify_qos(const Pod& pod) {
    const auto& containers = pod.containers;

    if (containers.empty() || std::any_of(containers.begin(), containers.end(), declares_nothing)) {
        return QosClass::BestEffort;
    }
    if (std::any_of(containers.begin(), containers.end(), requests_differ_from_limits)) {
        return QosClass::Burstable;
    }
    if (std::any_of(containers.begin(), containers.end(), has_zero_request)) {
        return QosClass::BestEffort;
    }
    return QosClass::Guaranteed;
}

}  // namespace kube_balance
