/**
 * @file label_selector.hpp
 * @brief Compiled label selectors for disruption budget matching.
 */

#pragma once

#include "cluster/objects.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kube_balance {

/**
 * @brief A validated label selector, ready to match label sets.
 *
 * A selector compiled from an absent LabelSelector matches nothing; one
 * compiled from an empty LabelSelector matches everything. matchLabels
 * entries become equality requirements, and all requirements are ANDed.
 */
class Selector {
public:
    enum class Operator : uint8_t { In, NotIn, Exists, DoesNotExist };

    struct Requirement {
        std::string key;
        Operator op{Operator::In};
        std::vector<std::string> values;
    };

    /// Selector that matches no label set.
    [[nodiscard]] static Selector nothing();

    /// Selector built from validated requirements; empty matches everything.
    [[nodiscard]] static Selector from_requirements(std::vector<Requirement> requirements);

    [[nodiscard]] bool matches(const Labels& labels) const;
    [[nodiscard]] bool matches_nothing() const noexcept { return matches_nothing_; }
    [[nodiscard]] const std::vector<Requirement>& requirements() const noexcept { return requirements_; }

private:
    Selector() = default;

    bool matches_nothing_{false};
    std::vector<Requirement> requirements_;
};

/**
 * @brief Validate and compile a budget's selector.
 *
 * Fails on an invalid label key or value, an unknown operator, In/NotIn
 * without values, or Exists/DoesNotExist with values.
 */
[[nodiscard]] Result<Selector> compile_selector(const std::optional<LabelSelector>& selector);

/// Qualified-name check for label keys: optional DNS-subdomain prefix and a "/".
[[nodiscard]] bool is_valid_label_key(std::string_view key);

/// At most 63 characters, alphanumeric at both ends, [-_.] inside. Empty is valid.
[[nodiscard]] bool is_valid_label_value(std::string_view value);

}  // namespace kube_balance
