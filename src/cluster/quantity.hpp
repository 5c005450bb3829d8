/**
 * @file quantity.hpp
 * @brief Resource quantities in Kubernetes notation ("250m", "2", "128Mi", "1e3").
 *
 * Quantities are held as an exact count of milli-units so that equal
 * amounts written differently ("1" and "1000m", "1Ki" and "1024") compare
 * equal, which is what QoS classification needs.
 */

#pragma once

#include "core/result.hpp"

#include <compare>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <string_view>

namespace kube_balance {

struct Quantity {
    int64_t milli_value{0};

    [[nodiscard]] constexpr bool is_zero() const noexcept { return milli_value == 0; }

    auto operator<=>(const Quantity&) const = default;
};

/// Resource name ("cpu", "memory", ...) to amount.
using ResourceList = std::map<std::string, Quantity, std::less<>>;

inline constexpr Quantity kMaxQuantity{std::numeric_limits<int64_t>::max()};

inline constexpr std::string_view kResourceCpu = "cpu";
inline constexpr std::string_view kResourceMemory = "memory";

/**
 * @brief Parse a quantity string. Fractional milli-units are rounded up.
 *
 * Amounts beyond what int64 milli-units can hold (about 9.2e15 units, so
 * `1Ei` or `10E`) saturate to `kMaxQuantity` (or its negation) instead of
 * failing; such amounts compare equal to each other.
 */
[[nodiscard]] Result<Quantity> parse_quantity(std::string_view text);

/**
 * @brief Amount of `name` in `list`, or zero when the resource is absent.
 */
[[nodiscard]] Quantity resource_or_zero(const ResourceList& list, std::string_view name);

}  // namespace kube_balance
