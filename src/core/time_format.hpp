/**
 * @file time_format.hpp
 * @brief RFC 3339 timestamp formatting and parsing for cooldown annotations.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace kube_balance {

/**
 * @brief Format as "YYYY-MM-DDTHH:MM:SSZ" (UTC, whole seconds).
 *
 * Sub-second precision is truncated, matching how deadlines are stored on
 * owner annotations.
 */
[[nodiscard]] std::string format_rfc3339(Timestamp ts);

/**
 * @brief Parse an RFC 3339 timestamp.
 *
 * Accepts an optional fractional-seconds part and either "Z" or a numeric
 * "+hh:mm" / "-hh:mm" offset.
 */
[[nodiscard]] Result<Timestamp> parse_rfc3339(std::string_view text);

}  // namespace kube_balance
