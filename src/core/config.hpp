/**
 * @file config.hpp
 * @brief Controller configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/logger.hpp"
#include "core/result.hpp"

namespace kube_balance {

struct RebalancerConfig {
    uint32_t recheck_interval_s = 120;
    uint32_t max_evictions_per_node_per_cycle = 1;
    bool single_eviction_per_cycle = true;  ///< Stop the whole cycle after the first eviction
    bool skip_unprofiled = false;           ///< Never evict pods without a workload profile
    uint32_t requeue_after_eviction_s = 5;
    uint32_t rate_limit_backoff_s = 10;
};

struct ClusterConfig {
    std::filesystem::path state_file = "config/cluster.toml";
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::string events_file = "events";     ///< Prefix of the NDJSON event log
};

/**
 * @brief Top-level controller configuration.
 */
struct Config {
    RebalancerConfig rebalancer;
    ClusterConfig cluster;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Reject values the rebalancer cannot operate with (zero intervals, zero cap).
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Map "debug" / "info" / "warn" / "error" to a LogLevel.
 */
Result<LogLevel> parse_log_level(std::string_view text);

}  // namespace kube_balance
