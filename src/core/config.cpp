/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace kube_balance {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [rebalancer]
        if (auto rebalancer = tbl["rebalancer"]; rebalancer.is_table()) {
            config.rebalancer.recheck_interval_s = static_cast<uint32_t>(
                rebalancer["recheck_interval_s"].value_or(int64_t{120}));
            config.rebalancer.max_evictions_per_node_per_cycle = static_cast<uint32_t>(
                rebalancer["max_evictions_per_node_per_cycle"].value_or(int64_t{1}));
            config.rebalancer.single_eviction_per_cycle =
                rebalancer["single_eviction_per_cycle"].value_or(true);
            config.rebalancer.skip_unprofiled =
                rebalancer["skip_unprofiled"].value_or(false);
            config.rebalancer.requeue_after_eviction_s = static_cast<uint32_t>(
                rebalancer["requeue_after_eviction_s"].value_or(int64_t{5}));
            config.rebalancer.rate_limit_backoff_s = static_cast<uint32_t>(
                rebalancer["rate_limit_backoff_s"].value_or(int64_t{10}));
        }

        // [cluster]
        if (auto cluster = tbl["cluster"]; cluster.is_table()) {
            config.cluster.state_file =
                cluster["state_file"].value_or(std::string{"config/cluster.toml"});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.events_file =
                telemetry["events_file"].value_or(std::string{"events"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    const auto& r = config.rebalancer;
    if (r.recheck_interval_s == 0) {
        return Error{"rebalancer.recheck_interval_s must be greater than zero"};
    }
    if (r.max_evictions_per_node_per_cycle == 0) {
        return Error{"rebalancer.max_evictions_per_node_per_cycle must be at least 1"};
    }
    if (r.requeue_after_eviction_s == 0 || r.rate_limit_backoff_s == 0) {
        return Error{"rebalancer requeue delays must be greater than zero"};
    }
    if (auto level = parse_log_level(config.telemetry.log_level); !level) {
        return level.error();
    }
    return {};
}

Result<LogLevel> parse_log_level(std::string_view text) {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info")  return LogLevel::Info;
    if (text == "warn")  return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return Error{"unknown log level: '" + std::string{text} + "'"};
}

}  // namespace kube_balance
