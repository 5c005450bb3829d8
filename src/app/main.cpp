/**
 * @file main.cpp
 * @brief kube_balance daemon entry point.
 *
 * Wires the controller pipeline:
 *   Config → Logger → ClusterState → ProfileWatcher → Rebalancer → Controller
 */

#include "cluster/cluster_state.hpp"
#include "cluster/in_memory_cluster.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "profiles/profile_store.hpp"
#include "profiles/profile_watcher.hpp"
#include "rebalancer/controller.hpp"
#include "rebalancer/rebalancer.hpp"
#include "telemetry/event_recorder.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

using namespace kube_balance;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path cluster_state;
    std::optional<uint32_t> recheck_interval_s;
    std::optional<uint32_t> max_evictions_per_node;
    std::string log_dir;
    bool once = false;
};

void print_usage() {
    std::cout << "Usage: kube_balance [OPTIONS]\n"
              << "  --config <path>                           Configuration file (default: config/default.toml)\n"
              << "  --cluster-state <path>                    Cluster state file (overrides [cluster].state_file)\n"
              << "  --recheck-interval <seconds>              Delay between idle cycles\n"
              << "  --max-evictions-per-node-per-cycle <n>    Eviction cap per degraded node\n"
              << "  --log-dir <path>                          Log output directory (\"-\" for stdout)\n"
              << "  --once                                    Run a single reconcile cycle, then exit\n"
              << "  --help, -h                                Show this help message\n";
}

std::optional<uint32_t> parse_uint(std::string_view text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
        } else if (arg == "--cluster-state" && has_value) {
            args.cluster_state = argv[++i];
        } else if (arg == "--recheck-interval" && has_value) {
            args.recheck_interval_s = parse_uint(argv[++i]);
            if (!args.recheck_interval_s) return Error{"--recheck-interval expects a number of seconds"};
        } else if (arg == "--max-evictions-per-node-per-cycle" && has_value) {
            args.max_evictions_per_node = parse_uint(argv[++i]);
            if (!args.max_evictions_per_node) {
                return Error{"--max-evictions-per-node-per-cycle expects a number"};
            }
        } else if (arg == "--log-dir" && has_value) {
            args.log_dir = argv[++i];
        } else if (arg == "--once") {
            args.once = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{"unknown or incomplete option: " + arg};
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_sink(const TelemetryConfig& telemetry, const std::string& prefix) {
    if (telemetry.log_dir.empty() || telemetry.log_dir == "-") {
        return std::make_unique<StdoutSink>();
    }
    return std::make_unique<JsonFileSink>(telemetry.log_dir, prefix,
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << args.error().message << std::endl;
        print_usage();
        return 2;
    }

    // Load configuration
    auto config_result = load_config(args->config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args->cluster_state.empty()) config.cluster.state_file = args->cluster_state;
    if (args->recheck_interval_s) config.rebalancer.recheck_interval_s = *args->recheck_interval_s;
    if (args->max_evictions_per_node) {
        config.rebalancer.max_evictions_per_node_per_cycle = *args->max_evictions_per_node;
    }
    if (!args->log_dir.empty()) config.telemetry.log_dir = args->log_dir;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 2;
    }
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Invalid configuration: " << level.error().message << std::endl;
        return 2;
    }

    // ── Initialize Logger & Events ───────────
    Logger logger(make_sink(config.telemetry, "kube_balance"), *level);
    EventRecorder events(make_sink(config.telemetry, config.telemetry.events_file));
    logger.info("kube_balance starting...");
    logger.info("Recheck interval: " + std::to_string(config.rebalancer.recheck_interval_s) + "s");
    logger.info("Max evictions per node per cycle: " +
                std::to_string(config.rebalancer.max_evictions_per_node_per_cycle));

    // ── Load Cluster State ───────────────────
    InMemoryCluster cluster;
    auto loaded = load_cluster_state(config.cluster.state_file, cluster);
    if (!loaded) {
        logger.error("Failed to load cluster state: " + loaded.error().message);
        logger.flush();
        return 1;
    }
    logger.info("Cluster state " + config.cluster.state_file.string() + ": " +
                std::to_string(loaded->nodes) + " nodes, " +
                std::to_string(loaded->pods) + " pods, " +
                std::to_string(loaded->owners) + " owners, " +
                std::to_string(loaded->budgets) + " budgets, " +
                std::to_string(loaded->profiles) + " profiles");

    // ── Profile Watcher ──────────────────────
    ProfileStore profiles;
    ProfileWatcher watcher(profiles, logger);
    watcher.start(cluster);
    if (!watcher.wait_until_idle(std::chrono::seconds(5))) {
        logger.warn("Initial profile sync did not finish within 5s");
    }
    logger.info("Profile store holds " + std::to_string(profiles.size()) + " workload profiles");

    Rebalancer rebalancer(config.rebalancer, cluster, profiles, logger, events);

    // ── One-shot mode ────────────────────────
    if (args->once) {
        auto result = rebalancer.reconcile();
        std::cout << "status=" << to_string(result.status)
                  << " evicted=" << result.evicted.size()
                  << " requeue_after=" << result.requeue_after.count() << "s" << std::endl;
        for (const auto& key : result.evicted) {
            std::cout << "  evicted " << key.str() << std::endl;
        }
        watcher.stop();
        events.flush();
        logger.flush();
        return 0;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Controller controller(rebalancer, logger);
    controller.start();
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    controller.stop();
    watcher.stop();
    events.flush();

    logger.info("kube_balance stopped.");
    logger.flush();
    return 0;
}
