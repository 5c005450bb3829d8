/**
 * @file bench_rebalancer.cpp
 * @brief Performance benchmarks for ranking, admission and full reconcile cycles.
 *
 * Measures the per-cycle cost of the decision path against an in-memory
 * cluster so that regressions show up before they reach a real API server.
 *
 * Usage: ./bench_rebalancer [--csv]
 */

#include "cluster/in_memory_cluster.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/time_format.hpp"
#include "core/types.hpp"
#include "profiles/profile_store.hpp"
#include "rebalancer/admission_gate.hpp"
#include "rebalancer/label_selector.hpp"
#include "rebalancer/qos.hpp"
#include "rebalancer/ranking.hpp"
#include "rebalancer/rebalancer.hpp"
#include "support/builders.hpp"
#include "telemetry/event_recorder.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace kube_balance;
using namespace kube_balance::test;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

Container container_for(size_t i) {
    switch (i % 3) {
        case 0:  return best_effort_container();
        case 1:  return burstable_container();
        default: return guaranteed_container();
    }
}

std::vector<Pod> make_pods(size_t n, const std::string& node) {
    std::vector<Pod> pods;
    pods.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        auto app = "app-" + std::to_string(i % 16);
        Pod pod = owned_by(make_pod("pod-" + std::to_string(i), node,
                                    "type-" + std::to_string(i % 8), container_for(i)),
                           "Deployment", app);
        pod.labels.emplace("app", app);
        pods.push_back(std::move(pod));
    }
    return pods;
}

ProfileMap make_profiles() {
    ProfileMap profiles;
    // type-7 stays unprofiled
    for (int i = 0; i < 7; ++i) {
        auto name = "type-" + std::to_string(i);
        profiles.emplace(name, make_profile(name, i * 10));
    }
    return profiles;
}

/// Degraded nodes whose every owner sits in a far-future cooldown, so each
/// reconcile walks all candidates without mutating the cluster.
void populate_cluster(InMemoryCluster& cluster, size_t nodes, size_t pods_per_node) {
    auto far_future = format_rfc3339(std::chrono::system_clock::now() + std::chrono::hours{24 * 365});
    for (size_t i = 0; i < 16; ++i) {
        Owner owner = make_owner(OwnerKind::Deployment, "app-" + std::to_string(i));
        owner.annotations.emplace(std::string{kCooldownAnnotation}, far_future);
        cluster.upsert_owner(std::move(owner));
    }
    for (size_t n = 0; n < nodes; ++n) {
        auto node = "node-" + std::to_string(n);
        cluster.upsert_node(make_node(node, true));
        for (auto& pod : make_pods(pods_per_node, node)) {
            pod.name = node + "-" + pod.name;
            cluster.upsert_pod(std::move(pod));
        }
    }
    for (const auto& [name, profile] : make_profiles()) cluster.apply_profile(profile);
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_ranking() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;
    auto profiles = make_profiles();

    auto single = make_pods(1, "n");
    R.push_back(run_bench("classify_qos", "Ranking", N,
        [&]{ auto c = classify_qos(single.front()); (void)c; }));

    for (size_t n : {10, 100, 500, 1000}) {
        auto pods = make_pods(n, "n");
        R.push_back(run_bench("rank_for_eviction(" + std::to_string(n) + ")", "Ranking", N,
            [&]{ auto r = rank_for_eviction(pods, profiles); (void)r; },
            std::to_string(n) + " pods"));
    }
    return R;
}

std::vector<BenchResult> bench_selectors() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;

    LabelSelector selector{{{"app", "app-3"}},
                       {{"tier", "In", {"web", "api", "batch"}}, {"canary", "DoesNotExist", {}}}};
    R.push_back(run_bench("compile_selector", "Selectors", N,
        [&]{ auto s = compile_selector(selector); (void)s; }, "1 label, 2 exprs"));

    auto compiled = compile_selector(selector);
    if (!compiled) return R;
    Labels labels{{"app", "app-3"}, {"tier", "api"}, {"pod-template-hash", "7d9f"}};
    R.push_back(run_bench("selector_matches", "Selectors", N,
        [&]{ bool m = compiled->matches(labels); (void)m; }, "3 labels"));

    return R;
}

std::vector<BenchResult> bench_admission() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;
    Logger logger(std::make_unique<NullSink>(), LogLevel::Error);

    for (size_t budgets : {0, 10, 100}) {
        InMemoryCluster cluster;
        cluster.upsert_owner(make_owner(OwnerKind::Deployment, "app-0"));
        for (size_t i = 0; i < budgets; ++i) {
            cluster.upsert_budget(make_budget("pdb-" + std::to_string(i),
                                              {{"app", "other-" + std::to_string(i)}}, 1));
        }
        auto pod = make_pods(1, "n").front();
        AdmissionGate gate(cluster, logger);
        auto now = std::chrono::system_clock::now();

        R.push_back(run_bench("gate_evaluate(" + std::to_string(budgets) + " pdbs)", "Admission", N,
            [&]{ auto d = gate.evaluate(pod, now, {}); (void)d; },
            std::to_string(budgets) + " budgets"));
    }
    return R;
}

std::vector<BenchResult> bench_reconcile() {
    std::vector<BenchResult> R;
    constexpr size_t N = 100;
    Logger logger(std::make_unique<NullSink>(), LogLevel::Error);
    EventRecorder events(std::make_unique<NullSink>());

    for (auto [nodes, pods] : {std::pair<size_t, size_t>{1, 50},
                               std::pair<size_t, size_t>{4, 50},
                               std::pair<size_t, size_t>{10, 100}}) {
        InMemoryCluster cluster;
        populate_cluster(cluster, nodes, pods);
        ProfileStore store;
        for (const auto& [name, profile] : make_profiles()) store.upsert(profile);

        RebalancerConfig config;
        config.single_eviction_per_cycle = false;
        Rebalancer rebalancer(config, cluster, store, logger, events);

        auto label = std::to_string(nodes) + " nodes x " + std::to_string(pods) + " pods";
        R.push_back(run_bench("reconcile_all_cooling(" + std::to_string(nodes * pods) + ")",
                              "Reconcile", N,
            [&]{ auto r = rebalancer.reconcile(); (void)r; }, label));
    }

    ProfileStore store;
    auto profiles = make_profiles();
    R.push_back(run_bench("profile_store_get_all(7)", "Reconcile", 1000, [&]{
        for (const auto& [name, profile] : profiles) store.upsert(profile);
        auto all = store.get_all(); (void)all;
    }));

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  kube_balance Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_ranking());
    append(bench_selectors());
    append(bench_admission());
    append(bench_reconcile());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
