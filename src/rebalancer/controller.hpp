/**
 * @file controller.hpp
 * @brief Drives Rebalancer::reconcile serially on a background thread.
 */

#pragma once

#include "core/logger.hpp"
#include "rebalancer/rebalancer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace kube_balance {

/**
 * @brief Requeue loop around a Rebalancer.
 *
 * Cycles never overlap. After each cycle the thread sleeps for the
 * cycle's requeue_after, or until notify() or stop(). stop() cancels an
 * in-flight cycle through its stop_token.
 */
class Controller {
public:
    Controller(Rebalancer& rebalancer, Logger& logger);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    void start();
    void stop();

    /// Run the next cycle now instead of waiting out the requeue delay.
    void notify();

    /// Block until at least `count` cycles have completed or `timeout` elapses.
    bool wait_for_reconciles(uint64_t count, std::chrono::milliseconds timeout);

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t reconcile_count() const noexcept { return reconciles_.load(); }
    [[nodiscard]] std::optional<ReconcileResult> last_result() const;

private:
    void run_loop(std::stop_token stop);

    Rebalancer& rebalancer_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::condition_variable_any wake_cv_;
    std::condition_variable_any progress_cv_;
    bool wake_requested_{false};
    std::optional<ReconcileResult> last_result_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> reconciles_{0};
    std::jthread worker_;
};

}  // namespace kube_balance
