/**
 * @file controller.cpp
 * @brief Controller implementation.
 */

#include "rebalancer/controller.hpp"

#include <string>

namespace kube_balance {

Controller::Controller(Rebalancer& rebalancer, Logger& logger)
    : rebalancer_(rebalancer), logger_(logger) {}

Controller::~Controller() {
    stop();
}

void Controller::start() {
    if (running_.exchange(true)) return;

    worker_ = std::jthread([this](std::stop_token stop) { run_loop(stop); });
    logger_.info("rebalance controller started, recheck interval " +
                 std::to_string(rebalancer_.config().recheck_interval_s) + "s");
}

void Controller::stop() {
    if (!running_.exchange(false)) return;

    worker_.request_stop();
    if (worker_.joinable()) worker_.join();
    logger_.info("rebalance controller stopped after " +
                 std::to_string(reconciles_.load()) + " cycles");
}

void Controller::notify() {
    {
        std::lock_guard lock(mutex_);
        wake_requested_ = true;
    }
    wake_cv_.notify_one();
}

bool Controller::wait_for_reconciles(uint64_t count, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return progress_cv_.wait_for(lock, timeout, [&] { return reconciles_.load() >= count; });
}

std::optional<ReconcileResult> Controller::last_result() const {
    std::lock_guard lock(mutex_);
    return last_result_;
}

void Controller::run_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        ReconcileResult result = rebalancer_.reconcile(stop);
        Seconds delay = result.requeue_after;

        {
            std::lock_guard lock(mutex_);
            last_result_ = std::move(result);
            reconciles_.fetch_add(1);
        }
        progress_cv_.notify_all();

        std::unique_lock lock(mutex_);
        wake_cv_.wait_for(lock, stop, delay, [this] { return wake_requested_; });
        wake_requested_ = false;
    }
}

}  // namespace kube_balance
