/**
 * @file profile_watcher.cpp
 * @brief ProfileWatcher implementation.
 */

#include "profiles/profile_watcher.hpp"

namespace kube_balance {

ProfileWatcher::ProfileWatcher(ProfileStore& store, Logger& logger)
    : store_(store), logger_(logger) {}

ProfileWatcher::~ProfileWatcher() {
    stop();
}

void ProfileWatcher::start(IProfileEventSource& source) {
    if (running_.exchange(true)) return;

    worker_ = std::jthread([this](std::stop_token stop) { consume_loop(stop); });

    source_ = &source;
    subscription_ = source.subscribe([this](const ProfileEvent& event) { push(event); });
    logger_.info("profile watcher is ready to receive workload profile events");
}

void ProfileWatcher::stop() {
    if (!running_.exchange(false)) return;

    if (source_ != nullptr && subscription_) {
        source_->unsubscribe(*subscription_);
    }
    subscription_.reset();
    source_ = nullptr;

    worker_.request_stop();
    if (worker_.joinable()) worker_.join();
    logger_.info("profile watcher stopped");
}

void ProfileWatcher::push(ProfileEvent event) {
    {
        std::lock_guard lock(queue_mutex_);
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

bool ProfileWatcher::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(queue_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !busy_; });
}

void ProfileWatcher::consume_loop(std::stop_token stop) {
    while (true) {
        ProfileEvent event;
        {
            std::unique_lock lock(queue_mutex_);
            // Returns false only once stop is requested and the queue is drained.
            if (!queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); })) break;
            event = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        if (apply_profile_event(event, store_, logger_)) {
            applied_.fetch_add(1);
        } else {
            rejected_.fetch_add(1);
        }

        {
            std::lock_guard lock(queue_mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

}  // namespace kube_balance
