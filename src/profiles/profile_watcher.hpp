/**
 * @file profile_watcher.hpp
 * @brief Background consumer that keeps a ProfileStore in sync with an event source.
 */

#pragma once

#include "core/logger.hpp"
#include "profiles/profile_events.hpp"
#include "profiles/profile_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace kube_balance {

/**
 * @brief Queues profile events and applies them on a dedicated std::jthread.
 *
 * The source's delivery thread only enqueues; all store writes happen on
 * the watcher thread, in delivery order.
 */
class ProfileWatcher {
public:
    ProfileWatcher(ProfileStore& store, Logger& logger);
    ~ProfileWatcher();

    ProfileWatcher(const ProfileWatcher&) = delete;
    ProfileWatcher& operator=(const ProfileWatcher&) = delete;

    /// Subscribe to `source` and start the consumer thread.
    void start(IProfileEventSource& source);

    /// Unsubscribe, apply whatever is already queued and join the thread.
    void stop();

    /// Enqueue an event (called from the source's delivery thread).
    void push(ProfileEvent event);

    /// Block until the queue is drained or `timeout` elapses.
    bool wait_until_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t applied_count() const noexcept { return applied_.load(); }
    [[nodiscard]] uint64_t rejected_count() const noexcept { return rejected_.load(); }

private:
    void consume_loop(std::stop_token stop);

    ProfileStore& store_;
    Logger& logger_;

    IProfileEventSource* source_{nullptr};
    std::optional<SubscriptionId> subscription_;

    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable_any idle_cv_;
    std::deque<ProfileEvent> queue_;
    bool busy_{false};

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> applied_{0};
    std::atomic<uint64_t> rejected_{0};
    std::jthread worker_;
};

}  // namespace kube_balance
