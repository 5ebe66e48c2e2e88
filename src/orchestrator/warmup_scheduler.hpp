/**
 * @file warmup_scheduler.hpp
 * @brief Periodic background refresh that keeps configured scopes warm.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "cache/job_store.hpp"
#include "cache/scope_key.hpp"
#include "cache/snapshot_store.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/collector.hpp"
#include "orchestrator/refresh_orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace inventory_cache {

/**
 * @brief Starts a background refresh for each registered scope on an interval.
 *
 * A pass skips a scope whose snapshot is still fresh or that already has an
 * active job; every other scope gets refresh_async(). The first pass runs as
 * soon as start() is called. Runs on a dedicated std::jthread; stop() and
 * the destructor wake it without waiting out the interval.
 */
class WarmupScheduler {
public:
    struct Options {
        Duration interval = std::chrono::minutes{10};

        [[nodiscard]] static Options from_config(const WarmupConfig& config);
    };

    WarmupScheduler(Options options,
                    RefreshOrchestrator& orchestrator,
                    SnapshotStore& snapshots,
                    JobStore& jobs,
                    Logger& logger);
    ~WarmupScheduler();

    // Non-copyable
    WarmupScheduler(const WarmupScheduler&) = delete;
    WarmupScheduler& operator=(const WarmupScheduler&) = delete;

    void add_scope(ScopeKey scope_key, Collector collector);

    /// True when the scope is neither fresh nor already being refreshed.
    [[nodiscard]] bool should_warm(const ScopeKey& scope_key);

    /// One pass over every scope. Returns the number of refreshes started.
    size_t run_once();

    void start();
    void stop();

    /// Passes completed since start().
    [[nodiscard]] size_t passes() const noexcept { return passes_.load(); }

private:
    struct Target {
        ScopeKey scope_key;
        Collector collector;
    };

    void warmup_loop(std::stop_token stop);

    Options options_;
    RefreshOrchestrator& orchestrator_;
    SnapshotStore& snapshots_;
    JobStore& jobs_;
    Logger& logger_;

    std::mutex targets_mutex_;
    std::vector<Target> targets_;

    std::mutex wait_mutex_;
    std::condition_variable_any wake_;
    std::atomic<size_t> passes_{0};
    std::jthread warmup_thread_;
};

}  // namespace inventory_cache
