/**
 * @file warmup_scheduler.cpp
 * @brief WarmupScheduler implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/warmup_scheduler.hpp"

#include <algorithm>
#include <exception>

namespace inventory_cache {

WarmupScheduler::Options WarmupScheduler::Options::from_config(const WarmupConfig& config) {
    return Options{
        .interval = std::chrono::minutes{std::max<uint32_t>(config.interval_minutes, 1)},
    };
}

WarmupScheduler::WarmupScheduler(Options options,
                                 RefreshOrchestrator& orchestrator,
                                 SnapshotStore& snapshots,
                                 JobStore& jobs,
                                 Logger& logger)
    : options_(options)
    , orchestrator_(orchestrator)
    , snapshots_(snapshots)
    , jobs_(jobs)
    , logger_(logger) {}

WarmupScheduler::~WarmupScheduler() {
    stop();
}

void WarmupScheduler::add_scope(ScopeKey scope_key, Collector collector) {
    std::lock_guard lock(targets_mutex_);
    targets_.push_back({std::move(scope_key), std::move(collector)});
}

bool WarmupScheduler::should_warm(const ScopeKey& scope_key) {
    if (snapshots_.is_fresh(scope_key)) return false;
    return !jobs_.get_active_for_scope(scope_key).has_value();
}

size_t WarmupScheduler::run_once() {
    std::vector<Target> targets;
    {
        std::lock_guard lock(targets_mutex_);
        targets = targets_;
    }

    size_t started = 0;
    for (const auto& target : targets) {
        try {
            if (!should_warm(target.scope_key)) continue;
            auto job = orchestrator_.refresh_async(target.scope_key, false, target.collector);
            if (job) {
                logger_.info("Warmup: refresh job " + job->job_id + " for "
                             + target.scope_key.to_string());
                ++started;
            }
        } catch (const std::exception& e) {
            logger_.warn("Warmup pass failed for " + target.scope_key.to_string() + ": " + e.what());
        }
    }
    return started;
}

void WarmupScheduler::start() {
    if (warmup_thread_.joinable()) return;
    logger_.info("Warmup scheduler started: interval="
                 + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                                      options_.interval).count()) + "s");
    warmup_thread_ = std::jthread([this](std::stop_token stop) {
        warmup_loop(stop);
    });
}

void WarmupScheduler::stop() {
    if (!warmup_thread_.joinable()) return;
    warmup_thread_.request_stop();
    wake_.notify_all();
    warmup_thread_.join();
    logger_.info("Warmup scheduler stopped after " + std::to_string(passes_.load()) + " passes");
}

void WarmupScheduler::warmup_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        run_once();
        passes_.fetch_add(1);

        std::unique_lock lock(wait_mutex_);
        wake_.wait_for(lock, stop, options_.interval, [] { return false; });
    }
}

}  // namespace inventory_cache
