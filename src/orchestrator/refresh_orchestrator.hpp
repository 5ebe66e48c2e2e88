/**
 * @file refresh_orchestrator.hpp
 * @brief Refresh driver: serves fresh snapshots and runs per-host refresh jobs.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Serving a scope from the snapshot cache while it is fresh
 *   2. Running a refresh job that collects every eligible host in parallel
 *   3. Background refreshes polled through their job id
 *
 * The orchestrator owns no cache state. The health, job and snapshot stores
 * are constructed once by the process and passed in by reference.
 */

#pragma once

#include "cache/host_health_store.hpp"
#include "cache/job_store.hpp"
#include "cache/scope_key.hpp"
#include "cache/snapshot.hpp"
#include "cache/snapshot_store.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "orchestrator/collector.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace inventory_cache {

class RefreshOrchestrator {
public:
    struct Options {
        size_t max_workers = 8;           ///< Collector calls in flight, all jobs
        size_t max_per_scope = 4;         ///< Collector calls in flight, one job
        size_t max_concurrent_jobs = 4;   ///< Background refresh drivers
        Duration host_timeout = std::chrono::seconds{150};
        Duration job_max_duration = std::chrono::seconds{900};

        [[nodiscard]] static Options from_config(const OrchestratorConfig& config);
    };

    RefreshOrchestrator(Options options,
                        HostHealthStore& health,
                        JobStore& jobs,
                        SnapshotStore& snapshots,
                        Logger& logger,
                        MetricsCollector& metrics,
                        std::shared_ptr<const Clock> clock);
    ~RefreshOrchestrator();

    // Non-copyable, non-movable
    RefreshOrchestrator(const RefreshOrchestrator&) = delete;
    RefreshOrchestrator& operator=(const RefreshOrchestrator&) = delete;

    /**
     * @brief Return the scope's snapshot, refreshing it first when needed.
     *
     * A fresh snapshot is returned without creating a job unless
     * `force_refresh` is set. A caller that arrives while a refresh of the
     * same key is running waits for that refresh and shares its result.
     *
     * @return The best available payload (stale-marked if every host
     *         failed), or RefreshFailed when every host failed and the scope
     *         has no cached records at all.
     */
    Result<SnapshotPayload> get_or_refresh(const ScopeKey& scope_key,
                                           bool force_refresh,
                                           const Collector& collector);

    Result<SnapshotPayload> get_or_refresh(ScopeName scope,
                                           const std::vector<std::string>& hosts,
                                           std::string_view level,
                                           bool force_refresh,
                                           const Collector& collector);

    /**
     * @brief Start (or join) a refresh on the background driver pool.
     *
     * When the cache is fresh no refresh runs; the returned job is already
     * `done` with message "cooldown_active" and can be polled like any other.
     *
     * @return The job to poll, or std::nullopt if its record was pruned.
     */
    std::optional<JobStatus> refresh_async(const ScopeKey& scope_key,
                                           bool force_refresh,
                                           const Collector& collector);

    [[nodiscard]] std::optional<JobStatus> get_job_status(const JobId& job_id) const;

    /// Refreshes currently running (one per key at most).
    [[nodiscard]] size_t in_flight_count() const;

    /// Block until every background refresh and collector call has returned.
    void wait_idle();

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    struct HostRun;
    struct JobRun;

    struct Flight {
        JobId job_id;
        std::shared_ptr<std::promise<Result<SnapshotPayload>>> promise;
        std::shared_future<Result<SnapshotPayload>> result;
        bool background{false};   ///< Driven by a job_pool_ worker
    };

    /// Existing flight for the key (second = false) or a new one with a fresh job.
    std::pair<Flight, bool> begin_flight(const ScopeKey& scope_key, bool background = false);
    void finish_flight(const ScopeKey& scope_key, const Flight& flight,
                       Result<SnapshotPayload> result);
    /// Fail background flights whose driver was still queued when job_pool_ shut down.
    void abandon_queued_flights();
    Result<SnapshotPayload> run_flight(const ScopeKey& scope_key, const Flight& flight,
                                       const Collector& collector, std::stop_token stop);

    Result<SnapshotPayload> run_job(const ScopeKey& scope_key,
                                    const JobId& job_id,
                                    const Collector& collector,
                                    std::stop_token stop);
    void dispatch(const std::shared_ptr<JobRun>& run, const HostId& host,
                  std::stop_source host_stop, const Collector& collector);
    void complete_host(const std::shared_ptr<JobRun>& run, const HostId& host,
                       CollectOutcome outcome, Duration elapsed);
    Result<SnapshotPayload> finalize(const ScopeKey& scope_key, const JobId& job_id);

    void apply_outcome(const ScopeKey& scope_key, const JobId& job_id, const HostId& host,
                       CollectOutcome outcome, Duration elapsed);
    void apply_skip(const ScopeKey& scope_key, const JobId& job_id, const HostId& host);
    void apply_unattempted(const ScopeKey& scope_key, const JobId& job_id,
                           const HostId& host, const std::string& reason);

    [[nodiscard]] SnapshotHostStatus host_status(SnapshotHostState state,
                                                 const HostHealthRecord& health,
                                                 const JobId& job_id,
                                                 ScopeName scope) const;

    Options options_;
    HostHealthStore& health_;
    JobStore& jobs_;
    SnapshotStore& snapshots_;
    Logger& logger_;
    MetricsCollector& metrics_;
    std::shared_ptr<const Clock> clock_;

    mutable std::mutex flights_mutex_;
    std::map<ScopeKey, Flight> flights_;

    // Destroyed first: drivers and collectors stop before the flights go away.
    ThreadPool host_pool_;
    ThreadPool job_pool_;
};

}  // namespace inventory_cache
