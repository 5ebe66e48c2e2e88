/**
 * @file refresh_orchestrator.cpp
 * @brief RefreshOrchestrator implementation.
 * @author Dimitris Kafetzis
 *
 * One refresh job is driven by one thread (the caller for get_or_refresh, a
 * job_pool_ worker for refresh_async). The driver skips cooling-down hosts,
 * feeds the rest to host_pool_ at most max_per_scope at a time, and enforces
 * the per-host and per-job time budgets. Every host reaches exactly one
 * terminal outcome: whoever claims it first (the worker with a result or the
 * driver with a timeout) applies it, the other side drops its copy.
 */

#include "orchestrator/refresh_orchestrator.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <stdexcept>

namespace inventory_cache {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr const char* kAllHostsFailed = "all hosts failed";
constexpr const char* kNoHostCollected = "no host collected";
constexpr const char* kPartial = "partial";
constexpr const char* kHostTimeout = "host_timeout_exceeded";
constexpr const char* kJobDeadline = "job_max_duration_reached";
constexpr const char* kShutdown = "orchestrator_shutdown";

Duration elapsed_since(SteadyClock::time_point start) {
    return std::chrono::duration_cast<Duration>(SteadyClock::now() - start);
}

}  // namespace

// ─────────────────────────────────────────────
// Per-job run state
// ─────────────────────────────────────────────

struct RefreshOrchestrator::HostRun {
    std::stop_source stop;
    SteadyClock::time_point dispatched_at{};
    bool claimed{false};
};

struct RefreshOrchestrator::JobRun {
    ScopeKey scope_key;
    JobId job_id;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::map<HostId, HostRun> hosts;   ///< Dispatched hosts only
    size_t in_flight{0};
    uint64_t version{0};               ///< Bumped on every worker completion
};

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

RefreshOrchestrator::Options RefreshOrchestrator::Options::from_config(
    const OrchestratorConfig& config) {
    return Options{
        .max_workers = config.max_workers,
        .max_per_scope = config.max_per_scope,
        .max_concurrent_jobs = config.max_concurrent_jobs,
        .host_timeout = std::chrono::seconds{config.host_timeout_seconds},
        .job_max_duration = std::chrono::seconds{config.job_max_duration_seconds},
    };
}

RefreshOrchestrator::RefreshOrchestrator(Options options,
                                         HostHealthStore& health,
                                         JobStore& jobs,
                                         SnapshotStore& snapshots,
                                         Logger& logger,
                                         MetricsCollector& metrics,
                                         std::shared_ptr<const Clock> clock)
    : options_(options)
    , health_(health)
    , jobs_(jobs)
    , snapshots_(snapshots)
    , logger_(logger)
    , metrics_(metrics)
    , clock_(std::move(clock))
    , host_pool_(std::max<size_t>(options.max_workers, 1), "collectors")
    , job_pool_(std::max<size_t>(options.max_concurrent_jobs, 1), "refresh-jobs") {
    options_.max_per_scope = std::max<size_t>(options_.max_per_scope, 1);
    logger_.info("RefreshOrchestrator ready: workers=" + std::to_string(host_pool_.thread_count())
                 + " per_scope=" + std::to_string(options_.max_per_scope)
                 + " jobs=" + std::to_string(job_pool_.thread_count()));
}

RefreshOrchestrator::~RefreshOrchestrator() {
    job_pool_.shutdown();
    abandon_queued_flights();
    host_pool_.shutdown();
}

// ─────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────

Result<SnapshotPayload> RefreshOrchestrator::get_or_refresh(const ScopeKey& scope_key,
                                                            bool force_refresh,
                                                            const Collector& collector) {
    if (!force_refresh && snapshots_.is_fresh(scope_key)) {
        if (auto cached = snapshots_.get_snapshot(scope_key)) {
            metrics_.record_cache_hit(scope_key);
            return *std::move(cached);
        }
    }

    auto begun = begin_flight(scope_key);
    const Flight& flight = begun.first;
    if (!begun.second) {
        metrics_.record_joined_refresh(scope_key, flight.job_id);
        logger_.debug("Joining in-flight refresh " + flight.job_id + " for "
                      + scope_key.to_string());
        return flight.result.get();
    }
    return run_flight(scope_key, flight, collector, std::stop_token{});
}

Result<SnapshotPayload> RefreshOrchestrator::get_or_refresh(ScopeName scope,
                                                            const std::vector<std::string>& hosts,
                                                            std::string_view level,
                                                            bool force_refresh,
                                                            const Collector& collector) {
    return get_or_refresh(ScopeKey::derive(scope, hosts, level), force_refresh, collector);
}

std::optional<JobStatus> RefreshOrchestrator::refresh_async(const ScopeKey& scope_key,
                                                            bool force_refresh,
                                                            const Collector& collector) {
    if (!force_refresh && snapshots_.is_fresh(scope_key)) {
        if (auto cached = snapshots_.get_snapshot(scope_key)) {
            metrics_.record_cache_hit(scope_key);
            return jobs_.record_fresh_hit(scope_key, cached->generated_at);
        }
    }

    auto begun = begin_flight(scope_key, true);
    const Flight flight = begun.first;
    if (!begun.second) {
        metrics_.record_joined_refresh(scope_key, flight.job_id);
        return jobs_.get_job(flight.job_id);
    }

    try {
        job_pool_.submit_cancellable([this, scope_key, flight, collector](std::stop_token stop) {
            static_cast<void>(run_flight(scope_key, flight, collector, stop));
        });
    } catch (const std::runtime_error& e) {
        logger_.error("Cannot start background refresh for " + scope_key.to_string()
                      + ": " + e.what());
        finish_flight(scope_key, flight,
                      Error{std::string{"background refresh rejected: "} + e.what(),
                            ErrorCode::RefreshFailed});
    }
    return jobs_.get_job(flight.job_id);
}

std::optional<JobStatus> RefreshOrchestrator::get_job_status(const JobId& job_id) const {
    return jobs_.get_job(job_id);
}

size_t RefreshOrchestrator::in_flight_count() const {
    std::lock_guard lock(flights_mutex_);
    return flights_.size();
}

void RefreshOrchestrator::wait_idle() {
    job_pool_.wait_idle();
    host_pool_.wait_idle();
}

// ─────────────────────────────────────────────
// Single-flight
// ─────────────────────────────────────────────

std::pair<RefreshOrchestrator::Flight, bool> RefreshOrchestrator::begin_flight(
    const ScopeKey& scope_key, bool background) {
    std::lock_guard lock(flights_mutex_);
    if (auto it = flights_.find(scope_key); it != flights_.end()) {
        return {it->second, false};
    }

    auto job = jobs_.create_job(scope_key);
    Flight flight;
    flight.job_id = job.job_id;
    flight.promise = std::make_shared<std::promise<Result<SnapshotPayload>>>();
    flight.result = flight.promise->get_future().share();
    flight.background = background;
    flights_.emplace(scope_key, flight);
    return {flight, true};
}

void RefreshOrchestrator::finish_flight(const ScopeKey& scope_key, const Flight& flight,
                                        Result<SnapshotPayload> result) {
    {
        std::lock_guard lock(flights_mutex_);
        auto it = flights_.find(scope_key);
        if (it != flights_.end() && it->second.job_id == flight.job_id) {
            flights_.erase(it);
        }
    }
    flight.promise->set_value(std::move(result));
}

void RefreshOrchestrator::abandon_queued_flights() {
    std::vector<std::pair<ScopeKey, Flight>> queued;
    {
        std::lock_guard lock(flights_mutex_);
        for (const auto& [key, flight] : flights_) {
            if (flight.background) queued.emplace_back(key, flight);
        }
    }

    for (const auto& [key, flight] : queued) {
        if (auto job = jobs_.get_job(flight.job_id)) {
            for (const auto& [host, status] : job->hosts_status) {
                if (is_terminal(status.state)) continue;
                if (auto marked = jobs_.mark_host(flight.job_id, host, HostJobState::Timeout, kShutdown);
                    !marked) {
                    logger_.warn("Job " + flight.job_id + ": " + marked.error().message);
                }
            }
            if (auto updated = jobs_.set_message(flight.job_id, kShutdown); updated) {
                metrics_.record_job_finished(*updated);
            }
        }
        logger_.warn("Background refresh " + flight.job_id + " for " + key.to_string()
                     + " never started: " + kShutdown);
        finish_flight(key, flight,
                      Error{"refresh for " + key.to_string() + " cancelled: " + kShutdown,
                            ErrorCode::RefreshFailed});
    }
}

Result<SnapshotPayload> RefreshOrchestrator::run_flight(const ScopeKey& scope_key,
                                                        const Flight& flight,
                                                        const Collector& collector,
                                                        std::stop_token stop) {
    Result<SnapshotPayload> result = Error{"refresh did not run", ErrorCode::RefreshFailed};
    try {
        result = run_job(scope_key, flight.job_id, collector, std::move(stop));
    } catch (const std::exception& e) {
        logger_.error("Refresh job " + flight.job_id + " aborted: " + e.what());
        result = Error{std::string{"refresh aborted: "} + e.what(), ErrorCode::RefreshFailed};
    }
    finish_flight(scope_key, flight, result);
    return result;
}

// ─────────────────────────────────────────────
// Job driver
// ─────────────────────────────────────────────

Result<SnapshotPayload> RefreshOrchestrator::run_job(const ScopeKey& scope_key,
                                                     const JobId& job_id,
                                                     const Collector& collector,
                                                     std::stop_token stop) {
    auto job = jobs_.get_job(job_id);
    if (!job) {
        return Error{"unknown job " + job_id, ErrorCode::NotFound};
    }

    // Hydrates from the durable store on a cold start so failed hosts keep
    // their last persisted records.
    if (!snapshots_.get_snapshot(scope_key)) {
        snapshots_.init_snapshot(scope_key);
    }
    if (is_terminal(job->status)) {
        return finalize(scope_key, job_id);
    }

    auto started = jobs_.start_job(job_id);
    if (!started) {
        return started.error();
    }
    metrics_.record_job_started(*started);
    logger_.info("Refresh job " + job_id + " started for " + scope_key.to_string());

    std::deque<HostId> queue;
    for (const auto& host : scope_key.hosts()) {
        if (health_.is_cooling_down(host)) {
            apply_skip(scope_key, job_id, host);
        } else {
            queue.push_back(host);
        }
    }

    struct Expired {
        HostId host;
        Duration elapsed;
    };

    auto run = std::make_shared<JobRun>();
    run->scope_key = scope_key;
    run->job_id = job_id;

    const auto job_deadline = SteadyClock::now() + options_.job_max_duration;
    std::string abort_reason;

    std::unique_lock lock(run->mutex);
    while (!queue.empty() || run->in_flight > 0) {
        while (abort_reason.empty() && !queue.empty()
               && run->in_flight < options_.max_per_scope) {
            HostId host = std::move(queue.front());
            queue.pop_front();
            auto& slot = run->hosts[host];
            slot.dispatched_at = SteadyClock::now();
            auto host_stop = slot.stop;
            ++run->in_flight;

            lock.unlock();
            dispatch(run, host, std::move(host_stop), collector);
            lock.lock();
        }

        const auto now = SteadyClock::now();
        if (abort_reason.empty()) {
            if (stop.stop_requested()) {
                abort_reason = kShutdown;
            } else if (now >= job_deadline) {
                abort_reason = kJobDeadline;
            }
        }

        std::vector<Expired> expired;
        auto next_wake = job_deadline;
        for (auto& [host, slot] : run->hosts) {
            if (slot.claimed) continue;
            const auto host_deadline = slot.dispatched_at + options_.host_timeout;
            if (!abort_reason.empty() || now >= host_deadline) {
                slot.claimed = true;
                slot.stop.request_stop();
                expired.push_back({host, std::chrono::duration_cast<Duration>(now - slot.dispatched_at)});
            } else {
                next_wake = std::min(next_wake, host_deadline);
            }
        }

        std::vector<HostId> unattempted;
        if (!abort_reason.empty()) {
            unattempted.assign(queue.begin(), queue.end());
            queue.clear();
        }

        if (!expired.empty() || !unattempted.empty()) {
            lock.unlock();
            for (auto& entry : expired) {
                if (abort_reason == kShutdown) {
                    apply_unattempted(scope_key, job_id, entry.host, abort_reason);
                } else {
                    const char* reason = abort_reason.empty() ? kHostTimeout : kJobDeadline;
                    apply_outcome(scope_key, job_id, entry.host,
                                  CollectOutcome::timeout(reason), entry.elapsed);
                }
            }
            for (const auto& host : unattempted) {
                apply_unattempted(scope_key, job_id, host, abort_reason);
            }
            lock.lock();
            run->in_flight -= expired.size();
            continue;
        }

        if (queue.empty() && run->in_flight == 0) break;

        const auto seen = run->version;
        if (abort_reason.empty()) {
            run->cv.wait_until(lock, stop, next_wake, [&] { return run->version != seen; });
        } else {
            // Only hosts a worker already claimed remain; they finish promptly.
            run->cv.wait(lock, [&] { return run->version != seen; });
        }

        if (auto beat = jobs_.heartbeat(job_id); !beat) {
            logger_.warn("Heartbeat failed for job " + job_id + ": " + beat.error().message);
        }
    }
    lock.unlock();

    return finalize(scope_key, job_id);
}

void RefreshOrchestrator::dispatch(const std::shared_ptr<JobRun>& run,
                                   const HostId& host,
                                   std::stop_source host_stop,
                                   const Collector& collector) {
    if (auto running = jobs_.mark_host_running(run->job_id, host); !running) {
        logger_.warn("Job " + run->job_id + ": " + running.error().message);
    }

    const auto deadline = clock_->now() + options_.host_timeout;
    try {
        host_pool_.submit_cancellable(
            [this, run, host, collector, host_stop, deadline](std::stop_token pool_stop) mutable {
                // Pool shutdown reaches the collector through its host token.
                std::stop_callback link(pool_stop, [&host_stop] { host_stop.request_stop(); });

                CollectContext context{
                    .scope_key = run->scope_key,
                    .job_id = run->job_id,
                    .stop = host_stop.get_token(),
                    .deadline = deadline,
                };

                if (host_stop.stop_requested()) {
                    // Timed out while queued behind other jobs' collectors.
                    complete_host(run, host, CollectOutcome::timeout(kHostTimeout), Duration{0});
                    return;
                }

                const auto began = SteadyClock::now();
                CollectOutcome outcome;
                try {
                    outcome = collector(host, run->scope_key.level(), context);
                } catch (const std::exception& e) {
                    outcome = CollectOutcome::failure("exception", e.what());
                } catch (...) {
                    outcome = CollectOutcome::failure("exception", "unknown exception");
                }
                complete_host(run, host, std::move(outcome), elapsed_since(began));
            });
    } catch (const std::runtime_error& e) {
        complete_host(run, host, CollectOutcome::failure("dispatch_failed", e.what()), Duration{0});
    }
}

void RefreshOrchestrator::complete_host(const std::shared_ptr<JobRun>& run,
                                        const HostId& host,
                                        CollectOutcome outcome,
                                        Duration elapsed) {
    {
        std::lock_guard lock(run->mutex);
        auto& slot = run->hosts[host];
        if (slot.claimed) {
            logger_.debug("Discarding late result for " + host + " in job " + run->job_id);
            return;
        }
        slot.claimed = true;
    }

    apply_outcome(run->scope_key, run->job_id, host, std::move(outcome), elapsed);

    {
        std::lock_guard lock(run->mutex);
        --run->in_flight;
        ++run->version;
    }
    run->cv.notify_all();
}

Result<SnapshotPayload> RefreshOrchestrator::finalize(const ScopeKey& scope_key,
                                                      const JobId& job_id) {
    auto job = jobs_.get_job(job_id);
    if (!job) {
        return Error{"job vanished before completion: " + job_id, ErrorCode::NotFound};
    }

    const bool all_failed = job->status == JobState::Error;
    std::optional<std::string> message;
    if (all_failed) {
        const char* reason = job->progress.skipped > 0 ? kNoHostCollected : kAllHostsFailed;
        if (auto marked = snapshots_.mark_stale(scope_key, reason); !marked) {
            logger_.warn(marked.error().message);
        }
        message = reason;
    } else {
        // An all-skipped job leaves the stale flag as it was.
        if (job->progress.done > 0) {
            if (auto cleared = snapshots_.clear_stale(scope_key); !cleared) {
                logger_.warn(cleared.error().message);
            }
        }
        if (job->progress.error > 0) message = kPartial;
    }
    if (message) {
        if (auto updated = jobs_.set_message(job_id, *message); updated) {
            job = *updated;
        } else {
            logger_.warn(updated.error().message);
        }
    }

    if (auto persisted = snapshots_.persist(scope_key); !persisted) {
        metrics_.record_persist_failure(scope_key, persisted.error().message);
    }

    metrics_.record_job_finished(*job);
    logger_.info("Refresh job " + job_id + " " + std::string{to_string(job->status)}
                 + ": done=" + std::to_string(job->progress.done)
                 + " error=" + std::to_string(job->progress.error)
                 + " skipped=" + std::to_string(job->progress.skipped));

    auto snapshot = snapshots_.get_snapshot(scope_key);
    if (!snapshot) {
        return Error{"snapshot evicted during refresh: " + scope_key.to_string(),
                     ErrorCode::NotFound};
    }
    if (all_failed && snapshot->data.empty()) {
        return Error{"refresh failed for " + scope_key.to_string() + ": " + *message,
                     ErrorCode::RefreshFailed};
    }
    return *std::move(snapshot);
}

// ─────────────────────────────────────────────
// Host outcomes
// ─────────────────────────────────────────────

void RefreshOrchestrator::apply_outcome(const ScopeKey& scope_key,
                                        const JobId& job_id,
                                        const HostId& host,
                                        CollectOutcome outcome,
                                        Duration elapsed) {
    HostJobState state = HostJobState::Ok;
    SnapshotHostState snapshot_state = SnapshotHostState::Ok;
    HostHealthRecord health;
    std::optional<RecordList> data;
    std::optional<std::string> error;

    if (outcome.status == CollectStatus::Ok) {
        health = health_.record_success(host);
        data = std::move(outcome.records);
    } else {
        const bool timed_out = outcome.status == CollectStatus::Timeout;
        state = timed_out ? HostJobState::Timeout : HostJobState::Error;
        snapshot_state = timed_out ? SnapshotHostState::Timeout : SnapshotHostState::Error;
        auto type = outcome.error_type.empty() ? std::string{to_string(state)} : outcome.error_type;
        error = outcome.error_message.empty() ? type : outcome.error_message;
        health = health_.record_failure(host, type, error);
    }

    if (auto marked = jobs_.mark_host(job_id, host, state, error, health.cooldown_until); !marked) {
        logger_.warn("Job " + job_id + ": " + marked.error().message);
    }
    snapshots_.upsert_host(scope_key, host, std::move(data),
                           host_status(snapshot_state, health, job_id, scope_key.scope()));
    metrics_.record_host_outcome(job_id, host, state, elapsed);

    if (error) {
        logger_.warn("Host " + host + " " + std::string{to_string(state)} + " in job " + job_id
                     + ": " + *error + " (failures=" + std::to_string(health.consecutive_failures)
                     + ")");
    } else {
        logger_.debug("Host " + host + " collected in job " + job_id);
    }
}

void RefreshOrchestrator::apply_skip(const ScopeKey& scope_key,
                                     const JobId& job_id,
                                     const HostId& host) {
    auto health = health_.get(host);
    if (auto marked = jobs_.mark_host(job_id, host, HostJobState::SkippedCooldown,
                                      std::nullopt, health.cooldown_until);
        !marked) {
        logger_.warn("Job " + job_id + ": " + marked.error().message);
    }
    snapshots_.upsert_host(scope_key, host, std::nullopt,
                           host_status(SnapshotHostState::SkippedCooldown, health, job_id,
                                       scope_key.scope()));
    metrics_.record_host_outcome(job_id, host, HostJobState::SkippedCooldown, Duration{0});
    logger_.info("Host " + host + " is cooling down, skipped in job " + job_id);
}

void RefreshOrchestrator::apply_unattempted(const ScopeKey& scope_key,
                                            const JobId& job_id,
                                            const HostId& host,
                                            const std::string& reason) {
    auto health = health_.get(host);
    if (auto marked = jobs_.mark_host(job_id, host, HostJobState::Timeout, reason); !marked) {
        logger_.warn("Job " + job_id + ": " + marked.error().message);
    }
    auto status = host_status(SnapshotHostState::Timeout, health, job_id, scope_key.scope());
    status.last_error_type = "timeout";
    status.last_error_message = reason;
    snapshots_.upsert_host(scope_key, host, std::nullopt, std::move(status));
    metrics_.record_host_outcome(job_id, host, HostJobState::Timeout, Duration{0});
    logger_.warn("Host " + host + " not collected in job " + job_id + ": " + reason);
}

SnapshotHostStatus RefreshOrchestrator::host_status(SnapshotHostState state,
                                                    const HostHealthRecord& health,
                                                    const JobId& job_id,
                                                    ScopeName scope) const {
    if (state == SnapshotHostState::Error && health.last_success_at
        && clock_->now() - *health.last_success_at > snapshots_.max_age_for(scope)) {
        state = SnapshotHostState::Stale;
    }
    return SnapshotHostStatus{
        .state = state,
        .last_success_at = health.last_success_at,
        .last_error_at = health.last_error_at,
        .cooldown_until = health.cooldown_until,
        .last_job_id = job_id,
        .last_error_type = health.last_error_type,
        .last_error_message = health.last_error_message,
    };
}

}  // namespace inventory_cache
