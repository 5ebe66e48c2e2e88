/**
 * @file job_store.hpp
 * @brief Lifecycle tracking for refresh jobs and their per-host sub-states.
 * @author Dimitris Kafetzis
 *
 * Job:  pending -> running -> {done, error}
 * Host: pending -> running -> {ok, error, timeout}
 *       pending -> {skipped_cooldown, timeout}
 *
 * Nothing ever moves backward. Jobs are kept after completion for polling
 * but are never used to serve data.
 */

#pragma once

#include "cache/scope_key.hpp"
#include "core/clock.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace inventory_cache {

struct HostJobStatus {
    HostJobState state{HostJobState::Pending};
    uint32_t attempt{0};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> finished_at;
    std::optional<std::string> last_error;
    std::optional<Timestamp> cooldown_until;
};

/**
 * @brief Aggregate per-host counts. done + error + pending + skipped == total_hosts.
 *
 * `pending` covers both pending and running hosts; `error` covers error and
 * timeout.
 */
struct JobProgress {
    size_t total_hosts{0};
    size_t done{0};
    size_t error{0};
    size_t pending{0};
    size_t skipped{0};
};

struct JobStatus {
    JobId job_id;
    ScopeKey scope_key;
    JobState status{JobState::Pending};
    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> finished_at;
    std::optional<Timestamp> last_heartbeat_at;
    JobProgress progress;
    std::map<HostId, HostJobStatus> hosts_status;
    std::optional<std::string> snapshot_key;
    std::optional<std::string> message;
};

struct JobRetention {
    size_t max_items = 128;
    std::chrono::minutes max_age{24 * 60};
};

/**
 * @brief Thread-safe in-memory job registry with a per-scope active index.
 *
 * Every accessor returns a copy. Contract violations (unknown job, unknown
 * host, illegal transition) come back as Error results and leave the store
 * unchanged.
 */
class JobStore {
public:
    explicit JobStore(std::shared_ptr<const Clock> clock, JobRetention retention = {});

    /**
     * @brief Register a new pending job with one pending entry per key host.
     *
     * The job becomes the active job for its key. A key with no hosts yields
     * a job that is already `done`.
     */
    JobStatus create_job(const ScopeKey& scope_key);

    /**
     * @brief Register an already finished job for a key served from a fresh snapshot.
     *
     * Every host is `ok` as of `generated_at` and the message is
     * "cooldown_active". The job never becomes the key's active job.
     */
    JobStatus record_fresh_hit(const ScopeKey& scope_key, Timestamp generated_at);

    /// pending -> running. Stamps started_at and the heartbeat.
    Result<JobStatus> start_job(const JobId& job_id);

    /// Host pending -> running; increments the attempt counter.
    Result<JobStatus> mark_host_running(const JobId& job_id, const HostId& host);

    /**
     * @brief Move one host to `state` and re-derive progress.
     *
     * When every host is terminal the job finishes: `done` if at least one
     * host succeeded or every host was skipped, `error` otherwise (a mix of
     * skipped and failed hosts collected nothing). A pending job is promoted to
     * running by its first host transition.
     */
    Result<JobStatus> mark_host(const JobId& job_id,
                                const HostId& host,
                                HostJobState state,
                                std::optional<std::string> error = std::nullopt,
                                std::optional<Timestamp> cooldown_until = std::nullopt);

    [[nodiscard]] std::optional<JobStatus> get_job(const JobId& job_id) const;

    /// Stamp last_heartbeat_at; external watchdogs read it to spot stuck jobs.
    Result<JobStatus> heartbeat(const JobId& job_id);

    Result<JobStatus> set_message(const JobId& job_id, std::string message);

    /// The pending or running job for a key, if any.
    [[nodiscard]] std::optional<JobStatus> get_active_for_scope(const ScopeKey& scope_key) const;

    [[nodiscard]] std::vector<JobStatus> list_jobs_by_status(const std::set<JobState>& statuses) const;

    [[nodiscard]] size_t size() const;

private:
    static void recompute_progress(JobStatus& job);
    void finish_if_complete_locked(JobStatus& job, Timestamp now);
    void prune_locked(Timestamp now);
    [[nodiscard]] static JobId generate_job_id();

    std::shared_ptr<const Clock> clock_;
    JobRetention retention_;
    mutable std::mutex mutex_;
    std::unordered_map<JobId, JobStatus> jobs_;
    std::unordered_map<ScopeKey, JobId> active_by_scope_;
};

}  // namespace inventory_cache
