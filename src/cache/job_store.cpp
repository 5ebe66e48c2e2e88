/**
 * @file job_store.cpp
 * @brief JobStore implementation.
 * @author Dimitris Kafetzis
 */

#include "cache/job_store.hpp"

#include <cstdio>
#include <random>

namespace inventory_cache {

namespace {

bool transition_allowed(HostJobState from, HostJobState to) noexcept {
    if (is_terminal(from)) return false;
    switch (to) {
        case HostJobState::Pending:
            return false;
        case HostJobState::Running:
        case HostJobState::SkippedCooldown:
            return from == HostJobState::Pending;
        case HostJobState::Ok:
        case HostJobState::Error:
        case HostJobState::Timeout:
            return true;
    }
    return false;
}

constexpr const char* kFreshHitMessage = "cooldown_active";

Error job_not_found(const JobId& job_id) {
    return Error{"job not found: " + job_id, ErrorCode::NotFound};
}

}  // namespace

JobStore::JobStore(std::shared_ptr<const Clock> clock, JobRetention retention)
    : clock_(std::move(clock)), retention_(retention) {}

JobStatus JobStore::create_job(const ScopeKey& scope_key) {
    auto now = clock_->now();

    JobStatus job{
        .job_id = generate_job_id(),
        .scope_key = scope_key,
        .status = JobState::Pending,
        .created_at = now,
        .snapshot_key = scope_key.to_string(),
    };
    for (const auto& host : scope_key.hosts()) {
        job.hosts_status.emplace(host, HostJobStatus{});
    }
    recompute_progress(job);

    std::lock_guard lock(mutex_);
    prune_locked(now);
    if (job.hosts_status.empty()) {
        job.status = JobState::Done;
        job.finished_at = now;
        job.message = "no hosts";
    } else {
        active_by_scope_[scope_key] = job.job_id;
    }
    jobs_[job.job_id] = job;
    return job;
}

JobStatus JobStore::record_fresh_hit(const ScopeKey& scope_key, Timestamp generated_at) {
    auto now = clock_->now();

    JobStatus job{
        .job_id = generate_job_id(),
        .scope_key = scope_key,
        .status = JobState::Done,
        .created_at = now,
        .started_at = generated_at,
        .finished_at = generated_at,
        .last_heartbeat_at = now,
        .snapshot_key = scope_key.to_string(),
        .message = std::string{kFreshHitMessage},
    };
    for (const auto& host : scope_key.hosts()) {
        job.hosts_status.emplace(host, HostJobStatus{
            .state = HostJobState::Ok,
            .finished_at = generated_at,
        });
    }
    recompute_progress(job);

    std::lock_guard lock(mutex_);
    prune_locked(now);
    jobs_[job.job_id] = job;
    return job;
}

Result<JobStatus> JobStore::start_job(const JobId& job_id) {
    auto now = clock_->now();
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return job_not_found(job_id);

    auto& job = it->second;
    if (job.status != JobState::Pending) {
        return Error{"job " + job_id + " cannot start from state "
                     + std::string{to_string(job.status)}, ErrorCode::InvalidTransition};
    }
    job.status = JobState::Running;
    job.started_at = now;
    job.last_heartbeat_at = now;
    return job;
}

Result<JobStatus> JobStore::mark_host_running(const JobId& job_id, const HostId& host) {
    return mark_host(job_id, host, HostJobState::Running);
}

Result<JobStatus> JobStore::mark_host(const JobId& job_id,
                                      const HostId& host,
                                      HostJobState state,
                                      std::optional<std::string> error,
                                      std::optional<Timestamp> cooldown_until) {
    auto id = normalize_host(host);
    auto now = clock_->now();

    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return job_not_found(job_id);

    auto& job = it->second;
    auto host_it = job.hosts_status.find(id);
    if (host_it == job.hosts_status.end()) {
        return Error{"host " + id + " is not part of job " + job_id, ErrorCode::NotFound};
    }

    auto& entry = host_it->second;
    if (!transition_allowed(entry.state, state)) {
        return Error{"host " + id + " in job " + job_id + " cannot move from "
                     + std::string{to_string(entry.state)} + " to "
                     + std::string{to_string(state)}, ErrorCode::InvalidTransition};
    }

    if (job.status == JobState::Pending) {
        job.status = JobState::Running;
        job.started_at = now;
    }

    if (state == HostJobState::Running) {
        entry.attempt++;
        entry.started_at = now;
    } else {
        if (!entry.started_at) entry.started_at = now;
        entry.finished_at = now;
    }
    entry.state = state;
    if (error) entry.last_error = std::move(error);
    if (cooldown_until) entry.cooldown_until = cooldown_until;
    job.last_heartbeat_at = now;

    recompute_progress(job);
    finish_if_complete_locked(job, now);
    return job;
}

std::optional<JobStatus> JobStore::get_job(const JobId& job_id) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

Result<JobStatus> JobStore::heartbeat(const JobId& job_id) {
    auto now = clock_->now();
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return job_not_found(job_id);
    it->second.last_heartbeat_at = now;
    return it->second;
}

Result<JobStatus> JobStore::set_message(const JobId& job_id, std::string message) {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return job_not_found(job_id);
    it->second.message = std::move(message);
    return it->second;
}

std::optional<JobStatus> JobStore::get_active_for_scope(const ScopeKey& scope_key) const {
    std::lock_guard lock(mutex_);
    auto idx = active_by_scope_.find(scope_key);
    if (idx == active_by_scope_.end()) return std::nullopt;
    auto it = jobs_.find(idx->second);
    if (it == jobs_.end() || is_terminal(it->second.status)) return std::nullopt;
    return it->second;
}

std::vector<JobStatus> JobStore::list_jobs_by_status(const std::set<JobState>& statuses) const {
    std::lock_guard lock(mutex_);
    std::vector<JobStatus> result;
    for (const auto& [id, job] : jobs_) {
        if (statuses.count(job.status) > 0) result.push_back(job);
    }
    return result;
}

size_t JobStore::size() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}

void JobStore::recompute_progress(JobStatus& job) {
    JobProgress totals{.total_hosts = job.hosts_status.size()};
    for (const auto& [host, status] : job.hosts_status) {
        switch (status.state) {
            case HostJobState::Ok:              totals.done++; break;
            case HostJobState::Error:
            case HostJobState::Timeout:         totals.error++; break;
            case HostJobState::SkippedCooldown: totals.skipped++; break;
            case HostJobState::Pending:
            case HostJobState::Running:         totals.pending++; break;
        }
    }
    job.progress = totals;
}

void JobStore::finish_if_complete_locked(JobStatus& job, Timestamp now) {
    if (is_terminal(job.status) || job.progress.pending > 0) return;

    // Done needs one collected host, or every host skipped.
    const auto& p = job.progress;
    bool failed = p.done == 0 && p.skipped < p.total_hosts;
    job.status = failed ? JobState::Error : JobState::Done;
    job.finished_at = now;

    auto idx = active_by_scope_.find(job.scope_key);
    if (idx != active_by_scope_.end() && idx->second == job.job_id) {
        active_by_scope_.erase(idx);
    }
}

void JobStore::prune_locked(Timestamp now) {
    if (jobs_.size() < retention_.max_items) return;

    auto cutoff = now - retention_.max_age;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if (is_terminal(it->second.status) || it->second.created_at < cutoff) {
            it = jobs_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = active_by_scope_.begin(); it != active_by_scope_.end();) {
        if (jobs_.count(it->second) == 0) {
            it = active_by_scope_.erase(it);
        } else {
            ++it;
        }
    }
}

JobId JobStore::generate_job_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(rng()),
                  static_cast<unsigned long long>(rng()));
    return JobId{buf};
}

}  // namespace inventory_cache
