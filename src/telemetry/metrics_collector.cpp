/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace inventory_cache {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_cache_hit(const ScopeKey& key) {
    cache_hits_.fetch_add(1);
    std::ostringstream oss;
    oss << R"({"event":"cache_hit")"
        << R"(,"scope":")" << json_escape(key.to_string()) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_joined_refresh(const ScopeKey& key, const JobId& job_id) {
    joined_refreshes_.fetch_add(1);
    std::ostringstream oss;
    oss << R"({"event":"refresh_joined")"
        << R"(,"scope":")" << json_escape(key.to_string()) << "\""
        << R"(,"job":")" << job_id << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_job_started(const JobStatus& job) {
    jobs_started_.fetch_add(1);
    std::ostringstream oss;
    oss << R"({"event":"job_started")"
        << R"(,"job":")" << job.job_id << "\""
        << R"(,"scope":")" << json_escape(job.scope_key.to_string()) << "\""
        << R"(,"hosts":)" << job.progress.total_hosts
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_host_outcome(const JobId& job_id, const HostId& host,
                                           HostJobState state, Duration duration) {
    switch (state) {
        case HostJobState::Ok:              hosts_ok_.fetch_add(1); break;
        case HostJobState::Error:           hosts_failed_.fetch_add(1); break;
        case HostJobState::Timeout:         hosts_timed_out_.fetch_add(1); break;
        case HostJobState::SkippedCooldown: hosts_skipped_.fetch_add(1); break;
        case HostJobState::Pending:
        case HostJobState::Running:         break;
    }

    std::ostringstream oss;
    oss << R"({"event":"host_outcome")"
        << R"(,"job":")" << job_id << "\""
        << R"(,"host":")" << json_escape(host) << "\""
        << R"(,"state":")" << to_string(state) << "\""
        << R"(,"duration_ms":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_job_finished(const JobStatus& job) {
    jobs_finished_.fetch_add(1);
    std::ostringstream oss;
    oss << R"({"event":"job_finished")"
        << R"(,"job":")" << job.job_id << "\""
        << R"(,"status":")" << to_string(job.status) << "\""
        << R"(,"done":)" << job.progress.done
        << R"(,"error":)" << job.progress.error
        << R"(,"skipped":)" << job.progress.skipped
        << R"(,"pending":)" << job.progress.pending
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_persist_failure(const ScopeKey& key, std::string_view message) {
    persist_failures_.fetch_add(1);
    std::ostringstream oss;
    oss << R"({"event":"persist_failed")"
        << R"(,"scope":")" << json_escape(key.to_string()) << "\""
        << R"(,"error":")" << json_escape(message) << "\""
        << "}";
    emit(oss.str());
}

RefreshCounters MetricsCollector::counters() const noexcept {
    return RefreshCounters{
        .cache_hits = cache_hits_.load(),
        .jobs_started = jobs_started_.load(),
        .jobs_finished = jobs_finished_.load(),
        .joined_refreshes = joined_refreshes_.load(),
        .hosts_ok = hosts_ok_.load(),
        .hosts_failed = hosts_failed_.load(),
        .hosts_timed_out = hosts_timed_out_.load(),
        .hosts_skipped = hosts_skipped_.load(),
        .persist_failures = persist_failures_.load(),
    };
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace inventory_cache
