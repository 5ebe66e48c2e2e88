/**
 * @file metrics_collector.hpp
 * @brief Structured refresh events and in-process counters.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "cache/job_store.hpp"
#include "cache/scope_key.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

namespace inventory_cache {

/**
 * @brief Point-in-time copy of the refresh counters.
 */
struct RefreshCounters {
    uint64_t cache_hits{0};
    uint64_t jobs_started{0};
    uint64_t jobs_finished{0};
    uint64_t joined_refreshes{0};
    uint64_t hosts_ok{0};
    uint64_t hosts_failed{0};
    uint64_t hosts_timed_out{0};
    uint64_t hosts_skipped{0};
    uint64_t persist_failures{0};
};

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_cache_hit(const ScopeKey& key);
    void record_joined_refresh(const ScopeKey& key, const JobId& job_id);
    void record_job_started(const JobStatus& job);
    void record_host_outcome(const JobId& job_id, const HostId& host,
                             HostJobState state, Duration duration);
    void record_job_finished(const JobStatus& job);
    void record_persist_failure(const ScopeKey& key, std::string_view message);

    [[nodiscard]] RefreshCounters counters() const noexcept;

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> jobs_started_{0};
    std::atomic<uint64_t> jobs_finished_{0};
    std::atomic<uint64_t> joined_refreshes_{0};
    std::atomic<uint64_t> hosts_ok_{0};
    std::atomic<uint64_t> hosts_failed_{0};
    std::atomic<uint64_t> hosts_timed_out_{0};
    std::atomic<uint64_t> hosts_skipped_{0};
    std::atomic<uint64_t> persist_failures_{0};

    void emit(std::string_view json_line);
};

}  // namespace inventory_cache
