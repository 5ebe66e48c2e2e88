/**
 * @file snapshot.hpp
 * @brief Cached inventory payload for one ScopeKey.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "cache/scope_key.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace inventory_cache {

/**
 * @brief Durable, cache-level view of one host's health inside a snapshot.
 */
struct SnapshotHostStatus {
    SnapshotHostState state{SnapshotHostState::Pending};
    std::optional<Timestamp> last_success_at;
    std::optional<Timestamp> last_error_at;
    std::optional<Timestamp> cooldown_until;
    std::optional<JobId> last_job_id;
    std::optional<std::string> last_error_type;
    std::optional<std::string> last_error_message;

    bool operator==(const SnapshotHostStatus&) const = default;
};

/**
 * @brief Records collected for one host, keeping the host id as supplied.
 */
struct HostRecords {
    HostId host;
    RecordList records;

    bool operator==(const HostRecords&) const = default;
};

/**
 * @brief One cache entry.
 *
 * `data` holds one entry per host that ever returned records, in first-seen
 * order. The VMS scope reads it as host -> VM list (data_by_host()); the
 * HOSTS scope reads it as one flat list of host summaries (data_list()).
 */
struct SnapshotPayload {
    ScopeKey scope_key;
    Timestamp generated_at{};
    std::string source;
    std::optional<Timestamp> expires_at;
    bool stale{false};
    std::optional<std::string> stale_reason;
    size_t total_hosts{0};
    std::map<HostId, SnapshotHostStatus> hosts_status;
    std::map<std::string, int64_t> summary;
    std::vector<HostRecords> data;

    /// Records for a host (case/whitespace-insensitive), or nullptr.
    [[nodiscard]] const RecordList* records_for(std::string_view host) const;

    [[nodiscard]] std::map<HostId, RecordList> data_by_host() const;
    [[nodiscard]] RecordList data_list() const;

    /// Number of records across all hosts.
    [[nodiscard]] size_t record_count() const noexcept;

    bool operator==(const SnapshotPayload&) const = default;
};

}  // namespace inventory_cache
