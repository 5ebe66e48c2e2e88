/**
 * @file types.hpp
 * @brief Fundamental types used throughout InventoryCache.
 * @author Dimitris Kafetzis
 *
 * Defines host/job identifiers, timestamps, the per-host and per-job state
 * enumerations, and the generic record container collectors hand back.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace inventory_cache {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using HostId = std::string;
using JobId = std::string;

/// Wall-clock instant with millisecond resolution (persisted as epoch ms).
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;
using Duration = std::chrono::milliseconds;

[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return ts.time_since_epoch().count();
}

[[nodiscard]] inline Timestamp from_epoch_ms(int64_t ms) noexcept {
    return Timestamp{Duration{ms}};
}

// ─────────────────────────────────────────────
// Scope
// ─────────────────────────────────────────────

enum class ScopeName : uint8_t {
    Vms,     ///< Per-host lists of virtual machines
    Hosts    ///< Flat list of hypervisor host summaries
};

[[nodiscard]] constexpr std::string_view to_string(ScopeName scope) noexcept {
    switch (scope) {
        case ScopeName::Vms:   return "vms";
        case ScopeName::Hosts: return "hosts";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ScopeName> parse_scope_name(std::string_view raw);

// ─────────────────────────────────────────────
// Job State
// ─────────────────────────────────────────────

enum class JobState : uint8_t {
    Pending,     ///< Created, dispatch not started
    Running,     ///< Hosts are being dispatched
    Done,        ///< Terminal: at least one host did not fail
    Error        ///< Terminal: every host failed
};

[[nodiscard]] constexpr std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Pending: return "pending";
        case JobState::Running: return "running";
        case JobState::Done:    return "done";
        case JobState::Error:   return "error";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(JobState state) noexcept {
    return state == JobState::Done || state == JobState::Error;
}

// ─────────────────────────────────────────────
// Host State (within a job)
// ─────────────────────────────────────────────

enum class HostJobState : uint8_t {
    Pending,
    Running,
    Ok,
    Error,
    Timeout,
    SkippedCooldown
};

[[nodiscard]] constexpr std::string_view to_string(HostJobState state) noexcept {
    switch (state) {
        case HostJobState::Pending:         return "pending";
        case HostJobState::Running:         return "running";
        case HostJobState::Ok:              return "ok";
        case HostJobState::Error:           return "error";
        case HostJobState::Timeout:         return "timeout";
        case HostJobState::SkippedCooldown: return "skipped_cooldown";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(HostJobState state) noexcept {
    return state != HostJobState::Pending && state != HostJobState::Running;
}

[[nodiscard]] constexpr bool is_failure(HostJobState state) noexcept {
    return state == HostJobState::Error || state == HostJobState::Timeout;
}

// ─────────────────────────────────────────────
// Host State (cache-level)
// ─────────────────────────────────────────────

enum class SnapshotHostState : uint8_t {
    Ok,
    Error,
    Timeout,
    Pending,
    SkippedCooldown,
    Stale        ///< Latest attempt failed and the last success is too old
};

[[nodiscard]] constexpr std::string_view to_string(SnapshotHostState state) noexcept {
    switch (state) {
        case SnapshotHostState::Ok:              return "ok";
        case SnapshotHostState::Error:           return "error";
        case SnapshotHostState::Timeout:         return "timeout";
        case SnapshotHostState::Pending:         return "pending";
        case SnapshotHostState::SkippedCooldown: return "skipped_cooldown";
        case SnapshotHostState::Stale:           return "stale";
    }
    return "unknown";
}

[[nodiscard]] std::optional<SnapshotHostState> parse_snapshot_host_state(std::string_view raw) noexcept;

// ─────────────────────────────────────────────
// Collected Records
// ─────────────────────────────────────────────

/**
 * @brief A single field of a collected record.
 *
 * Collectors validate backend payloads at their boundary and hand back
 * only these scalar shapes; the cache never inspects them.
 */
using FieldValue = std::variant<bool, int64_t, double, std::string>;

/// One inventory record (a VM, a host summary) as field name -> value.
using Record = std::map<std::string, FieldValue>;
using RecordList = std::vector<Record>;

}  // namespace inventory_cache
