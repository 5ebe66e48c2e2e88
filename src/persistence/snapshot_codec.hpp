/**
 * @file snapshot_codec.hpp
 * @brief SnapshotPayload <-> TOML document conversion (toml++).
 * @author Dimitris Kafetzis
 *
 * Layout:
 *   scope = "vms"            hosts = ["a", "b"]       level = "summary"
 *   generated_at_ms = ...    source = "memory"        stale = false
 *   expires_at_ms, stale_reason                        (optional)
 *   total_hosts = 2
 *   [summary]                state -> count
 *   [hosts_status.<host>]    state, *_at_ms, last_job_id, last_error_*
 *   [[data]]                 host = "P-HYP-01", records = [{...}, ...]
 *
 * Timestamps are integer epoch milliseconds so a decode reproduces the
 * encoded payload exactly.
 */

#pragma once

#include "cache/snapshot.hpp"
#include "core/result.hpp"

#include <string>
#include <string_view>

#include <toml++/toml.hpp>

namespace inventory_cache {

[[nodiscard]] toml::table encode_snapshot(const SnapshotPayload& payload);
[[nodiscard]] Result<SnapshotPayload> decode_snapshot(const toml::table& table);

/// Serialized TOML text.
[[nodiscard]] std::string snapshot_to_toml(const SnapshotPayload& payload);
[[nodiscard]] Result<SnapshotPayload> snapshot_from_toml(std::string_view text);

}  // namespace inventory_cache
