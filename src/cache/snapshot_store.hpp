/**
 * @file snapshot_store.hpp
 * @brief Authoritative in-memory snapshot cache with write-behind persistence.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "cache/scope_key.hpp"
#include "cache/snapshot.hpp"
#include "core/clock.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "persistence/durable_store.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace inventory_cache {

/**
 * @brief Maximum age per scope before a snapshot is no longer fresh.
 */
struct StalenessPolicy {
    Duration vms_max_age = std::chrono::minutes{15};
    Duration hosts_max_age = std::chrono::minutes{60};

    [[nodiscard]] Duration max_age_for(ScopeName scope) const noexcept {
        return scope == ScopeName::Hosts ? hosts_max_age : vms_max_age;
    }
};

struct SnapshotRetention {
    size_t max_items = 128;
    std::chrono::minutes max_age{24 * 60};
};

/**
 * @brief One SnapshotPayload per ScopeKey.
 *
 * Callers only ever receive copies. All mutation happens under one mutex
 * that is never held across durable-store I/O.
 */
class SnapshotStore {
public:
    struct Options {
        std::string provider = "vmware";
        StalenessPolicy staleness;
        SnapshotRetention retention;
    };

    SnapshotStore(Options options,
                  std::shared_ptr<const Clock> clock,
                  Logger& logger,
                  std::shared_ptr<IDurableStore> durable = nullptr);

    /// Create (or reset) an empty payload with every key host pending, marked stale until refreshed.
    SnapshotPayload init_snapshot(const ScopeKey& scope_key);

    /**
     * @brief Copy of the cached payload.
     *
     * `source` is "memory" for a cache hit and "db" when the payload was
     * just hydrated from the durable store.
     */
    [[nodiscard]] std::optional<SnapshotPayload> get_snapshot(const ScopeKey& scope_key);

    /// Exists, not marked stale, not expired, and no older than max_age.
    [[nodiscard]] bool is_fresh(const ScopeKey& scope_key, Duration max_age);
    [[nodiscard]] bool is_fresh(const ScopeKey& scope_key);

    /**
     * @brief Merge one host's outcome into the scope's payload.
     *
     * `data` replaces the host's records wholesale (matched on the
     * normalized host id; the supplied casing is stored). std::nullopt
     * keeps whatever records the host already had. The host status is
     * always overwritten, then summary and total_hosts are recomputed.
     */
    SnapshotPayload upsert_host(const ScopeKey& scope_key,
                                const HostId& host,
                                std::optional<RecordList> data,
                                SnapshotHostStatus status);

    Result<void> mark_stale(const ScopeKey& scope_key, std::string reason);
    Result<void> clear_stale(const ScopeKey& scope_key);
    Result<void> set_expires_at(const ScopeKey& scope_key, std::optional<Timestamp> expires_at);

    /**
     * @brief Flush the payload to the durable store.
     *
     * Failures are logged and returned; the in-memory copy stays valid.
     */
    Result<void> persist(const ScopeKey& scope_key);

    [[nodiscard]] Duration max_age_for(ScopeName scope) const noexcept {
        return options_.staleness.max_age_for(scope);
    }
    [[nodiscard]] const std::string& provider() const noexcept { return options_.provider; }
    [[nodiscard]] size_t size() const;

private:
    SnapshotPayload make_empty(const ScopeKey& scope_key, Timestamp now) const;
    void hydrate(const ScopeKey& scope_key);
    void prune_locked(Timestamp now, const ScopeKey& keep);
    static void recompute_locked(SnapshotPayload& payload);

    Options options_;
    std::shared_ptr<const Clock> clock_;
    Logger& logger_;
    std::shared_ptr<IDurableStore> durable_;

    mutable std::mutex mutex_;
    std::unordered_map<ScopeKey, SnapshotPayload> snapshots_;
};

}  // namespace inventory_cache
