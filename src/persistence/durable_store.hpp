/**
 * @file durable_store.hpp
 * @brief Write-behind persistence interface for snapshots.
 * @author Dimitris Kafetzis
 *
 * The durable store is never authoritative: SnapshotStore serves from
 * memory and only reads back on a cold miss.
 */

#pragma once

#include "cache/snapshot.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace inventory_cache {

/**
 * @brief Address of one persisted snapshot.
 */
struct SnapshotLocator {
    std::string provider;
    ScopeName scope{ScopeName::Vms};
    std::string hosts_key;
    std::string level;

    /// "provider/scope/hosts_key/level".
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] static SnapshotLocator for_key(const std::string& provider, const ScopeKey& key);
};

/**
 * @brief Abstract durable snapshot storage.
 */
class IDurableStore {
public:
    virtual ~IDurableStore() = default;

    virtual Result<void> save(const SnapshotLocator& locator, const SnapshotPayload& payload) = 0;

    /// std::nullopt when nothing was ever saved at this locator.
    virtual Result<std::optional<SnapshotPayload>> load(const SnapshotLocator& locator) = 0;
};

/**
 * @brief Map-backed store for tests and persistence-disabled runs.
 */
class InMemoryDurableStore : public IDurableStore {
public:
    Result<void> save(const SnapshotLocator& locator, const SnapshotPayload& payload) override;
    Result<std::optional<SnapshotPayload>> load(const SnapshotLocator& locator) override;

    /// Make subsequent save()/load() calls fail with an Io error.
    void set_failing(bool failing);

    [[nodiscard]] size_t save_count() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, SnapshotPayload> payloads_;
    size_t save_count_{0};
    bool failing_{false};
};

}  // namespace inventory_cache
