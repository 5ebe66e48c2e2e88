/**
 * @file snapshot_store.cpp
 * @brief SnapshotStore implementation.
 * @author Dimitris Kafetzis
 */

#include "cache/snapshot_store.hpp"

#include <algorithm>

namespace inventory_cache {

namespace {

constexpr const char* kSourceMemory = "memory";
constexpr const char* kSourceDurable = "db";
constexpr const char* kRefreshPending = "refresh pending";

}  // namespace

SnapshotStore::SnapshotStore(Options options,
                             std::shared_ptr<const Clock> clock,
                             Logger& logger,
                             std::shared_ptr<IDurableStore> durable)
    : options_(std::move(options))
    , clock_(std::move(clock))
    , logger_(logger)
    , durable_(std::move(durable)) {}

SnapshotPayload SnapshotStore::make_empty(const ScopeKey& scope_key, Timestamp now) const {
    SnapshotPayload payload{
        .scope_key = scope_key,
        .generated_at = now,
        .source = kSourceMemory,
    };
    for (const auto& host : scope_key.hosts()) {
        payload.hosts_status.emplace(host, SnapshotHostStatus{});
    }
    recompute_locked(payload);
    return payload;
}

SnapshotPayload SnapshotStore::init_snapshot(const ScopeKey& scope_key) {
    auto now = clock_->now();
    std::lock_guard lock(mutex_);
    prune_locked(now, scope_key);
    auto& slot = snapshots_[scope_key];
    slot = make_empty(scope_key, now);
    // Placeholder until the first refresh finalizes; never served as fresh.
    slot.stale = true;
    slot.stale_reason = kRefreshPending;
    return slot;
}

std::optional<SnapshotPayload> SnapshotStore::get_snapshot(const ScopeKey& scope_key) {
    {
        std::lock_guard lock(mutex_);
        auto it = snapshots_.find(scope_key);
        if (it != snapshots_.end()) {
            auto copy = it->second;
            copy.source = kSourceMemory;
            return copy;
        }
    }

    if (!durable_) return std::nullopt;

    auto locator = SnapshotLocator::for_key(options_.provider, scope_key);
    auto loaded = durable_->load(locator);
    if (!loaded) {
        logger_.warn("Snapshot hydration failed for " + locator.to_string() + ": "
                     + loaded.error().message);
        return std::nullopt;
    }
    if (!loaded->has_value()) return std::nullopt;

    auto now = clock_->now();
    SnapshotPayload copy;
    bool inserted = false;
    {
        std::lock_guard lock(mutex_);
        auto [it, fresh_insert] = snapshots_.try_emplace(scope_key, std::move(**loaded));
        inserted = fresh_insert;
        if (inserted) prune_locked(now, scope_key);
        copy = it->second;
    }
    copy.source = inserted ? kSourceDurable : kSourceMemory;
    if (inserted) {
        logger_.info("Hydrated snapshot " + locator.to_string() + " from durable store");
    }
    return copy;
}

void SnapshotStore::hydrate(const ScopeKey& scope_key) {
    // Loads into memory on a miss; the copy itself is not needed.
    static_cast<void>(get_snapshot(scope_key));
}

bool SnapshotStore::is_fresh(const ScopeKey& scope_key, Duration max_age) {
    hydrate(scope_key);

    auto now = clock_->now();
    std::lock_guard lock(mutex_);
    auto it = snapshots_.find(scope_key);
    if (it == snapshots_.end()) return false;

    const auto& payload = it->second;
    if (payload.stale) return false;
    if (payload.expires_at) return now < *payload.expires_at;
    return now - payload.generated_at <= max_age;
}

bool SnapshotStore::is_fresh(const ScopeKey& scope_key) {
    return is_fresh(scope_key, max_age_for(scope_key.scope()));
}

SnapshotPayload SnapshotStore::upsert_host(const ScopeKey& scope_key,
                                           const HostId& host,
                                           std::optional<RecordList> data,
                                           SnapshotHostStatus status) {
    auto id = normalize_host(host);
    auto now = clock_->now();

    std::lock_guard lock(mutex_);
    prune_locked(now, scope_key);

    auto it = snapshots_.find(scope_key);
    if (it == snapshots_.end()) {
        it = snapshots_.emplace(scope_key, make_empty(scope_key, now)).first;
    }
    auto& payload = it->second;
    payload.generated_at = now;

    if (data) {
        auto entry = std::find_if(payload.data.begin(), payload.data.end(),
            [&id](const HostRecords& e) { return normalize_host(e.host) == id; });
        if (entry != payload.data.end()) {
            entry->host = host;
            entry->records = std::move(*data);
        } else {
            payload.data.push_back(HostRecords{.host = host, .records = std::move(*data)});
        }
    }
    payload.hosts_status[id] = std::move(status);
    recompute_locked(payload);

    auto copy = payload;
    copy.source = kSourceMemory;
    return copy;
}

Result<void> SnapshotStore::mark_stale(const ScopeKey& scope_key, std::string reason) {
    std::lock_guard lock(mutex_);
    auto it = snapshots_.find(scope_key);
    if (it == snapshots_.end()) {
        return Error{"no snapshot to mark stale: " + scope_key.to_string(), ErrorCode::NotFound};
    }
    it->second.stale = true;
    it->second.stale_reason = std::move(reason);
    return Result<void>{};
}

Result<void> SnapshotStore::clear_stale(const ScopeKey& scope_key) {
    std::lock_guard lock(mutex_);
    auto it = snapshots_.find(scope_key);
    if (it == snapshots_.end()) {
        return Error{"no snapshot to clear: " + scope_key.to_string(), ErrorCode::NotFound};
    }
    it->second.stale = false;
    it->second.stale_reason.reset();
    return Result<void>{};
}

Result<void> SnapshotStore::set_expires_at(const ScopeKey& scope_key,
                                           std::optional<Timestamp> expires_at) {
    std::lock_guard lock(mutex_);
    auto it = snapshots_.find(scope_key);
    if (it == snapshots_.end()) {
        return Error{"no snapshot for " + scope_key.to_string(), ErrorCode::NotFound};
    }
    it->second.expires_at = expires_at;
    return Result<void>{};
}

Result<void> SnapshotStore::persist(const ScopeKey& scope_key) {
    SnapshotPayload copy;
    {
        std::lock_guard lock(mutex_);
        auto it = snapshots_.find(scope_key);
        if (it == snapshots_.end()) {
            return Error{"no snapshot to persist: " + scope_key.to_string(), ErrorCode::NotFound};
        }
        copy = it->second;
    }

    if (!durable_) return Result<void>{};

    auto locator = SnapshotLocator::for_key(options_.provider, scope_key);
    auto saved = durable_->save(locator, copy);
    if (!saved) {
        logger_.warn("Failed to persist snapshot " + locator.to_string() + ": "
                     + saved.error().message);
        return saved;
    }
    logger_.debug("Persisted snapshot " + locator.to_string());
    return Result<void>{};
}

size_t SnapshotStore::size() const {
    std::lock_guard lock(mutex_);
    return snapshots_.size();
}

void SnapshotStore::prune_locked(Timestamp now, const ScopeKey& keep) {
    if (snapshots_.size() < options_.retention.max_items) return;

    auto cutoff = now - options_.retention.max_age;
    for (auto it = snapshots_.begin(); it != snapshots_.end();) {
        if (it->second.generated_at < cutoff && it->first != keep) {
            it = snapshots_.erase(it);
        } else {
            ++it;
        }
    }
}

void SnapshotStore::recompute_locked(SnapshotPayload& payload) {
    payload.summary.clear();
    for (const auto& [host, status] : payload.hosts_status) {
        payload.summary[std::string{to_string(status.state)}]++;
    }
    payload.total_hosts = payload.hosts_status.size();
}

}  // namespace inventory_cache
