/**
 * @file durable_store.cpp
 * @brief SnapshotLocator and InMemoryDurableStore.
 * @author Dimitris Kafetzis
 */

#include "persistence/durable_store.hpp"

namespace inventory_cache {

std::string SnapshotLocator::to_string() const {
    return provider + '/' + std::string{inventory_cache::to_string(scope)} + '/'
           + hosts_key + '/' + level;
}

SnapshotLocator SnapshotLocator::for_key(const std::string& provider, const ScopeKey& key) {
    return SnapshotLocator{
        .provider = provider,
        .scope = key.scope(),
        .hosts_key = key.hosts_key(),
        .level = key.level(),
    };
}

Result<void> InMemoryDurableStore::save(const SnapshotLocator& locator,
                                        const SnapshotPayload& payload) {
    std::lock_guard lock(mutex_);
    if (failing_) {
        return Error{"durable store unavailable: " + locator.to_string(), ErrorCode::Io};
    }
    payloads_[locator.to_string()] = payload;
    save_count_++;
    return Result<void>{};
}

Result<std::optional<SnapshotPayload>> InMemoryDurableStore::load(const SnapshotLocator& locator) {
    std::lock_guard lock(mutex_);
    if (failing_) {
        return Error{"durable store unavailable: " + locator.to_string(), ErrorCode::Io};
    }
    auto it = payloads_.find(locator.to_string());
    if (it == payloads_.end()) return std::optional<SnapshotPayload>{};
    return std::optional<SnapshotPayload>{it->second};
}

void InMemoryDurableStore::set_failing(bool failing) {
    std::lock_guard lock(mutex_);
    failing_ = failing;
}

size_t InMemoryDurableStore::save_count() const {
    std::lock_guard lock(mutex_);
    return save_count_;
}

size_t InMemoryDurableStore::size() const {
    std::lock_guard lock(mutex_);
    return payloads_.size();
}

}  // namespace inventory_cache
