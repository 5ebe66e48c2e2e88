/**
 * @file host_health_store.cpp
 * @brief HostHealthStore implementation.
 * @author Dimitris Kafetzis
 */

#include "cache/host_health_store.hpp"

#include "cache/scope_key.hpp"

#include <algorithm>
#include <mutex>

namespace inventory_cache {

HostHealthStore::HostHealthStore(std::shared_ptr<const Clock> clock, HealthPolicy policy)
    : clock_(std::move(clock)), policy_(policy) {}

HostHealthRecord HostHealthStore::get(const HostId& host) const {
    auto id = normalize_host(host);
    std::shared_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return HostHealthRecord{.host_id = id};
    return it->second;
}

HostHealthRecord HostHealthStore::record_failure(const HostId& host,
                                                 std::optional<std::string> error_type,
                                                 std::optional<std::string> error_message) {
    auto id = normalize_host(host);
    auto now = clock_->now();

    std::unique_lock lock(mutex_);
    auto& rec = records_[id];
    rec.host_id = id;
    rec.consecutive_failures++;
    rec.last_error_at = now;
    rec.last_error_type = std::move(error_type);
    rec.last_error_message = std::move(error_message);

    auto cooldown = backoff(rec.consecutive_failures);
    if (cooldown > Duration::zero()) {
        rec.cooldown_until = now + cooldown;
    }
    return rec;
}

HostHealthRecord HostHealthStore::record_success(const HostId& host) {
    auto id = normalize_host(host);
    auto now = clock_->now();

    std::unique_lock lock(mutex_);
    auto& rec = records_[id];
    rec.host_id = id;
    rec.consecutive_failures = 0;
    rec.cooldown_until.reset();
    rec.last_success_at = now;
    rec.last_error_type.reset();
    rec.last_error_message.reset();
    return rec;
}

HostHealthRecord HostHealthStore::set_cooldown(const HostId& host, std::optional<Timestamp> until) {
    auto id = normalize_host(host);
    std::unique_lock lock(mutex_);
    auto& rec = records_[id];
    rec.host_id = id;
    rec.cooldown_until = until;
    return rec;
}

bool HostHealthStore::is_cooling_down(const HostId& host) const {
    return is_cooling_down(host, clock_->now());
}

bool HostHealthStore::is_cooling_down(const HostId& host, Timestamp now) const {
    auto id = normalize_host(host);
    std::shared_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || !it->second.cooldown_until) return false;
    return *it->second.cooldown_until > now;
}

Duration HostHealthStore::backoff(uint32_t consecutive_failures) const noexcept {
    if (consecutive_failures < policy_.failure_threshold) return Duration::zero();

    // Doubling stops well before the shift could overflow; the cap wins anyway.
    auto exponent = std::min<uint32_t>(consecutive_failures - policy_.failure_threshold, 20);
    auto base = std::chrono::duration_cast<Duration>(policy_.base_cooldown);
    auto cap = std::chrono::duration_cast<Duration>(policy_.max_cooldown);
    auto grown = base * (int64_t{1} << exponent);
    return std::min(grown, cap);
}

size_t HostHealthStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

}  // namespace inventory_cache
