/**
 * @file host_health_store.hpp
 * @brief Cross-scope per-host failure counters and cooldown windows.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/clock.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace inventory_cache {

/**
 * @brief Cooldown policy: once a host has failed `failure_threshold` times in
 *        a row it is skipped for base * 2^(failures - threshold), capped.
 */
struct HealthPolicy {
    uint32_t failure_threshold = 3;
    std::chrono::minutes base_cooldown{10};
    std::chrono::minutes max_cooldown{120};
};

struct HostHealthRecord {
    HostId host_id;
    uint32_t consecutive_failures{0};
    std::optional<Timestamp> cooldown_until;
    std::optional<Timestamp> last_success_at;
    std::optional<Timestamp> last_error_at;
    std::optional<std::string> last_error_type;
    std::optional<std::string> last_error_message;
};

/**
 * @brief Health of every host the process has talked to.
 *
 * Host health is independent of scope: a hypervisor that times out for a
 * VMS refresh is cooled down for HOSTS refreshes as well. Host ids are
 * normalized on every call. Thread-safe via shared_mutex; every mutation
 * is visible to the next is_cooling_down() from any thread.
 */
class HostHealthStore {
public:
    explicit HostHealthStore(std::shared_ptr<const Clock> clock, HealthPolicy policy = {});

    /// Copy of the host's record; a default record if the host is unknown.
    [[nodiscard]] HostHealthRecord get(const HostId& host) const;

    HostHealthRecord record_failure(const HostId& host,
                                    std::optional<std::string> error_type = std::nullopt,
                                    std::optional<std::string> error_message = std::nullopt);
    HostHealthRecord record_success(const HostId& host);

    /// Operator override; std::nullopt lifts the cooldown.
    HostHealthRecord set_cooldown(const HostId& host, std::optional<Timestamp> until);

    [[nodiscard]] bool is_cooling_down(const HostId& host) const;
    [[nodiscard]] bool is_cooling_down(const HostId& host, Timestamp now) const;

    /// Cooldown length for a failure count; zero below the threshold.
    [[nodiscard]] Duration backoff(uint32_t consecutive_failures) const noexcept;

    [[nodiscard]] const HealthPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] size_t size() const;

private:
    std::shared_ptr<const Clock> clock_;
    HealthPolicy policy_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<HostId, HostHealthRecord> records_;
};

}  // namespace inventory_cache
