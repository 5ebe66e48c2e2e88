/**
 * @file scope_key.hpp
 * @brief Normalized cache key for one inventory request.
 * @author Dimitris Kafetzis
 *
 * A ScopeKey names what a caller asked for: a scope, a set of target hosts,
 * and a detail level. Construction always normalizes, so two requests for
 * the same hosts in a different order or casing produce equal keys.
 */

#pragma once

#include "core/types.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace inventory_cache {

inline constexpr std::string_view kDefaultLevel = "summary";

/// Trim ASCII whitespace and lowercase. Used for every host comparison.
[[nodiscard]] std::string normalize_host(std::string_view raw);

/// Trim and lowercase; empty input yields kDefaultLevel.
[[nodiscard]] std::string normalize_level(std::string_view raw);

/**
 * @brief Immutable, value-equal cache key.
 */
class ScopeKey {
public:
    /// Empty VMS key at the default level.
    ScopeKey();

    /**
     * @brief Derive a key from raw request parts.
     *
     * Hosts are trimmed, lowercased, de-duplicated and sorted; empty host
     * strings are dropped. Never fails: garbage input degrades to an empty
     * host set.
     */
    [[nodiscard]] static ScopeKey derive(ScopeName scope,
                                         const std::vector<std::string>& hosts,
                                         std::string_view level = kDefaultLevel);

    [[nodiscard]] ScopeName scope() const noexcept { return scope_; }
    [[nodiscard]] const std::vector<HostId>& hosts() const noexcept { return hosts_; }
    [[nodiscard]] const std::string& level() const noexcept { return level_; }

    /// True if the (normalized) host is one of this key's targets.
    [[nodiscard]] bool contains(std::string_view host) const;

    /// Comma-joined host list, the durable-store key component.
    [[nodiscard]] std::string hosts_key() const;

    /// "scope:hosts_key:level", used as a job's snapshot reference.
    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const ScopeKey&) const = default;

private:
    ScopeKey(ScopeName scope, std::vector<HostId> hosts, std::string level);

    ScopeName scope_;
    std::vector<HostId> hosts_;
    std::string level_;
};

}  // namespace inventory_cache

template <>
struct std::hash<inventory_cache::ScopeKey> {
    size_t operator()(const inventory_cache::ScopeKey& key) const noexcept {
        size_t seed = std::hash<int>{}(static_cast<int>(key.scope()));
        auto mix = [&seed](size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        for (const auto& host : key.hosts()) mix(std::hash<std::string>{}(host));
        mix(std::hash<std::string>{}(key.level()));
        return seed;
    }
};
