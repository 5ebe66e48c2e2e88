/**
 * @file types.cpp
 * @brief String parsing for the shared enumerations.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace inventory_cache {

namespace {

std::string lowercase(std::string_view raw) {
    std::string out(raw);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

std::optional<ScopeName> parse_scope_name(std::string_view raw) {
    auto name = lowercase(raw);
    if (name == to_string(ScopeName::Vms)) return ScopeName::Vms;
    if (name == to_string(ScopeName::Hosts)) return ScopeName::Hosts;
    return std::nullopt;
}

std::optional<SnapshotHostState> parse_snapshot_host_state(std::string_view raw) noexcept {
    constexpr std::array kStates = {
        SnapshotHostState::Ok, SnapshotHostState::Error, SnapshotHostState::Timeout,
        SnapshotHostState::Pending, SnapshotHostState::SkippedCooldown, SnapshotHostState::Stale,
    };
    for (auto state : kStates) {
        if (to_string(state) == raw) return state;
    }
    return std::nullopt;
}

}  // namespace inventory_cache
