/**
 * @file scope_key.cpp
 * @brief ScopeKey normalization.
 * @author Dimitris Kafetzis
 */

#include "cache/scope_key.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace inventory_cache {

namespace {

std::string_view trim(std::string_view raw) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!raw.empty() && is_space(static_cast<unsigned char>(raw.front()))) raw.remove_prefix(1);
    while (!raw.empty() && is_space(static_cast<unsigned char>(raw.back()))) raw.remove_suffix(1);
    return raw;
}

std::string lowercase(std::string_view raw) {
    std::string out(raw);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

std::string normalize_host(std::string_view raw) {
    return lowercase(trim(raw));
}

std::string normalize_level(std::string_view raw) {
    auto level = lowercase(trim(raw));
    if (level.empty()) return std::string{kDefaultLevel};
    return level;
}

ScopeKey::ScopeKey() : scope_(ScopeName::Vms), level_(kDefaultLevel) {}

ScopeKey::ScopeKey(ScopeName scope, std::vector<HostId> hosts, std::string level)
    : scope_(scope), hosts_(std::move(hosts)), level_(std::move(level)) {}

ScopeKey ScopeKey::derive(ScopeName scope,
                          const std::vector<std::string>& hosts,
                          std::string_view level) {
    std::set<HostId> unique;
    for (const auto& raw : hosts) {
        auto host = normalize_host(raw);
        if (!host.empty()) unique.insert(std::move(host));
    }
    return ScopeKey(scope, std::vector<HostId>(unique.begin(), unique.end()),
                    normalize_level(level));
}

bool ScopeKey::contains(std::string_view host) const {
    return std::binary_search(hosts_.begin(), hosts_.end(), normalize_host(host));
}

std::string ScopeKey::hosts_key() const {
    std::string out;
    for (size_t i = 0; i < hosts_.size(); ++i) {
        if (i > 0) out += ',';
        out += hosts_[i];
    }
    return out;
}

std::string ScopeKey::to_string() const {
    return std::string{inventory_cache::to_string(scope_)} + ':' + hosts_key() + ':' + level_;
}

}  // namespace inventory_cache
