/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace inventory_cache {

namespace {

uint32_t read_u32(toml::node_view<toml::node> section, const char* key, uint32_t fallback) {
    return static_cast<uint32_t>(section[key].value_or(int64_t{fallback}));
}

Result<void> validate(const Config& config) {
    if (config.orchestrator.max_workers == 0) {
        return Error{"orchestrator.max_workers must be positive", ErrorCode::Parse};
    }
    if (config.orchestrator.max_per_scope == 0) {
        return Error{"orchestrator.max_per_scope must be positive", ErrorCode::Parse};
    }
    if (config.orchestrator.max_concurrent_jobs == 0) {
        return Error{"orchestrator.max_concurrent_jobs must be positive", ErrorCode::Parse};
    }
    if (config.warmup.interval_minutes == 0) {
        return Error{"warmup.interval_minutes must be positive", ErrorCode::Parse};
    }
    if (config.health.failure_threshold == 0) {
        return Error{"health.failure_threshold must be positive", ErrorCode::Parse};
    }
    if (config.health.max_cooldown_minutes < config.health.base_cooldown_minutes) {
        return Error{"health.max_cooldown_minutes is below health.base_cooldown_minutes",
                     ErrorCode::Parse};
    }
    return Result<void>{};
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string(), ErrorCode::NotFound};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [service]
        if (auto service = tbl["service"]; service.is_table()) {
            config.service.provider = service["provider"].value_or(std::string{"vmware"});
            config.service.scope = service["scope"].value_or(std::string{"vms"});
            config.service.level = service["level"].value_or(std::string{"summary"});
            if (auto* hosts = service["hosts"].as_array()) {
                for (const auto& node : *hosts) {
                    if (auto host = node.value<std::string>()) {
                        config.service.hosts.push_back(*host);
                    }
                }
            }
        }

        // [cache]
        if (auto cache = tbl["cache"]; cache.is_table()) {
            config.cache.vms_max_age_minutes = read_u32(cache, "vms_max_age_minutes", 15);
            config.cache.hosts_max_age_minutes = read_u32(cache, "hosts_max_age_minutes", 60);
            config.cache.max_items = read_u32(cache, "max_items", 128);
            config.cache.retention_minutes = read_u32(cache, "retention_minutes", 24 * 60);
        }

        // [health]
        if (auto health = tbl["health"]; health.is_table()) {
            config.health.failure_threshold = read_u32(health, "failure_threshold", 3);
            config.health.base_cooldown_minutes = read_u32(health, "base_cooldown_minutes", 10);
            config.health.max_cooldown_minutes = read_u32(health, "max_cooldown_minutes", 120);
        }

        // [orchestrator]
        if (auto orch = tbl["orchestrator"]; orch.is_table()) {
            config.orchestrator.max_workers = read_u32(orch, "max_workers", 8);
            config.orchestrator.max_per_scope = read_u32(orch, "max_per_scope", 4);
            config.orchestrator.max_concurrent_jobs = read_u32(orch, "max_concurrent_jobs", 4);
            config.orchestrator.host_timeout_seconds = read_u32(orch, "host_timeout_seconds", 150);
            config.orchestrator.job_max_duration_seconds =
                read_u32(orch, "job_max_duration_seconds", 900);
            config.orchestrator.job_retention = read_u32(orch, "job_retention", 128);
        }

        // [warmup]
        if (auto warmup = tbl["warmup"]; warmup.is_table()) {
            config.warmup.enabled = warmup["enabled"].value_or(false);
            config.warmup.interval_minutes = read_u32(warmup, "interval_minutes", 10);
        }

        // [persistence]
        if (auto persistence = tbl["persistence"]; persistence.is_table()) {
            config.persistence.enabled = persistence["enabled"].value_or(true);
            config.persistence.directory =
                persistence["directory"].value_or(std::string{"./snapshots"});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = read_u32(telemetry, "max_file_size_mb", 50);
            config.telemetry.rotate_count = read_u32(telemetry, "rotate_count", 5);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        if (auto valid = validate(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorCode::Parse};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace inventory_cache
