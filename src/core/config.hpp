/**
 * @file config.hpp
 * @brief Service configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace inventory_cache {

struct ServiceConfig {
    std::string provider = "vmware";
    std::string scope = "vms";
    std::vector<std::string> hosts;
    std::string level = "summary";
};

struct CacheConfig {
    uint32_t vms_max_age_minutes = 15;
    uint32_t hosts_max_age_minutes = 60;
    uint32_t max_items = 128;
    uint32_t retention_minutes = 24 * 60;
};

struct HealthConfig {
    uint32_t failure_threshold = 3;
    uint32_t base_cooldown_minutes = 10;
    uint32_t max_cooldown_minutes = 120;
};

struct OrchestratorConfig {
    uint32_t max_workers = 8;            ///< Global collector pool size
    uint32_t max_per_scope = 4;          ///< Hosts in flight per job
    uint32_t max_concurrent_jobs = 4;    ///< Background refresh drivers
    uint32_t host_timeout_seconds = 150;
    uint32_t job_max_duration_seconds = 900;
    uint32_t job_retention = 128;
};

struct WarmupConfig {
    bool enabled = false;
    uint32_t interval_minutes = 10;      ///< Pause between warmup passes
};

struct PersistenceConfig {
    bool enabled = true;
    std::filesystem::path directory = "./snapshots";
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level service configuration.
 */
struct Config {
    ServiceConfig service;
    CacheConfig cache;
    HealthConfig health;
    OrchestratorConfig orchestrator;
    WarmupConfig warmup;
    PersistenceConfig persistence;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Out-of-range values (zero workers,
 * a cooldown ceiling below its base) are rejected.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace inventory_cache
