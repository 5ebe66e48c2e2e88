/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace inventory_cache;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ic_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.service.provider, "vmware");
    EXPECT_EQ(config.service.scope, "vms");
    EXPECT_TRUE(config.service.hosts.empty());
    EXPECT_EQ(config.service.level, "summary");
    EXPECT_EQ(config.cache.vms_max_age_minutes, 15u);
    EXPECT_EQ(config.cache.hosts_max_age_minutes, 60u);
    EXPECT_EQ(config.health.failure_threshold, 3u);
    EXPECT_EQ(config.orchestrator.max_workers, 8u);
    EXPECT_EQ(config.orchestrator.host_timeout_seconds, 150u);
    EXPECT_FALSE(config.warmup.enabled);
    EXPECT_EQ(config.warmup.interval_minutes, 10u);
    EXPECT_TRUE(config.persistence.enabled);
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [service]
        provider = "proxmox"
        scope = "hosts"
        hosts = ["PVE-01", "pve-02"]
        level = "detail"

        [cache]
        vms_max_age_minutes = 5
        hosts_max_age_minutes = 30
        max_items = 16
        retention_minutes = 60

        [health]
        failure_threshold = 2
        base_cooldown_minutes = 1
        max_cooldown_minutes = 8

        [orchestrator]
        max_workers = 3
        max_per_scope = 2
        max_concurrent_jobs = 1
        host_timeout_seconds = 20
        job_max_duration_seconds = 60
        job_retention = 10

        [warmup]
        enabled = true
        interval_minutes = 3

        [persistence]
        enabled = false
        directory = "/tmp/ic_snapshots"

        [telemetry]
        log_dir = "/tmp/ic_logs"
        log_level = "debug"
        max_file_size_mb = 4
        rotate_count = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.service.provider, "proxmox");
    EXPECT_EQ(config.service.scope, "hosts");
    ASSERT_EQ(config.service.hosts.size(), 2u);
    EXPECT_EQ(config.service.hosts[0], "PVE-01");
    EXPECT_EQ(config.service.level, "detail");
    EXPECT_EQ(config.cache.vms_max_age_minutes, 5u);
    EXPECT_EQ(config.cache.hosts_max_age_minutes, 30u);
    EXPECT_EQ(config.cache.max_items, 16u);
    EXPECT_EQ(config.cache.retention_minutes, 60u);
    EXPECT_EQ(config.health.failure_threshold, 2u);
    EXPECT_EQ(config.health.base_cooldown_minutes, 1u);
    EXPECT_EQ(config.health.max_cooldown_minutes, 8u);
    EXPECT_EQ(config.orchestrator.max_workers, 3u);
    EXPECT_EQ(config.orchestrator.max_per_scope, 2u);
    EXPECT_EQ(config.orchestrator.max_concurrent_jobs, 1u);
    EXPECT_EQ(config.orchestrator.host_timeout_seconds, 20u);
    EXPECT_EQ(config.orchestrator.job_max_duration_seconds, 60u);
    EXPECT_EQ(config.orchestrator.job_retention, 10u);
    EXPECT_TRUE(config.warmup.enabled);
    EXPECT_EQ(config.warmup.interval_minutes, 3u);
    EXPECT_FALSE(config.persistence.enabled);
    EXPECT_EQ(config.persistence.directory, std::filesystem::path{"/tmp/ic_snapshots"});
    EXPECT_EQ(config.telemetry.log_dir, std::filesystem::path{"/tmp/ic_logs"});
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.max_file_size_mb, 4u);
    EXPECT_EQ(config.telemetry.rotate_count, 2u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [service]
        provider = "nutanix"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->service.provider, "nutanix");
    // Defaults for everything else
    EXPECT_EQ(result->service.scope, "vms");
    EXPECT_EQ(result->cache.vms_max_age_minutes, 15u);
    EXPECT_EQ(result->orchestrator.max_per_scope, 4u);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
}

TEST_F(ConfigTest, RejectsZeroWorkers) {
    auto path = write_toml(R"(
        [orchestrator]
        max_workers = 0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("max_workers"), std::string::npos);
}

TEST_F(ConfigTest, RejectsCooldownCeilingBelowBase) {
    auto path = write_toml(R"(
        [health]
        base_cooldown_minutes = 30
        max_cooldown_minutes = 10
    )");
    auto result = load_config(path);
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, RejectsZeroWarmupInterval) {
    auto path = write_toml(R"(
        [warmup]
        enabled = true
        interval_minutes = 0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
    EXPECT_NE(result.error().message.find("interval_minutes"), std::string::npos);
}
