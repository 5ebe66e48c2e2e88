/**
 * @file test_refresh_pipeline.cpp
 * @brief Integration tests exercising the full refresh pipeline on disk.
 * @author Dimitris Kafetzis
 */

#include "cache/host_health_store.hpp"
#include "cache/job_store.hpp"
#include "cache/scope_key.hpp"
#include "cache/snapshot_store.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/refresh_orchestrator.hpp"
#include "orchestrator/warmup_scheduler.hpp"
#include "persistence/toml_file_store.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

using namespace inventory_cache;

namespace {

CollectOutcome fleet_collect(const HostId& host, const std::string& level,
                             const CollectContext& context) {
    if (context.stop.stop_requested()) return CollectOutcome::timeout();
    if (host.find("down") != std::string::npos) {
        return CollectOutcome::failure("connection_error", "no route to " + host);
    }
    RecordList records;
    const int64_t count = level == "detail" ? 3 : 1;
    for (int64_t i = 0; i < count; ++i) {
        records.push_back(Record{
            {"name", std::string{host + "-vm-" + std::to_string(i)}},
            {"power_state", std::string{"on"}},
            {"memory_gb", 8.0},
        });
    }
    return CollectOutcome::ok(std::move(records));
}

CollectOutcome unreachable_collect(const HostId& host, const std::string&, const CollectContext&) {
    return CollectOutcome::failure("connection_error", "backend offline for " + host);
}

}  // namespace

/**
 * @brief One process worth of cache components over a shared directory.
 *
 * Destroying and re-creating a Process simulates a restart: memory is lost,
 * the TOML files under the directory survive.
 */
struct Process {
    Process(const std::filesystem::path& dir, std::shared_ptr<const Clock> clock,
            const Config& config)
        : logger(std::make_unique<JsonFileSink>(dir / "logs", "inventory_cache"), LogLevel::Debug)
        , metrics(std::make_unique<JsonFileSink>(dir / "logs", "metrics"))
        , health(clock, HealthPolicy{
              .failure_threshold = config.health.failure_threshold,
              .base_cooldown = std::chrono::minutes{config.health.base_cooldown_minutes},
              .max_cooldown = std::chrono::minutes{config.health.max_cooldown_minutes},
          })
        , jobs(clock)
        , snapshots(SnapshotStore::Options{
                        .provider = config.service.provider,
                        .staleness = StalenessPolicy{
                            .vms_max_age = std::chrono::minutes{config.cache.vms_max_age_minutes},
                            .hosts_max_age = std::chrono::minutes{config.cache.hosts_max_age_minutes},
                        },
                    },
                    clock, logger, std::make_shared<TomlFileStore>(dir / "snapshots"))
        , orchestrator(RefreshOrchestrator::Options::from_config(config.orchestrator),
                       health, jobs, snapshots, logger, metrics, clock) {}

    Logger logger;
    MetricsCollector metrics;
    HostHealthStore health;
    JobStore jobs;
    SnapshotStore snapshots;
    RefreshOrchestrator orchestrator;
};

class RefreshPipelineIntegration : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "ic_test_pipeline";
        std::filesystem::remove_all(dir_);
        config_ = default_config();
        config_.orchestrator.host_timeout_seconds = 5;
        config_.orchestrator.job_max_duration_seconds = 30;
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::unique_ptr<Process> boot() {
        return std::make_unique<Process>(dir_, clock_, config_);
    }

    std::filesystem::path dir_;
    Config config_;
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    ScopeKey key_ = ScopeKey::derive(ScopeName::Vms,
                                     {"ESX-01.lab", "esx-02.lab", "esx-down.lab"}, "detail");
};

TEST_F(RefreshPipelineIntegration, PartialRefreshIsPersistedToDisk) {
    auto process = boot();
    auto result = process->orchestrator.get_or_refresh(key_, false, fleet_collect);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->total_hosts, 3u);
    EXPECT_EQ(result->record_count(), 6u);
    EXPECT_EQ(result->hosts_status.at("esx-down.lab").state, SnapshotHostState::Error);
    EXPECT_FALSE(result->stale);

    TomlFileStore reader(dir_ / "snapshots");
    auto on_disk = reader.load(SnapshotLocator::for_key(config_.service.provider, key_));
    ASSERT_TRUE(on_disk.has_value()) << on_disk.error().message;
    ASSERT_TRUE(on_disk->has_value());
    EXPECT_EQ((*on_disk)->record_count(), 6u);
    EXPECT_EQ((*on_disk)->scope_key, key_);

    process->logger.flush();
    process->metrics.flush();
    EXPECT_TRUE(std::filesystem::exists(dir_ / "logs" / "inventory_cache.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "logs" / "metrics.ndjson"));
}

TEST_F(RefreshPipelineIntegration, RestartServesPersistedSnapshot) {
    {
        auto first = boot();
        ASSERT_TRUE(first->orchestrator.get_or_refresh(key_, false, fleet_collect).has_value());
    }

    auto second = boot();
    std::atomic<int> calls{0};
    auto counting = [&calls](const HostId& host, const std::string& level,
                             const CollectContext& context) {
        calls++;
        return fleet_collect(host, level, context);
    };

    auto served = second->orchestrator.get_or_refresh(key_, false, counting);
    ASSERT_TRUE(served.has_value());
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(served->record_count(), 6u);
    EXPECT_EQ(second->metrics.counters().cache_hits, 1u);
}

TEST_F(RefreshPipelineIntegration, ColdStartHydrationReportsDbSource) {
    {
        auto first = boot();
        ASSERT_TRUE(first->orchestrator.get_or_refresh(key_, false, fleet_collect).has_value());
    }

    auto second = boot();
    auto hydrated = second->snapshots.get_snapshot(key_);
    ASSERT_TRUE(hydrated.has_value());
    EXPECT_EQ(hydrated->source, "db");
    EXPECT_EQ(second->snapshots.get_snapshot(key_)->source, "memory");
}

TEST_F(RefreshPipelineIntegration, OutageAfterRestartKeepsLastKnownData) {
    {
        auto first = boot();
        ASSERT_TRUE(first->orchestrator.get_or_refresh(key_, false, fleet_collect).has_value());
    }

    clock_->advance(std::chrono::minutes{config_.cache.vms_max_age_minutes + 1});
    auto second = boot();
    auto result = second->orchestrator.get_or_refresh(key_, false, unreachable_collect);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_TRUE(result->stale);
    EXPECT_EQ(result->stale_reason, "all hosts failed");
    EXPECT_EQ(result->record_count(), 6u);
    ASSERT_NE(result->records_for("esx-01.lab"), nullptr);
    EXPECT_EQ(result->records_for("esx-01.lab")->size(), 3u);

    TomlFileStore reader(dir_ / "snapshots");
    auto on_disk = reader.load(SnapshotLocator::for_key(config_.service.provider, key_));
    ASSERT_TRUE(on_disk.has_value());
    ASSERT_TRUE(on_disk->has_value());
    EXPECT_TRUE((*on_disk)->stale);
}

TEST_F(RefreshPipelineIntegration, BackgroundRefreshAcrossScopes) {
    auto process = boot();
    auto hosts_key = ScopeKey::derive(ScopeName::Hosts, {"esx-01.lab", "esx-02.lab"});

    auto vms_job = process->orchestrator.refresh_async(key_, false, fleet_collect);
    auto hosts_job = process->orchestrator.refresh_async(hosts_key, false, fleet_collect);
    ASSERT_TRUE(vms_job.has_value());
    ASSERT_TRUE(hosts_job.has_value());
    EXPECT_NE(vms_job->job_id, hosts_job->job_id);

    process->orchestrator.wait_idle();
    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (process->orchestrator.in_flight_count() > 0 && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }

    auto vms_status = process->orchestrator.get_job_status(vms_job->job_id);
    auto hosts_status = process->orchestrator.get_job_status(hosts_job->job_id);
    ASSERT_TRUE(vms_status.has_value());
    ASSERT_TRUE(hosts_status.has_value());
    EXPECT_EQ(vms_status->status, JobState::Done);
    EXPECT_EQ(vms_status->message, "partial");
    EXPECT_EQ(hosts_status->status, JobState::Done);
    EXPECT_EQ(process->snapshots.size(), 2u);

    auto summaries = process->snapshots.get_snapshot(hosts_key);
    ASSERT_TRUE(summaries.has_value());
    EXPECT_EQ(summaries->data_list().size(), 2u);
}

TEST_F(RefreshPipelineIntegration, CorruptSnapshotFileIsTreatedAsMiss) {
    {
        auto first = boot();
        ASSERT_TRUE(first->orchestrator.get_or_refresh(key_, false, fleet_collect).has_value());
    }
    TomlFileStore files(dir_ / "snapshots");
    {
        std::ofstream ofs(files.path_for(SnapshotLocator::for_key(config_.service.provider, key_)),
                          std::ios::trunc);
        ofs << "garbage = = =";
    }

    auto second = boot();
    EXPECT_FALSE(second->snapshots.get_snapshot(key_).has_value());

    auto rebuilt = second->orchestrator.get_or_refresh(key_, false, fleet_collect);
    ASSERT_TRUE(rebuilt.has_value());
    EXPECT_EQ(rebuilt->record_count(), 6u);
}

namespace {

bool eventually(const std::function<bool()>& pred,
                std::chrono::milliseconds limit = std::chrono::milliseconds{3000}) {
    const auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return pred();
}

}  // namespace

TEST_F(RefreshPipelineIntegration, WarmupKeepsScopeFreshWithoutCallers) {
    auto process = boot();
    std::atomic<int> calls{0};
    auto counting = [&calls](const HostId& host, const std::string& level,
                             const CollectContext& context) {
        calls++;
        return fleet_collect(host, level, context);
    };

    WarmupScheduler warmup(WarmupScheduler::Options{.interval = std::chrono::milliseconds{20}},
                           process->orchestrator, process->snapshots, process->jobs,
                           process->logger);
    warmup.add_scope(key_, counting);
    warmup.start();

    ASSERT_TRUE(eventually([&] { return process->snapshots.is_fresh(key_); }));
    ASSERT_TRUE(eventually([&] { return warmup.passes() >= 5; }));
    EXPECT_EQ(process->jobs.size(), 1u);
    EXPECT_EQ(calls.load(), 3);

    clock_->advance(std::chrono::minutes{config_.cache.vms_max_age_minutes + 1});
    ASSERT_TRUE(eventually([&] { return calls.load() == 6; }));
    ASSERT_TRUE(eventually([&] { return process->snapshots.is_fresh(key_); }));
    warmup.stop();

    EXPECT_EQ(process->jobs.size(), 2u);
    auto served = process->orchestrator.get_or_refresh(key_, false, counting);
    ASSERT_TRUE(served.has_value());
    EXPECT_EQ(served->record_count(), 6u);
    EXPECT_EQ(calls.load(), 6);
}

TEST_F(RefreshPipelineIntegration, WarmupSkipsScopeWithActiveJob) {
    auto process = boot();
    std::atomic<bool> released{false};
    auto gated = [&released](const HostId& host, const std::string& level,
                             const CollectContext& context) {
        while (!released && !context.stop.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
        return fleet_collect(host, level, context);
    };

    WarmupScheduler warmup(WarmupScheduler::Options{}, process->orchestrator,
                           process->snapshots, process->jobs, process->logger);
    warmup.add_scope(key_, gated);

    EXPECT_TRUE(warmup.should_warm(key_));
    EXPECT_EQ(warmup.run_once(), 1u);
    ASSERT_TRUE(process->jobs.get_active_for_scope(key_).has_value());

    EXPECT_FALSE(warmup.should_warm(key_));
    EXPECT_EQ(warmup.run_once(), 0u);
    EXPECT_EQ(process->jobs.size(), 1u);

    released = true;
    process->orchestrator.wait_idle();
    ASSERT_TRUE(eventually([&] { return process->orchestrator.in_flight_count() == 0; }));
    EXPECT_FALSE(warmup.should_warm(key_));
    EXPECT_EQ(warmup.run_once(), 0u);
}

TEST_F(RefreshPipelineIntegration, WarmupOptionsFromConfig) {
    WarmupConfig config;
    config.interval_minutes = 7;
    EXPECT_EQ(WarmupScheduler::Options::from_config(config).interval,
              Duration{std::chrono::minutes{7}});
}
