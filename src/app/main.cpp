/**
 * @file main.cpp
 * @brief InventoryCache daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the cache into one process:
 *   Config → Logger → Durable store → Health/Job/Snapshot stores → RefreshOrchestrator
 *
 * Without flags the binary inspects the configured scope as persisted by a
 * previous run. With --demo it refreshes a simulated fleet three times. With
 * --warmup (or [warmup] enabled) it keeps the configured scope warm in the
 * background until SIGINT/SIGTERM.
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
#include "persistence/durable_store.hpp"
#include "persistence/toml_file_store.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace inventory_cache;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║          InventoryCache v1.0.0            ║
  ║   Scoped Snapshot Cache with Per-Host     ║
  ║   Refresh Orchestration                   ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    bool demo_mode = false;
    bool warmup_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--warmup") {
            args.warmup_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: inventory_cache [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --log-dir <path>   Log output directory\n"
                      << "  --demo             Refresh a simulated fleet, then exit\n"
                      << "  --warmup           Keep the configured scope warm until interrupted\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

std::string format_time(const std::optional<Timestamp>& ts) {
    return ts ? std::to_string(to_epoch_ms(*ts)) : std::string{"-"};
}

void print_snapshot(const SnapshotPayload& snapshot, bool fresh) {
    std::cout << "scope      " << snapshot.scope_key.to_string() << "\n"
              << "source     " << snapshot.source << "\n"
              << "generated  " << to_epoch_ms(snapshot.generated_at) << "\n"
              << "fresh      " << (fresh ? "yes" : "no") << "\n"
              << "stale      " << (snapshot.stale ? snapshot.stale_reason.value_or("yes") : "no")
              << "\n"
              << "records    " << snapshot.record_count() << "\n"
              << "summary   ";
    for (const auto& [state, count] : snapshot.summary) {
        std::cout << " " << state << "=" << count;
    }
    std::cout << "\n";
    for (const auto& [host, status] : snapshot.hosts_status) {
        std::cout << "  " << host << ": " << to_string(status.state)
                  << " last_success=" << format_time(status.last_success_at);
        if (status.cooldown_until) {
            std::cout << " cooldown_until=" << format_time(status.cooldown_until);
        }
        if (status.last_error_message) {
            std::cout << " error=\"" << *status.last_error_message << "\"";
        }
        std::cout << "\n";
    }
    std::cout << std::endl;
}

/**
 * @brief Collector that fabricates a few VMs per host.
 *
 * Hosts whose name contains "down" always fail, so the demo exercises
 * partial refreshes and cooldown.
 */
CollectOutcome simulated_collect(const HostId& host, const std::string& level,
                                 const CollectContext& context) {
    for (int step = 0; step < 5; ++step) {
        if (context.stop.stop_requested() || g_shutdown_requested) {
            return CollectOutcome::timeout("collection cancelled");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (host.find("down") != std::string::npos) {
        return CollectOutcome::failure("connection_error", "connection refused by " + host);
    }

    RecordList records;
    const int64_t vm_count = level == "detail" ? 4 : 2;
    for (int64_t i = 0; i < vm_count; ++i) {
        records.push_back(Record{
            {"name", std::string{host + "-vm-" + std::to_string(i)}},
            {"power_state", std::string{i % 2 == 0 ? "on" : "off"}},
            {"cpu_count", int64_t{2 + i}},
            {"memory_gb", double(4 * (i + 1))},
            {"template", false},
        });
    }
    return CollectOutcome::ok(std::move(records));
}

int run_demo(const Config& config, RefreshOrchestrator& orchestrator,
             SnapshotStore& snapshots, const JobStore& jobs, Logger& logger) {
    logger.info("=== Demo Mode ===");

    std::vector<std::string> hosts = config.service.hosts;
    if (hosts.empty()) {
        hosts = {"ESX-01.lab", "esx-02.lab", " esx-03.lab ", "esx-down.lab"};
    }
    auto scope = parse_scope_name(config.service.scope).value_or(ScopeName::Vms);
    auto key = ScopeKey::derive(scope, hosts, config.service.level);
    logger.info("Demo scope: " + key.to_string());

    struct Step {
        const char* label;
        bool force;
    };
    const Step steps[] = {
        {"first refresh", false},
        {"cached read", false},
        {"forced refresh", true},
    };

    for (const auto& step : steps) {
        if (g_shutdown_requested) break;
        std::cout << "── " << step.label << " ──" << std::endl;
        auto result = orchestrator.get_or_refresh(key, step.force, simulated_collect);
        if (!result) {
            logger.error("Refresh failed: " + result.error().message);
            return 1;
        }
        print_snapshot(*result, snapshots.is_fresh(key));
    }

    for (const auto& job : jobs.list_jobs_by_status({JobState::Done, JobState::Error})) {
        std::cout << "job " << job.job_id << " " << to_string(job.status)
                  << " done=" << job.progress.done << " error=" << job.progress.error
                  << " skipped=" << job.progress.skipped;
        if (job.message) std::cout << " (" << *job.message << ")";
        std::cout << "\n";
    }
    return 0;
}

int run_warmup(const Config& config, RefreshOrchestrator& orchestrator,
               SnapshotStore& snapshots, JobStore& jobs, Logger& logger) {
    auto scope = parse_scope_name(config.service.scope);
    if (!scope) {
        logger.error("Unknown scope in configuration: " + config.service.scope);
        return 2;
    }
    auto key = ScopeKey::derive(*scope, config.service.hosts, config.service.level);
    logger.info("=== Warmup Mode === " + key.to_string());

    WarmupScheduler warmup(WarmupScheduler::Options::from_config(config.warmup),
                           orchestrator, snapshots, jobs, logger);
    warmup.add_scope(key, simulated_collect);
    warmup.start();

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    logger.info("Shutdown requested");
    warmup.stop();

    if (auto snapshot = snapshots.get_snapshot(key)) {
        print_snapshot(*snapshot, snapshots.is_fresh(key));
    }
    return 0;
}

int run_inspect(const Config& config, SnapshotStore& snapshots, Logger& logger) {
    auto scope = parse_scope_name(config.service.scope);
    if (!scope) {
        logger.error("Unknown scope in configuration: " + config.service.scope);
        return 2;
    }
    auto key = ScopeKey::derive(*scope, config.service.hosts, config.service.level);
    auto snapshot = snapshots.get_snapshot(key);
    if (!snapshot) {
        logger.warn("Nothing cached for " + key.to_string());
        std::cout << "No snapshot cached for " << key.to_string() << std::endl;
        return 1;
    }
    print_snapshot(*snapshot, snapshots.is_fresh(key));
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "inventory_cache",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level);
    Logger logger(std::move(log_sink), level.value_or(LogLevel::Info));
    if (!level) {
        logger.warn("Unknown log level '" + config.telemetry.log_level + "', using info");
    }
    logger.info("InventoryCache starting...");
    logger.info("Provider: " + config.service.provider);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Stores ────────────────────
    auto clock = std::make_shared<SystemClock>();

    std::shared_ptr<IDurableStore> durable;
    if (config.persistence.enabled) {
        durable = std::make_shared<TomlFileStore>(config.persistence.directory);
        logger.info("Persisting snapshots to " + config.persistence.directory.string());
    } else {
        durable = std::make_shared<InMemoryDurableStore>();
        logger.info("Persistence disabled; snapshots live in memory only");
    }

    HostHealthStore health(clock, HealthPolicy{
        .failure_threshold = config.health.failure_threshold,
        .base_cooldown = std::chrono::minutes{config.health.base_cooldown_minutes},
        .max_cooldown = std::chrono::minutes{config.health.max_cooldown_minutes},
    });
    JobStore jobs(clock, JobRetention{
        .max_items = config.orchestrator.job_retention,
        .max_age = std::chrono::minutes{config.cache.retention_minutes},
    });
    SnapshotStore snapshots(
        SnapshotStore::Options{
            .provider = config.service.provider,
            .staleness = StalenessPolicy{
                .vms_max_age = std::chrono::minutes{config.cache.vms_max_age_minutes},
                .hosts_max_age = std::chrono::minutes{config.cache.hosts_max_age_minutes},
            },
            .retention = SnapshotRetention{
                .max_items = config.cache.max_items,
                .max_age = std::chrono::minutes{config.cache.retention_minutes},
            },
        },
        clock, logger, durable);

    const bool warmup_mode = args.warmup_mode || config.warmup.enabled;
    if (!args.demo_mode && !warmup_mode) {
        int rc = run_inspect(config, snapshots, logger);
        logger.flush();
        return rc;
    }

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> telemetry_sink;
    if (!config.telemetry.log_dir.empty()) {
        telemetry_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                        config.telemetry.max_file_size_mb,
                                                        config.telemetry.rotate_count);
    } else {
        telemetry_sink = std::make_unique<NullSink>();
    }
    MetricsCollector metrics(std::move(telemetry_sink));

    int rc = 0;
    {
        RefreshOrchestrator orchestrator(
            RefreshOrchestrator::Options::from_config(config.orchestrator),
            health, jobs, snapshots, logger, metrics, clock);
        rc = args.demo_mode ? run_demo(config, orchestrator, snapshots, jobs, logger)
                            : run_warmup(config, orchestrator, snapshots, jobs, logger);
    }

    auto counters = metrics.counters();
    logger.info("Run finished: jobs=" + std::to_string(counters.jobs_finished)
                + " cache_hits=" + std::to_string(counters.cache_hits)
                + " hosts_ok=" + std::to_string(counters.hosts_ok)
                + " hosts_failed=" + std::to_string(counters.hosts_failed));
    metrics.flush();
    logger.info("InventoryCache stopped.");
    logger.flush();
    return rc;
}
