/**
 * @file collector.hpp
 * @brief Interface between the refresh driver and backend-specific collectors.
 * @author Dimitris Kafetzis
 *
 * A collector is a blocking call that talks to one backend host and hands
 * back validated records. The driver imposes the time budget from outside:
 * a collector that overruns is recorded as `timeout` and its stop_token is
 * signalled, so well-behaved collectors poll it between API calls.
 */

#pragma once

#include "cache/scope_key.hpp"
#include "core/types.hpp"

#include <functional>
#include <stop_token>
#include <string>

namespace inventory_cache {

/**
 * @brief Per-call context handed to a collector.
 */
struct CollectContext {
    ScopeKey scope_key;
    JobId job_id;
    std::stop_token stop;   ///< Signalled on host timeout or shutdown
    Timestamp deadline{};   ///< Wall-clock instant the host budget runs out
};

enum class CollectStatus : uint8_t {
    Ok,
    Error,
    Timeout
};

/**
 * @brief What one collector call produced.
 */
struct CollectOutcome {
    CollectStatus status{CollectStatus::Ok};
    RecordList records;
    std::string error_type;
    std::string error_message;

    [[nodiscard]] static CollectOutcome ok(RecordList records) {
        return CollectOutcome{.status = CollectStatus::Ok, .records = std::move(records)};
    }

    [[nodiscard]] static CollectOutcome failure(std::string type, std::string message) {
        return CollectOutcome{
            .status = CollectStatus::Error,
            .error_type = std::move(type),
            .error_message = std::move(message),
        };
    }

    [[nodiscard]] static CollectOutcome timeout(std::string message = "collector_timeout") {
        return CollectOutcome{
            .status = CollectStatus::Timeout,
            .error_type = "timeout",
            .error_message = std::move(message),
        };
    }
};

/// collect(host, level, context). Must be safe to call from several threads.
using Collector = std::function<CollectOutcome(const HostId& host,
                                               const std::string& level,
                                               const CollectContext& context)>;

}  // namespace inventory_cache
