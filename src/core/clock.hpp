/**
 * @file clock.hpp
 * @brief Injectable wall-clock sources.
 * @author Dimitris Kafetzis
 *
 * Stores never call std::chrono directly; they ask a Clock. SystemClock is
 * used by the daemon, ManualClock by tests that need to step across
 * staleness and cooldown windows deterministically.
 */

#pragma once

#include "core/types.hpp"

#include <atomic>

namespace inventory_cache {

/**
 * @brief Abstract time source.
 */
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
};

/**
 * @brief Reads std::chrono::system_clock, truncated to milliseconds.
 */
class SystemClock : public Clock {
public:
    [[nodiscard]] Timestamp now() const override;
};

/**
 * @brief Clock that only moves when told to. Thread-safe.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = from_epoch_ms(1'700'000'000'000));

    [[nodiscard]] Timestamp now() const override;

    void set(Timestamp ts) noexcept;
    void advance(Duration delta) noexcept;

private:
    std::atomic<int64_t> epoch_ms_;
};

}  // namespace inventory_cache
