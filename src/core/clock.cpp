/**
 * @file clock.cpp
 * @brief Clock implementations.
 * @author Dimitris Kafetzis
 */

#include "core/clock.hpp"

namespace inventory_cache {

Timestamp SystemClock::now() const {
    return std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now());
}

ManualClock::ManualClock(Timestamp start) : epoch_ms_(to_epoch_ms(start)) {}

Timestamp ManualClock::now() const {
    return from_epoch_ms(epoch_ms_.load());
}

void ManualClock::set(Timestamp ts) noexcept {
    epoch_ms_.store(to_epoch_ms(ts));
}

void ManualClock::advance(Duration delta) noexcept {
    epoch_ms_.fetch_add(delta.count());
}

}  // namespace inventory_cache
