#pragma once

#include <mutex>
#include <utility>

#include "activity_log.hpp"
#include "block_timer.hpp"

// Timer and activity log shared by the tick loop and the command dispatcher. Every access
// to either member holds `mutex`.
struct SharedState {
    explicit SharedState(BlockTimer::ClockFn clock = BlockTimer::Clock::now)
        : timer(std::move(clock)) {}

    std::mutex mutex;
    BlockTimer timer;
    ActivityLog log;
};
