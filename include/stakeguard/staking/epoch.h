// STAKEGUARD - Epoch Scheduler
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#ifndef STAKEGUARD_STAKING_EPOCH_H
#define STAKEGUARD_STAKING_EPOCH_H

#include "stakeguard/util/time.h"

#include <cstdint>
#include <string>

namespace stakeguard {

namespace node {
class StateStore;
}

namespace staking {

// ============================================================================
// Epoch Constants
// ============================================================================

/// Blocks per epoch
constexpr int64_t EPOCH_BLOCKS = 2160;

/// Assumed block time
constexpr int64_t SECONDS_PER_BLOCK = 10;

/// Sleep used once the buffer point of the current epoch has been passed
constexpr int64_t MIN_EPOCH_SLEEP_SECONDS = 300;

/// Default safety margin before the epoch boundary
constexpr int64_t DEFAULT_BUFFER_BLOCKS = 60;

// ============================================================================
// Epoch Arithmetic
// ============================================================================

/// 2160 - (height mod 2160) - bufferBlocks; may be zero or negative
int64_t BlocksUntilNextEpoch(int64_t height, int64_t bufferBlocks);

/// Blocks times block time, or MIN_EPOCH_SLEEP_SECONDS when that is <= 0
int64_t SleepSecondsUntilNextEpoch(int64_t height, int64_t bufferBlocks);

/// Whole minutes until the buffer point, floored at 0. Reporting only.
int64_t MinutesUntilNextEpoch(int64_t height, int64_t bufferBlocks);

// ============================================================================
// Epoch Scheduler
// ============================================================================

/**
 * Interruptible countdown. Publishes the remaining seconds and the expected
 * completion time to the state store once per tick so display consumers
 * see smooth progress. Only the cancellation token ends a countdown early.
 */
class EpochScheduler {
public:
    /**
     * @param tick Wall-clock length of one countdown second (shortened in tests)
     */
    EpochScheduler(node::StateStore& store, util::CancellationToken& token,
                   util::Milliseconds tick = util::Milliseconds(1000));

    /**
     * Count down `seconds`.
     * @return true if the countdown completed, false if cancelled
     */
    bool SleepWithFeedback(int64_t seconds);

    /// Countdown to the buffer point before the next epoch boundary
    bool SleepUntilNextEpoch(int64_t height, int64_t bufferBlocks);

    util::Milliseconds GetTick() const { return tick_; }

private:
    node::StateStore& store_;
    util::CancellationToken& token_;
    util::Milliseconds tick_;
};

} // namespace staking
} // namespace stakeguard

#endif // STAKEGUARD_STAKING_EPOCH_H
