// STAKEGUARD - Epoch Scheduler Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/staking/epoch.h"
#include "stakeguard/node/state.h"
#include "stakeguard/util/logging.h"

#include <algorithm>

namespace stakeguard {
namespace staking {

int64_t BlocksUntilNextEpoch(int64_t height, int64_t bufferBlocks) {
    // Floor modulo keeps the result periodic for any height
    int64_t position = ((height % EPOCH_BLOCKS) + EPOCH_BLOCKS) % EPOCH_BLOCKS;
    return EPOCH_BLOCKS - position - bufferBlocks;
}

int64_t SleepSecondsUntilNextEpoch(int64_t height, int64_t bufferBlocks) {
    int64_t seconds = BlocksUntilNextEpoch(height, bufferBlocks) * SECONDS_PER_BLOCK;
    if (seconds <= 0) {
        return MIN_EPOCH_SLEEP_SECONDS;
    }
    return seconds;
}

int64_t MinutesUntilNextEpoch(int64_t height, int64_t bufferBlocks) {
    int64_t seconds = std::max<int64_t>(
        BlocksUntilNextEpoch(height, bufferBlocks) * SECONDS_PER_BLOCK, 0);
    return seconds / util::SECONDS_PER_MINUTE;
}

// ============================================================================
// EpochScheduler Implementation
// ============================================================================

EpochScheduler::EpochScheduler(node::StateStore& store, util::CancellationToken& token,
                               util::Milliseconds tick)
    : store_(store), token_(token), tick_(tick) {}

bool EpochScheduler::SleepWithFeedback(int64_t seconds) {
    seconds = std::max<int64_t>(seconds, 0);
    store_.StartCountdown(seconds, "@ " + util::FormatClockAfter(seconds));

    for (int64_t remaining = seconds; remaining > 0; --remaining) {
        if (!token_.WaitFor(tick_)) {
            return false;
        }
        store_.DecrementCountdown(1);
    }

    return !token_.StopRequested();
}

bool EpochScheduler::SleepUntilNextEpoch(int64_t height, int64_t bufferBlocks) {
    int64_t seconds = SleepSecondsUntilNextEpoch(height, bufferBlocks);
    if (BlocksUntilNextEpoch(height, bufferBlocks) <= 0) {
        LOG_INFO(util::LogCategory::STAKE) << "Epoch boundary reached; forcing minimal sleep.";
    } else {
        LOG_DEBUG(util::LogCategory::STAKE) << "Sleeping " << util::FormatHMS(seconds)
                                            << " until closer to next epoch";
    }
    return SleepWithFeedback(seconds);
}

} // namespace staking
} // namespace stakeguard
