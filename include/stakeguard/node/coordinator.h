// STAKEGUARD - Loop Coordinator
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Runs the polling, decision and presentation loops on their own threads.
// The loops share nothing but the state store and the cancellation token.

#ifndef STAKEGUARD_NODE_COORDINATOR_H
#define STAKEGUARD_NODE_COORDINATOR_H

#include "stakeguard/util/time.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace stakeguard {

namespace chain {
class WalletAdapter;
}

namespace market {
class IMarketFeed;
}

namespace notify {
class INotifier;
}

namespace staking {
class AnomalyDetector;
class DecisionEngine;
class EpochScheduler;
}

namespace ui {
class IStatusView;
}

namespace node {

class StateStore;

/// Polling cycles between refreshes of stake info, balances and market data
constexpr int SLOW_REFRESH_CYCLES = 33;

/// Loop cadences, in ticks (one tick is one second in production)
struct LoopTiming {
    util::Milliseconds tick{1000};
    int64_t pollTicks{10};
    int64_t presentationTicks{1};
    int64_t errorDelayTicks{5};
};

// ============================================================================
// Poller
// ============================================================================

/**
 * One polling cycle: block height and peer count every time, the slower
 * queries every `slowRefreshCycles` cycles. Observations feed the anomaly
 * detector; its alerts are logged and sent to the notifier.
 */
class Poller {
public:
    Poller(chain::WalletAdapter& wallet, market::IMarketFeed& feed, StateStore& store,
           notify::INotifier& notifier, staking::AnomalyDetector& detector,
           int slowRefreshCycles = SLOW_REFRESH_CYCLES);

    /// Populate height, balances and market data before the loops start
    void InitialRefresh();

    /// Run one polling cycle
    void Tick();

    /// Stake info, balances and market snapshot; unavailable values leave
    /// the previous ones in place
    void RefreshSlowData();

    int CyclesSinceRefresh() const { return cyclesSinceRefresh_; }

private:
    void Alert(const std::string& message);

    chain::WalletAdapter& wallet_;
    market::IMarketFeed& feed_;
    StateStore& store_;
    notify::INotifier& notifier_;
    staking::AnomalyDetector& detector_;
    int slowRefreshCycles_;
    int cyclesSinceRefresh_{0};
};

// ============================================================================
// Loop Coordinator
// ============================================================================

class LoopCoordinator {
public:
    LoopCoordinator(Poller& poller, staking::DecisionEngine& engine,
                    staking::EpochScheduler& scheduler, StateStore& store,
                    std::vector<ui::IStatusView*> views, util::CancellationToken& token,
                    const LoopTiming& timing = LoopTiming());

    /// Stops and joins any running loops
    ~LoopCoordinator();

    LoopCoordinator(const LoopCoordinator&) = delete;
    LoopCoordinator& operator=(const LoopCoordinator&) = delete;

    /// Start the three loops. Returns immediately.
    void Start();

    /// Request cancellation of every loop
    void Stop();

    /// Wait for all loops to exit
    void Join();

    bool IsRunning() const { return running_.load(); }

    /// Completed decision cycles (for monitoring and tests)
    uint64_t DecisionCycles() const { return decisionCycles_.load(); }
    uint64_t PollCycles() const { return pollCycles_.load(); }
    uint64_t Renders() const { return renders_.load(); }

private:
    void PollLoop();
    void DecisionLoop();
    void PresentationLoop();

    bool WaitTicks(int64_t ticks);

    Poller& poller_;
    staking::DecisionEngine& engine_;
    staking::EpochScheduler& scheduler_;
    StateStore& store_;
    std::vector<ui::IStatusView*> views_;
    util::CancellationToken& token_;
    LoopTiming timing_;

    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> decisionCycles_{0};
    std::atomic<uint64_t> pollCycles_{0};
    std::atomic<uint64_t> renders_{0};
};

} // namespace node
} // namespace stakeguard

#endif // STAKEGUARD_NODE_COORDINATOR_H
