// STAKEGUARD - Stake Decision Engine
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Once per epoch the engine reads the stake position and chooses between
// reclaiming slashed stake (withdraw, unstake, restake everything), claiming
// rewards (withdraw, stake rewards) or doing nothing. Multi-step actions
// stop at the first failing step and are never rolled back or resumed.

#ifndef STAKEGUARD_STAKING_DECISION_H
#define STAKEGUARD_STAKING_DECISION_H

#include "stakeguard/chain/wallet.h"

#include <cstdint>
#include <functional>
#include <string>

namespace stakeguard {

namespace node {
class StateStore;
}

namespace notify {
class INotifier;
}

namespace util {
class CancellationToken;
}

namespace staking {

/// Retry delay after a failed height or stake-info fetch
constexpr int64_t RETRY_SLEEP_SECONDS = 30;

/// Delay when no-action was already recorded for the current height
constexpr int64_t SAME_BLOCK_SLEEP_SECONDS = 60;

/// Epochs of stake downtime caused by an unstake/restake
constexpr int64_t DOWNTIME_EPOCHS = 1;

// ============================================================================
// Policy
// ============================================================================

struct DecisionConfig {
    double minRewards{1.0};
    double minSlashed{1.0};
    double minStakeAmount{1000.0};
    int64_t bufferBlocks{60};
    bool autoStakeRewards{false};
    bool autoReclaimFullRestakes{false};
};

/// Rewards accrued per epoch since the last claim; 0 if no epoch has elapsed
double CalculateRewardsPerEpoch(double rewardsAmount, int64_t lastClaimBlock,
                                int64_t currentBlock);

/// Rewards forgone while the stake is down for `downtimeEpochs`
double CalculateDowntimeLoss(double rewardsPerEpoch, int64_t downtimeEpochs = DOWNTIME_EPOCHS);

bool ShouldUnstakeAndRestake(const DecisionConfig& config, double reclaimableSlashedStake,
                             double downtimeLoss);

bool ShouldClaimAndStake(const DecisionConfig& config, double rewardsAmount,
                         double rewardsPerEpoch);

// ============================================================================
// Cycle Outcome
// ============================================================================

enum class CycleKind {
    HeightUnavailable,      // Retry shortly
    AlreadyEvaluated,       // No-action already recorded for this height
    StakeInfoUnavailable,   // Retry shortly
    NoAction,
    RestakeSkipped,         // Eligible but total restake below minimum
    Restaked,
    Claimed,
    ActionFailed,
    Interrupted             // Shutdown requested between action steps
};

const char* CycleKindToString(CycleKind kind);

struct CycleOutcome {
    CycleKind kind{CycleKind::NoAction};
    int64_t blockHeight{0};
    int64_t sleepSeconds{0};        // Wait before the next cycle
    std::string description;        // Value written to lastActionTaken
    std::string failedStep;         // Set for ActionFailed and Interrupted
};

// ============================================================================
// Decision Engine
// ============================================================================

class DecisionEngine {
public:
    /**
     * @param token When given, a stop request prevents any further action
     *              step from starting; a step already running completes
     */
    DecisionEngine(chain::WalletAdapter& wallet, node::StateStore& store,
                   notify::INotifier& notifier, const DecisionConfig& config,
                   const util::CancellationToken* token = nullptr);

    /**
     * Evaluate one cycle: fetch, decide, act. Does not sleep; the returned
     * outcome says how long the caller should wait before the next cycle.
     */
    CycleOutcome RunCycle();

    const DecisionConfig& GetConfig() const { return config_; }

private:
    CycleOutcome UnstakeAndRestake(int64_t height, const chain::StakeInfo& info,
                                   double downtimeLoss);
    CycleOutcome ClaimAndStake(int64_t height, const chain::StakeInfo& info);
    CycleOutcome NoAction(int64_t height, const chain::StakeInfo& info);

    /// Run one action step; on failure report it and fill `outcome`
    bool RunStep(const std::string& step, int64_t height, const exec::CommandLine& command,
                 const std::function<exec::CommandResult()>& action, CycleOutcome& outcome);

    /// Log `action: details` and route it to the notifier
    void Report(const std::string& action, const std::string& details, bool isError = false);

    void ReportBalance(int64_t height, const chain::StakeInfo& info);

    std::string BuildStartupSummary(const std::string& action, const chain::StakeInfo& info) const;
    std::string BuildStatusEntry() const;

    int64_t EpochWait(int64_t height) const;

    chain::WalletAdapter& wallet_;
    node::StateStore& store_;
    notify::INotifier& notifier_;
    DecisionConfig config_;
    const util::CancellationToken* token_;
};

} // namespace staking
} // namespace stakeguard

#endif // STAKEGUARD_STAKING_DECISION_H
