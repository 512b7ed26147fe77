// STAKEGUARD - Stake Decision Engine Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/staking/decision.h"
#include "stakeguard/node/state.h"
#include "stakeguard/notify/notifier.h"
#include "stakeguard/staking/epoch.h"
#include "stakeguard/util/format.h"
#include "stakeguard/util/logging.h"
#include "stakeguard/util/time.h"

#include <sstream>

namespace stakeguard {
namespace staking {

using util::FormatAmount;

// ============================================================================
// Policy
// ============================================================================

double CalculateRewardsPerEpoch(double rewardsAmount, int64_t lastClaimBlock,
                                int64_t currentBlock) {
    double epochsElapsed = static_cast<double>(currentBlock - lastClaimBlock) /
                           static_cast<double>(EPOCH_BLOCKS);
    if (epochsElapsed > 0) {
        return rewardsAmount / epochsElapsed;
    }
    return 0.0;
}

double CalculateDowntimeLoss(double rewardsPerEpoch, int64_t downtimeEpochs) {
    return rewardsPerEpoch * static_cast<double>(downtimeEpochs);
}

bool ShouldUnstakeAndRestake(const DecisionConfig& config, double reclaimableSlashedStake,
                             double downtimeLoss) {
    return config.autoReclaimFullRestakes &&
           reclaimableSlashedStake > config.minSlashed &&
           reclaimableSlashedStake >= downtimeLoss;
}

bool ShouldClaimAndStake(const DecisionConfig& config, double rewardsAmount,
                         double rewardsPerEpoch) {
    return config.autoStakeRewards &&
           rewardsAmount > config.minRewards &&
           rewardsAmount >= rewardsPerEpoch;
}

const char* CycleKindToString(CycleKind kind) {
    switch (kind) {
        case CycleKind::HeightUnavailable: return "height-unavailable";
        case CycleKind::AlreadyEvaluated: return "already-evaluated";
        case CycleKind::StakeInfoUnavailable: return "stake-info-unavailable";
        case CycleKind::NoAction: return "no-action";
        case CycleKind::RestakeSkipped: return "restake-skipped";
        case CycleKind::Restaked: return "restaked";
        case CycleKind::Claimed: return "claimed";
        case CycleKind::ActionFailed: return "action-failed";
        case CycleKind::Interrupted: return "interrupted";
    }
    return "unknown";
}

// ============================================================================
// DecisionEngine Implementation
// ============================================================================

DecisionEngine::DecisionEngine(chain::WalletAdapter& wallet, node::StateStore& store,
                               notify::INotifier& notifier, const DecisionConfig& config,
                               const util::CancellationToken* token)
    : wallet_(wallet), store_(store), notifier_(notifier), config_(config), token_(token) {}

int64_t DecisionEngine::EpochWait(int64_t height) const {
    return SleepSecondsUntilNextEpoch(height, config_.bufferBlocks);
}

CycleOutcome DecisionEngine::RunCycle() {
    CycleOutcome outcome;

    auto height = wallet_.FetchBlockHeight();
    if (!height) {
        LOG_ERROR(util::LogCategory::STAKE) << "Failed to fetch block height. Retrying in "
                                            << RETRY_SLEEP_SECONDS << "s...";
        outcome.kind = CycleKind::HeightUnavailable;
        outcome.sleepSeconds = RETRY_SLEEP_SECONDS;
        return outcome;
    }
    outcome.blockHeight = *height;
    store_.SetBlockHeight(*height);

    node::SharedState state = store_.Get();
    if (state.lastNoActionBlock && *state.lastNoActionBlock == *height) {
        LOG_DEBUG(util::LogCategory::STAKE) << "Already did 'No Action' at block " << *height
                                            << "; sleeping " << SAME_BLOCK_SLEEP_SECONDS << "s.";
        outcome.kind = CycleKind::AlreadyEvaluated;
        outcome.sleepSeconds = SAME_BLOCK_SLEEP_SECONDS;
        outcome.description = state.lastActionTaken;
        return outcome;
    }

    auto info = wallet_.FetchStakeInfo();
    if (!info) {
        LOG_WARN(util::LogCategory::STAKE) << "Stake info unavailable or incomplete. Retrying in "
                                           << RETRY_SLEEP_SECONDS << "s...";
        outcome.kind = CycleKind::StakeInfoUnavailable;
        outcome.sleepSeconds = RETRY_SLEEP_SECONDS;
        return outcome;
    }
    store_.SetStakeInfo(*info);

    double rewardsPerEpoch = CalculateRewardsPerEpoch(info->rewardsAmount,
                                                      state.lastClaimBlock, *height);
    double downtimeLoss = CalculateDowntimeLoss(rewardsPerEpoch);

    LOG_DEBUG(util::LogCategory::STAKE) << "Block #" << *height
                                        << " rewards/epoch=" << rewardsPerEpoch
                                        << " downtimeLoss=" << downtimeLoss;

    if (ShouldUnstakeAndRestake(config_, info->reclaimableSlashedStake, downtimeLoss)) {
        return UnstakeAndRestake(*height, *info, downtimeLoss);
    }
    if (ShouldClaimAndStake(config_, info->rewardsAmount, rewardsPerEpoch)) {
        return ClaimAndStake(*height, *info);
    }
    return NoAction(*height, *info);
}

CycleOutcome DecisionEngine::UnstakeAndRestake(int64_t height, const chain::StakeInfo& info,
                                               double downtimeLoss) {
    CycleOutcome outcome;
    outcome.blockHeight = height;
    outcome.sleepSeconds = EpochWait(height);

    double totalRestake = info.stakeAmount + info.rewardsAmount + info.reclaimableSlashedStake;

    if (totalRestake < config_.minStakeAmount) {
        outcome.kind = CycleKind::RestakeSkipped;
        outcome.description = "Unstake/Restake Skipped (Below Min)";
        store_.SetLastAction(outcome.description);

        ReportBalance(height, info);
        std::ostringstream details;
        details << "Total restake (" << FormatAmount(totalRestake) << " DUSK) < "
                << FormatAmount(config_.minStakeAmount) << " DUSK.";
        Report("Unstake/Restake Skipped (Block #" + std::to_string(height) + ")", details.str());
        return outcome;
    }

    outcome.description = "Unstake/Restake @ Block #" + std::to_string(height);
    store_.SetLastAction(outcome.description);

    ReportBalance(height, info);
    Report(outcome.description, "Reclaimable: " + FormatAmount(info.reclaimableSlashedStake) +
                                ", Downtime Loss: " + FormatAmount(downtimeLoss));

    if (!RunStep("Withdraw", height, wallet_.WalletCommand({"withdraw"}),
                 [this]() { return wallet_.Withdraw(); }, outcome)) {
        return outcome;
    }
    if (!RunStep("Unstake", height, wallet_.WalletCommand({"unstake"}),
                 [this]() { return wallet_.Unstake(); }, outcome)) {
        return outcome;
    }
    if (!RunStep("Stake", height,
                 wallet_.WalletCommand({"stake", "--amt", util::FormatAmountArg(totalRestake)}),
                 [this, totalRestake]() { return wallet_.Stake(totalRestake); }, outcome)) {
        return outcome;
    }

    Report("Restake Completed", "New Stake: " + FormatAmount(totalRestake));
    store_.Update([height](node::SharedState& s) { s.lastClaimBlock = height; });

    // Cooldown: the normal epoch wait plus one full epoch of downtime
    outcome.kind = CycleKind::Restaked;
    outcome.sleepSeconds = EpochWait(height) + EPOCH_BLOCKS * SECONDS_PER_BLOCK;
    LOG_INFO(util::LogCategory::STAKE) << "2-epoch wait after restaking: "
                                       << util::FormatHMS(outcome.sleepSeconds);
    return outcome;
}

CycleOutcome DecisionEngine::ClaimAndStake(int64_t height, const chain::StakeInfo& info) {
    CycleOutcome outcome;
    outcome.blockHeight = height;
    outcome.sleepSeconds = EpochWait(height);
    outcome.description = "Claim/Stake @ Block " + std::to_string(height);
    store_.SetLastAction(outcome.description);

    ReportBalance(height, info);
    Report("Claim and Stake", "Rewards: " + FormatAmount(info.rewardsAmount));

    double rewards = info.rewardsAmount;
    if (!RunStep("Withdraw", height, wallet_.WalletCommand({"withdraw"}),
                 [this]() { return wallet_.Withdraw(); }, outcome)) {
        return outcome;
    }
    if (!RunStep("Stake", height,
                 wallet_.WalletCommand({"stake", "--amt", util::FormatAmountArg(rewards)}),
                 [this, rewards]() { return wallet_.Stake(rewards); }, outcome)) {
        return outcome;
    }

    Report("Stake Completed", "New Stake: " + FormatAmount(info.stakeAmount + info.rewardsAmount));
    store_.Update([height](node::SharedState& s) { s.lastClaimBlock = height; });

    outcome.kind = CycleKind::Claimed;
    return outcome;
}

CycleOutcome DecisionEngine::NoAction(int64_t height, const chain::StakeInfo& info) {
    CycleOutcome outcome;
    outcome.kind = CycleKind::NoAction;
    outcome.blockHeight = height;
    outcome.sleepSeconds = EpochWait(height);

    bool firstRun = false;
    store_.Update([&](node::SharedState& s) {
        s.lastNoActionBlock = height;
        firstRun = s.firstRun;
        if (firstRun) {
            s.firstRun = false;
            s.lastActionTaken = "Startup @ Block #" + std::to_string(height);
        } else {
            s.lastActionTaken = "No Action @ Block " + std::to_string(height);
        }
        outcome.description = s.lastActionTaken;
    });

    if (firstRun) {
        LOG_INFO(util::LogCategory::STAKE) << outcome.description;
        notifier_.Notify(BuildStartupSummary(outcome.description, info), store_.Get());
    } else {
        LOG_INFO(util::LogCategory::STAKE) << outcome.description << "; next check in "
                                           << util::FormatHMS(outcome.sleepSeconds);
        store_.AppendLogEntry(BuildStatusEntry());
    }

    return outcome;
}

bool DecisionEngine::RunStep(const std::string& step, int64_t height,
                             const exec::CommandLine& command,
                             const std::function<exec::CommandResult()>& action,
                             CycleOutcome& outcome) {
    if (token_ && token_->StopRequested()) {
        Report(step + " Not Attempted (Block #" + std::to_string(height) + ")",
               "Shutdown requested; reconcile stake state manually.", true);
        outcome.kind = CycleKind::Interrupted;
        outcome.failedStep = step;
        outcome.description = "Interrupted before " + step + " @ Block #" + std::to_string(height);
        outcome.sleepSeconds = 0;
        store_.SetLastAction(outcome.description);
        return false;
    }

    exec::CommandResult result = action();
    if (result.success) {
        LOG_INFO(util::LogCategory::STAKE) << step << " succeeded at block #" << height;
        return true;
    }

    Report(step + " Failed (Block #" + std::to_string(height) + ")",
           "Command: " + command.ToString(), true);

    outcome.kind = CycleKind::ActionFailed;
    outcome.failedStep = step;
    outcome.description = step + " Failed @ Block #" + std::to_string(height);
    outcome.sleepSeconds = EpochWait(height);
    store_.SetLastAction(outcome.description);
    return false;
}

void DecisionEngine::Report(const std::string& action, const std::string& details,
                            bool isError) {
    std::string message = action + ": " + details;
    notifier_.Notify(message, store_.Get());

    if (isError) {
        LOG_ERROR(util::LogCategory::STAKE) << message;
    } else {
        LOG_INFO(util::LogCategory::STAKE) << message;
    }
}

void DecisionEngine::ReportBalance(int64_t height, const chain::StakeInfo& info) {
    Report("Balance Info (#" + std::to_string(height) + ")",
           "Rwd: " + FormatAmount(info.rewardsAmount) +
           ", Stk: " + FormatAmount(info.stakeAmount) +
           ", Rcl: " + FormatAmount(info.reclaimableSlashedStake));
}

std::string DecisionEngine::BuildStartupSummary(const std::string& action,
                                                const chain::StakeInfo& info) const {
    node::SharedState state = store_.Get();
    const chain::Balances& b = state.balances;
    const bool priced = state.market.has_value();
    const double price = state.Price();

    // " ($12.34)", or nothing while no price is known
    auto fiat = [priced, price](double amount) {
        return priced ? " ($" + FormatAmount(amount * price, 2) + ")" : std::string();
    };

    std::ostringstream ss;
    ss << "\n" << std::string(44, '=') << "\n"
       << "  Action       : " << action << "\n"
       << "  Balance      : " << FormatAmount(b.Total()) << " DUSK\n"
       << "    ├─ Public  :   " << FormatAmount(b.publicTotal) << " DUSK"
       << fiat(b.publicTotal) << "\n"
       << "    └─ Shielded:   " << FormatAmount(b.shieldedTotal) << " DUSK"
       << fiat(b.shieldedTotal) << "\n"
       << "  Staked       : " << FormatAmount(info.stakeAmount) << " DUSK"
       << fiat(info.stakeAmount) << "\n"
       << "  Rewards      : " << FormatAmount(info.rewardsAmount) << " DUSK"
       << fiat(info.rewardsAmount) << "\n"
       << "  Reclaimable  : " << FormatAmount(info.reclaimableSlashedStake) << " DUSK"
       << fiat(info.reclaimableSlashedStake) << "\n";
    return ss.str();
}

std::string DecisionEngine::BuildStatusEntry() const {
    node::SharedState state = store_.Get();
    const chain::StakeInfo& st = state.stakeInfo;
    const bool priced = state.market.has_value();
    const double price = state.Price();

    // " ($12.34)", or nothing while no price is known
    auto fiat = [priced, price](double amount) {
        return priced ? " ($" + FormatAmount(amount * price, 2) + ")" : std::string();
    };

    std::ostringstream ss;
    ss << "=============== Log Entry @ "
       << util::FormatTime(util::SystemClock::now(), "%Y-%m-%d %H:%M")
       << " ===============\n"
       << "Block Height  : #" << state.blockHeight << "\n"
       << "Last Action   : " << state.lastActionTaken << "\n"
       << "Staked        : " << FormatAmount(st.stakeAmount) << fiat(st.stakeAmount) << "\n"
       << "Rewards       : " << FormatAmount(st.rewardsAmount) << fiat(st.rewardsAmount) << "\n"
       << "Reclaimable   : " << FormatAmount(st.reclaimableSlashedStake)
       << fiat(st.reclaimableSlashedStake) << "\n"
       << "Next Epoch    : ~"
       << MinutesUntilNextEpoch(state.blockHeight, config_.bufferBlocks) << " min\n";
    return ss.str();
}

} // namespace staking
} // namespace stakeguard
