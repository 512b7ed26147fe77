// STAKEGUARD - Stake Decision Engine Tests
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include <gtest/gtest.h>

#include "stakeguard/chain/wallet.h"
#include "stakeguard/node/state.h"
#include "stakeguard/staking/decision.h"
#include "stakeguard/staking/epoch.h"
#include "stakeguard/util/threadpool.h"
#include "stakeguard/util/time.h"

#include "support/fakes.h"

namespace stakeguard {
namespace staking {
namespace test {

using exec::CommandResult;
using stakeguard::test::FakeExecutor;
using stakeguard::test::RecordingNotifier;
using stakeguard::test::StakeInfoOutput;

// ============================================================================
// Policy
// ============================================================================

TEST(DecisionPolicyTest, RewardsPerEpoch) {
    EXPECT_DOUBLE_EQ(CalculateRewardsPerEpoch(10.0, 0, 4320), 5.0);
    EXPECT_DOUBLE_EQ(CalculateRewardsPerEpoch(3.0, 1000, 2080), 6.0);
    EXPECT_DOUBLE_EQ(CalculateRewardsPerEpoch(10.0, 4320, 4320), 0.0);
    EXPECT_DOUBLE_EQ(CalculateRewardsPerEpoch(10.0, 5000, 4320), 0.0);
}

TEST(DecisionPolicyTest, DowntimeLoss) {
    EXPECT_DOUBLE_EQ(CalculateDowntimeLoss(2.5), 2.5);
    EXPECT_DOUBLE_EQ(CalculateDowntimeLoss(2.5, 3), 7.5);
}

TEST(DecisionPolicyTest, RestakeRequiresAutoFlag) {
    DecisionConfig config;
    EXPECT_FALSE(ShouldUnstakeAndRestake(config, 50.0, 1.0));

    config.autoReclaimFullRestakes = true;
    EXPECT_TRUE(ShouldUnstakeAndRestake(config, 50.0, 1.0));
}

TEST(DecisionPolicyTest, RestakeThresholds) {
    DecisionConfig config;
    config.autoReclaimFullRestakes = true;
    config.minSlashed = 5.0;

    EXPECT_FALSE(ShouldUnstakeAndRestake(config, 5.0, 0.0));   // Not above minimum
    EXPECT_TRUE(ShouldUnstakeAndRestake(config, 5.5, 5.5));    // Equal to loss is enough
    EXPECT_FALSE(ShouldUnstakeAndRestake(config, 6.0, 6.5));   // Loss outweighs reclaim
}

TEST(DecisionPolicyTest, ClaimThresholds) {
    DecisionConfig config;
    EXPECT_FALSE(ShouldClaimAndStake(config, 10.0, 1.0));

    config.autoStakeRewards = true;
    config.minRewards = 2.0;
    EXPECT_TRUE(ShouldClaimAndStake(config, 10.0, 5.0));
    EXPECT_TRUE(ShouldClaimAndStake(config, 5.0, 5.0));
    EXPECT_FALSE(ShouldClaimAndStake(config, 2.0, 0.0));
    EXPECT_FALSE(ShouldClaimAndStake(config, 4.0, 5.0));
}

TEST(DecisionPolicyTest, CycleKindNames) {
    EXPECT_STREQ(CycleKindToString(CycleKind::NoAction), "no-action");
    EXPECT_STREQ(CycleKindToString(CycleKind::ActionFailed), "action-failed");
    EXPECT_STREQ(CycleKindToString(CycleKind::Interrupted), "interrupted");
}

// ============================================================================
// Engine
// ============================================================================

class DecisionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_.When("block-height", CommandResult::Success("4320"));
        config_.autoStakeRewards = true;
        config_.autoReclaimFullRestakes = true;
    }

    chain::WalletAdapter::Config WalletConfig() const {
        chain::WalletAdapter::Config config;
        config.password = "hunter2";
        return config;
    }

    CycleOutcome RunOnce(const util::CancellationToken* token = nullptr) {
        chain::WalletAdapter wallet(executor_, pool_, WalletConfig());
        DecisionEngine engine(wallet, store_, notifier_, config_, token);
        return engine.RunCycle();
    }

    FakeExecutor executor_;
    util::ThreadPool pool_{2};
    node::StateStore store_;
    RecordingNotifier notifier_;
    DecisionConfig config_;
};

TEST_F(DecisionEngineTest, HeightUnavailable) {
    executor_.When("block-height", CommandResult::Failure(1, "node down"));

    CycleOutcome outcome = RunOnce();
    EXPECT_EQ(outcome.kind, CycleKind::HeightUnavailable);
    EXPECT_EQ(outcome.sleepSeconds, RETRY_SLEEP_SECONDS);
    EXPECT_EQ(executor_.CountContaining("stake-info"), 0u);
}

TEST_F(DecisionEngineTest, StakeInfoUnavailable) {
    CycleOutcome outcome = RunOnce();  // No stake-info rule: command fails
    EXPECT_EQ(outcome.kind, CycleKind::StakeInfoUnavailable);
    EXPECT_EQ(outcome.sleepSeconds, 30);
    EXPECT_EQ(store_.Get().blockHeight, 4320);
}

TEST_F(DecisionEngineTest, IncompleteStakeInfoIsUnavailable) {
    executor_.When("stake-info", CommandResult::Success("Eligible stake: 1000 DUSK\n"));

    CycleOutcome outcome = RunOnce();
    EXPECT_EQ(outcome.kind, CycleKind::StakeInfoUnavailable);
    EXPECT_EQ(outcome.sleepSeconds, RETRY_SLEEP_SECONDS);
}

TEST_F(DecisionEngineTest, UnstakeAndRestake) {
    // Two epochs since block 0: 4 rewards -> 2 per epoch, reclaim 5 >= loss 2
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("2000", "5", "4")));
    executor_.When("withdraw", CommandResult::Success("ok"));
    executor_.When("unstake", CommandResult::Success("ok"));
    executor_.When("stake", CommandResult::Success("ok"));

    CycleOutcome outcome = RunOnce();

    EXPECT_EQ(outcome.kind, CycleKind::Restaked);
    EXPECT_EQ(outcome.sleepSeconds, SleepSecondsUntilNextEpoch(4320, 60) + 21600);
    EXPECT_EQ(outcome.sleepSeconds, 42600);
    EXPECT_EQ(executor_.Sequence({"withdraw", "unstake", "stake"}),
              (std::vector<std::string>{"withdraw", "unstake", "stake"}));

    // Stake is the full total: stake + rewards + reclaimable
    for (const auto& cmd : executor_.Invocations()) {
        if (cmd.Contains("stake")) {
            EXPECT_TRUE(cmd.Contains("2009"));
        }
    }

    node::SharedState state = store_.Get();
    EXPECT_EQ(state.lastClaimBlock, 4320);
    EXPECT_EQ(state.lastActionTaken, "Unstake/Restake @ Block #4320");
    EXPECT_EQ(notifier_.CountContaining("Restake Completed"), 1u);
    EXPECT_EQ(notifier_.CountContaining("Balance Info (#4320)"), 1u);
}

TEST_F(DecisionEngineTest, FailedStepStopsSequence) {
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("2000", "5", "4")));
    executor_.When("withdraw", CommandResult::Success("ok"));
    executor_.When("unstake", CommandResult::Failure(1, "rejected"));
    executor_.When("stake", CommandResult::Success("ok"));

    CycleOutcome outcome = RunOnce();

    EXPECT_EQ(outcome.kind, CycleKind::ActionFailed);
    EXPECT_EQ(outcome.failedStep, "Unstake");
    EXPECT_EQ(outcome.sleepSeconds, 21000);
    EXPECT_EQ(outcome.description, "Unstake Failed @ Block #4320");
    EXPECT_EQ(executor_.Sequence({"withdraw", "unstake", "stake"}),
              (std::vector<std::string>{"withdraw", "unstake"}));

    node::SharedState state = store_.Get();
    EXPECT_EQ(state.lastActionTaken, "Unstake Failed @ Block #4320");
    EXPECT_EQ(state.lastClaimBlock, 0);

    ASSERT_EQ(notifier_.CountContaining("Unstake Failed (Block #4320)"), 1u);
    for (const auto& message : notifier_.Messages()) {
        EXPECT_EQ(message.find("hunter2"), std::string::npos) << message;
    }
    EXPECT_EQ(notifier_.CountContaining("--password #######"), 1u);
}

TEST_F(DecisionEngineTest, RestakeBelowMinimumIsSkipped) {
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("100", "5", "4")));

    CycleOutcome outcome = RunOnce();

    EXPECT_EQ(outcome.kind, CycleKind::RestakeSkipped);
    EXPECT_EQ(outcome.sleepSeconds, 21000);
    EXPECT_EQ(store_.Get().lastActionTaken, "Unstake/Restake Skipped (Below Min)");
    EXPECT_TRUE(executor_.Sequence({"withdraw", "unstake", "stake"}).empty());
    EXPECT_EQ(notifier_.CountContaining("Total restake (109 DUSK) < 1000 DUSK."), 1u);
}

TEST_F(DecisionEngineTest, ClaimAndStake) {
    // No reclaimable stake: rewards 10 -> 5 per epoch
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("2000", "0", "10")));
    executor_.When("withdraw", CommandResult::Success("ok"));
    executor_.When("stake", CommandResult::Success("ok"));

    CycleOutcome outcome = RunOnce();

    EXPECT_EQ(outcome.kind, CycleKind::Claimed);
    EXPECT_EQ(outcome.sleepSeconds, 21000);
    EXPECT_EQ(outcome.description, "Claim/Stake @ Block 4320");
    EXPECT_EQ(executor_.Sequence({"withdraw", "unstake", "stake"}),
              (std::vector<std::string>{"withdraw", "stake"}));

    auto invocations = executor_.Invocations();
    const exec::CommandLine& stake = invocations.back();
    ASSERT_TRUE(stake.Contains("stake"));
    EXPECT_EQ(stake.Args().back(), "10");

    EXPECT_EQ(store_.Get().lastClaimBlock, 4320);
    EXPECT_EQ(notifier_.CountContaining("Stake Completed: New Stake: 2010"), 1u);
}

TEST_F(DecisionEngineTest, StartupThenNoAction) {
    config_.autoStakeRewards = false;
    config_.autoReclaimFullRestakes = false;
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("2000", "5", "4")));

    CycleOutcome first = RunOnce();
    EXPECT_EQ(first.kind, CycleKind::NoAction);
    EXPECT_EQ(first.description, "Startup @ Block #4320");
    EXPECT_EQ(notifier_.CountContaining("Startup @ Block #4320"), 1u);
    EXPECT_EQ(store_.Snapshot().logEntries.size(), 0u);
    EXPECT_FALSE(store_.Get().firstRun);

    // Same height again: already evaluated
    CycleOutcome repeat = RunOnce();
    EXPECT_EQ(repeat.kind, CycleKind::AlreadyEvaluated);
    EXPECT_EQ(repeat.sleepSeconds, SAME_BLOCK_SLEEP_SECONDS);
    EXPECT_EQ(executor_.CountContaining("stake-info"), 1u);

    executor_.When("block-height", CommandResult::Success("4321"));
    CycleOutcome next = RunOnce();
    EXPECT_EQ(next.kind, CycleKind::NoAction);

    node::StateSnapshot snapshot = store_.Snapshot();
    EXPECT_EQ(snapshot.state.lastActionTaken, "No Action @ Block 4321");
    EXPECT_EQ(snapshot.state.lastNoActionBlock, std::optional<int64_t>(4321));
    ASSERT_EQ(snapshot.logEntries.size(), 1u);
    EXPECT_NE(snapshot.logEntries[0].find("Block Height  : #4321"), std::string::npos);
    EXPECT_NE(snapshot.logEntries[0].find("No Action @ Block 4321"), std::string::npos);
    EXPECT_EQ(notifier_.Messages().size(), 1u);
}

TEST_F(DecisionEngineTest, FiatValuesOnlyWithKnownPrice) {
    config_.autoStakeRewards = false;
    config_.autoReclaimFullRestakes = false;
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("2000", "5", "4")));

    // No market snapshot yet
    RunOnce();
    ASSERT_EQ(notifier_.Messages().size(), 1u);
    EXPECT_EQ(notifier_.Messages()[0].find('$'), std::string::npos);

    executor_.When("block-height", CommandResult::Success("4321"));
    RunOnce();
    ASSERT_EQ(store_.Snapshot().logEntries.size(), 1u);
    EXPECT_EQ(store_.Snapshot().logEntries[0].find('$'), std::string::npos);

    market::MarketSnapshot market;
    market.price = 0.5;
    store_.SetMarket(market);

    executor_.When("block-height", CommandResult::Success("4322"));
    RunOnce();
    node::StateSnapshot snapshot = store_.Snapshot();
    ASSERT_EQ(snapshot.logEntries.size(), 2u);
    EXPECT_NE(snapshot.logEntries[1].find("($1000)"), std::string::npos);
}

TEST_F(DecisionEngineTest, StatusEntryShowsMinutesToNextEpoch) {
    config_.autoStakeRewards = false;
    config_.autoReclaimFullRestakes = false;
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("2000", "0", "0")));
    RunOnce();

    // 2160 - 1 - 60 blocks of 10s: 20990s
    executor_.When("block-height", CommandResult::Success("4321"));
    RunOnce();
    // Past the buffer point the countdown floors at zero
    executor_.When("block-height", CommandResult::Success("6420"));
    RunOnce();

    node::StateSnapshot snapshot = store_.Snapshot();
    ASSERT_EQ(snapshot.logEntries.size(), 2u);
    EXPECT_NE(snapshot.logEntries[0].find("Next Epoch    : ~349 min"), std::string::npos);
    EXPECT_NE(snapshot.logEntries[1].find("Next Epoch    : ~0 min"), std::string::npos);
}

TEST_F(DecisionEngineTest, StatusLogIsBounded) {
    config_.autoStakeRewards = false;
    config_.autoReclaimFullRestakes = false;
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("2000", "0", "0")));

    for (int i = 0; i < 25; ++i) {
        executor_.When("block-height", CommandResult::Success(std::to_string(5000 + i)));
        EXPECT_EQ(RunOnce().kind, CycleKind::NoAction);
    }

    node::StateSnapshot snapshot = store_.Snapshot();
    ASSERT_EQ(snapshot.logEntries.size(), node::STATUS_LOG_CAPACITY);
    EXPECT_NE(snapshot.logEntries.front().find("#5005"), std::string::npos);
    EXPECT_NE(snapshot.logEntries.back().find("#5024"), std::string::npos);
}

TEST_F(DecisionEngineTest, StopRequestPreventsActions) {
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("2000", "0", "10")));
    executor_.When("withdraw", CommandResult::Success("ok"));
    executor_.When("stake", CommandResult::Success("ok"));

    util::CancellationToken token;
    token.RequestStop();
    CycleOutcome outcome = RunOnce(&token);

    EXPECT_EQ(outcome.kind, CycleKind::Interrupted);
    EXPECT_EQ(outcome.failedStep, "Withdraw");
    EXPECT_EQ(outcome.sleepSeconds, 0);
    EXPECT_EQ(outcome.description, "Interrupted before Withdraw @ Block #4320");
    EXPECT_EQ(executor_.CountContaining("withdraw"), 0u);
    EXPECT_EQ(store_.Get().lastActionTaken, "Interrupted before Withdraw @ Block #4320");
}

} // namespace test
} // namespace staking
} // namespace stakeguard
