// STAKEGUARD - Chain and Wallet Adapter Tests
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include <gtest/gtest.h>

#include "stakeguard/chain/wallet.h"
#include "stakeguard/util/logging.h"
#include "stakeguard/util/threadpool.h"

#include "support/fakes.h"

namespace stakeguard {
namespace chain {
namespace test {

using exec::CommandResult;
using stakeguard::test::FakeExecutor;
using stakeguard::test::StakeInfoOutput;

// ============================================================================
// Parser Tests
// ============================================================================

TEST(StakeInfoParserTest, WellFormed) {
    auto info = ParseStakeInfo(StakeInfoOutput("1000.5", "12.25", "3.125"));
    ASSERT_TRUE(info.has_value());

    EXPECT_DOUBLE_EQ(info->stakeAmount, 1000.5);
    EXPECT_DOUBLE_EQ(info->reclaimableSlashedStake, 12.25);
    EXPECT_DOUBLE_EQ(info->rewardsAmount, 3.125);
}

TEST(StakeInfoParserTest, IgnoresColoursAndNoise) {
    std::string output =
        "\x1B[1mStake info for profile 1\x1B[0m\n"
        "  Eligible stake: \x1B[32m2000\x1B[0m DUSK\n"
        "  Reclaimable slashed stake: 0 DUSK\n"
        "  Stake active from block #12345\n"
        "  Accumulated rewards is: 7.5 DUSK\n";

    auto info = ParseStakeInfo(output);
    ASSERT_TRUE(info.has_value());
    EXPECT_DOUBLE_EQ(info->stakeAmount, 2000.0);
    EXPECT_DOUBLE_EQ(info->reclaimableSlashedStake, 0.0);
    EXPECT_DOUBLE_EQ(info->rewardsAmount, 7.5);
}

TEST(StakeInfoParserTest, MissingRewardsIsIncomplete) {
    std::string output = "Eligible stake: 1000 DUSK\n"
                         "Reclaimable slashed stake: 0 DUSK\n";
    EXPECT_FALSE(ParseStakeInfo(output).has_value());
}

TEST(StakeInfoParserTest, MalformedAmountIsIncomplete) {
    EXPECT_FALSE(ParseStakeInfo(StakeInfoOutput("n/a", "0", "1")).has_value());

    std::string noUnit = "Eligible stake: 1000\n"
                         "Reclaimable slashed stake: 0 DUSK\n"
                         "Accumulated rewards is: 1 DUSK\n";
    EXPECT_FALSE(ParseStakeInfo(noUnit).has_value());
}

TEST(StakeInfoParserTest, EmptyOutput) {
    EXPECT_FALSE(ParseStakeInfo("").has_value());
}

TEST(ProfilesParserTest, PublicAndShielded) {
    std::string output = "Profile 1 (Default)\n"
                         "  Shielded account - zkAddr1\n"
                         "  Public account   - pubAddr1\n"
                         "Profile 2\n"
                         "  Shielded account - zkAddr2\n"
                         "  Public account - pubAddr2\n";

    WalletAddresses addresses = ParseProfiles(output);
    ASSERT_EQ(addresses.publicAddresses.size(), 2u);
    ASSERT_EQ(addresses.shieldedAddresses.size(), 2u);
    EXPECT_EQ(addresses.publicAddresses[0], "pubAddr1");
    EXPECT_EQ(addresses.shieldedAddresses[1], "zkAddr2");
}

TEST(ProfilesParserTest, NoAddresses) {
    WalletAddresses addresses = ParseProfiles("No profiles found");
    EXPECT_TRUE(addresses.publicAddresses.empty());
    EXPECT_TRUE(addresses.shieldedAddresses.empty());
}

TEST(SpendableParserTest, Formats) {
    EXPECT_DOUBLE_EQ(*ParseSpendable("Total: 150.25"), 150.25);
    EXPECT_DOUBLE_EQ(*ParseSpendable("  42\n"), 42.0);
    EXPECT_FALSE(ParseSpendable("Total: unknown").has_value());
}

TEST(IntegerParserTest, Formats) {
    EXPECT_EQ(*ParseInteger("4320\n"), 4320);
    EXPECT_EQ(*ParseInteger("0"), 0);
    EXPECT_FALSE(ParseInteger("").has_value());
    EXPECT_FALSE(ParseInteger("-5").has_value());
    EXPECT_FALSE(ParseInteger("12 peers").has_value());
}

// ============================================================================
// Adapter Tests
// ============================================================================

class WalletAdapterTest : public ::testing::Test {
protected:
    WalletAdapter::Config MakeConfig(bool useSudo = false) {
        WalletAdapter::Config config;
        config.password = "hunter2";
        config.useSudo = useSudo;
        return config;
    }

    FakeExecutor executor_;
    util::ThreadPool pool_{2};
};

TEST_F(WalletAdapterTest, QueryCommandShape) {
    WalletAdapter wallet(executor_, pool_, MakeConfig());
    exec::CommandLine cmd = wallet.QueryCommand("block-height");

    EXPECT_EQ(cmd.Args(), (std::vector<std::string>{"ruskquery", "block-height"}));
}

TEST_F(WalletAdapterTest, WalletCommandShape) {
    WalletAdapter wallet(executor_, pool_, MakeConfig());
    exec::CommandLine cmd = wallet.WalletCommand({"stake-info"});

    EXPECT_EQ(cmd.Args(),
              (std::vector<std::string>{"rusk-wallet", "--password", "hunter2", "stake-info"}));
    EXPECT_EQ(cmd.ToString().find("hunter2"), std::string::npos);
}

TEST_F(WalletAdapterTest, SudoPrefix) {
    WalletAdapter wallet(executor_, pool_, MakeConfig(true));

    EXPECT_EQ(wallet.WalletCommand({"withdraw"}).Program(), "sudo");
    EXPECT_EQ(wallet.QueryCommand("peers").Args()[1], "ruskquery");
}

TEST_F(WalletAdapterTest, FetchHeightAndPeers) {
    executor_.When("block-height", CommandResult::Success("4320"));
    executor_.When("peers", CommandResult::Success("57"));
    WalletAdapter wallet(executor_, pool_, MakeConfig());

    EXPECT_EQ(wallet.FetchBlockHeight(), std::optional<int64_t>(4320));
    EXPECT_EQ(wallet.FetchPeerCount(), std::optional<int64_t>(57));
}

TEST_F(WalletAdapterTest, FailedOrGarbledQueryIsUnavailable) {
    executor_.When("peers", CommandResult::Success("connection refused"));
    WalletAdapter wallet(executor_, pool_, MakeConfig());

    EXPECT_FALSE(wallet.FetchBlockHeight().has_value());  // No rule: command fails
    EXPECT_FALSE(wallet.FetchPeerCount().has_value());
}

TEST_F(WalletAdapterTest, FetchStakeInfo) {
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("1000", "5", "2")));
    WalletAdapter wallet(executor_, pool_, MakeConfig());

    auto info = wallet.FetchStakeInfo();
    ASSERT_TRUE(info.has_value());
    EXPECT_DOUBLE_EQ(info->reclaimableSlashedStake, 5.0);
}

TEST_F(WalletAdapterTest, BalanceFanOut) {
    executor_.When("profiles", CommandResult::Success(
        "Public account - pubA\nShielded account - zkA\n"
        "Public account - pubB\nShielded account - zkB\n"));
    executor_.When("pubA", CommandResult::Success("Total: 10.5"));
    executor_.When("pubB", CommandResult::Success("4.5"));
    executor_.When("zkA", CommandResult::Success("100"));
    executor_.When("zkB", CommandResult::Failure(1, "locked"));
    WalletAdapter wallet(executor_, pool_, MakeConfig());

    auto balances = wallet.FetchBalances();
    ASSERT_TRUE(balances.has_value());

    // A failed address contributes nothing
    EXPECT_DOUBLE_EQ(balances->publicTotal, 15.0);
    EXPECT_DOUBLE_EQ(balances->shieldedTotal, 100.0);
    EXPECT_DOUBLE_EQ(balances->Total(), 115.0);
    EXPECT_EQ(executor_.CountContaining("--spendable"), 4u);
}

TEST_F(WalletAdapterTest, BalancesUnavailableWithoutProfiles) {
    WalletAdapter wallet(executor_, pool_, MakeConfig());
    EXPECT_FALSE(wallet.FetchBalances().has_value());
    EXPECT_EQ(executor_.CountContaining("--spendable"), 0u);
}

TEST_F(WalletAdapterTest, BalancesInlineWhenPoolStopped) {
    executor_.When("profiles", CommandResult::Success("Public account - pubA\n"));
    executor_.When("pubA", CommandResult::Success("3"));
    pool_.Shutdown();
    WalletAdapter wallet(executor_, pool_, MakeConfig());

    auto balances = wallet.FetchBalances();
    ASSERT_TRUE(balances.has_value());
    EXPECT_DOUBLE_EQ(balances->publicTotal, 3.0);
}

TEST_F(WalletAdapterTest, StakeAmountArgument) {
    executor_.When("stake", CommandResult::Success("ok"));
    WalletAdapter wallet(executor_, pool_, MakeConfig());

    EXPECT_TRUE(wallet.Stake(1234.5678901234).success);

    auto invocations = executor_.Invocations();
    ASSERT_EQ(invocations.size(), 1u);
    const auto& args = invocations[0].Args();
    ASSERT_EQ(args.size(), 6u);
    EXPECT_EQ(args[3], "stake");
    EXPECT_EQ(args[4], "--amt");
    EXPECT_EQ(args[5], "1234.567890123");
}

TEST_F(WalletAdapterTest, ActionsUseDistinctVerbs) {
    executor_.When("withdraw", CommandResult::Success(""));
    executor_.When("unstake", CommandResult::Failure(2, "not staked"));
    WalletAdapter wallet(executor_, pool_, MakeConfig());

    EXPECT_TRUE(wallet.Withdraw().success);
    exec::CommandResult unstake = wallet.Unstake();
    EXPECT_FALSE(unstake.success);
    EXPECT_EQ(unstake.exitCode, 2);
    EXPECT_EQ(executor_.Sequence({"withdraw", "unstake", "stake"}),
              (std::vector<std::string>{"withdraw", "unstake"}));
}

TEST_F(WalletAdapterTest, QueriesAreRoutineActionsAreNot) {
    executor_.When("block-height", CommandResult::Success("4320"));
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("1000", "5", "2")));
    executor_.When("profiles", CommandResult::Success("Public account - pubA\n"));
    executor_.When("pubA", CommandResult::Success("3"));
    executor_.When("withdraw", CommandResult::Success(""));
    WalletAdapter wallet(executor_, pool_, MakeConfig());

    wallet.FetchBlockHeight();
    wallet.FetchStakeInfo();
    wallet.FetchBalances();
    wallet.Withdraw();

    auto invocations = executor_.Invocations();
    ASSERT_EQ(invocations.size(), 5u);
    for (const auto& cmd : invocations) {
        EXPECT_EQ(cmd.IsRoutine(), !cmd.Contains("withdraw")) << cmd.ToString();
    }
}

} // namespace test
} // namespace chain
} // namespace stakeguard
