// STAKEGUARD - Poller and Loop Coordinator Tests
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include <gtest/gtest.h>

#include "stakeguard/chain/wallet.h"
#include "stakeguard/node/coordinator.h"
#include "stakeguard/node/state.h"
#include "stakeguard/staking/anomaly.h"
#include "stakeguard/staking/decision.h"
#include "stakeguard/staking/epoch.h"
#include "stakeguard/ui/status_view.h"
#include "stakeguard/util/threadpool.h"

#include "support/fakes.h"

#include <atomic>
#include <functional>
#include <stdexcept>
#include <thread>

namespace stakeguard {
namespace node {
namespace test {

using exec::CommandResult;
using stakeguard::test::FakeExecutor;
using stakeguard::test::FakeMarketFeed;
using stakeguard::test::RecordingNotifier;
using stakeguard::test::StakeInfoOutput;

namespace {

chain::WalletAdapter::Config WalletConfig() {
    chain::WalletAdapter::Config config;
    config.password = "hunter2";
    return config;
}

market::MarketSnapshot Market(double price) {
    market::MarketSnapshot snapshot;
    snapshot.price = price;
    return snapshot;
}

class CountingView : public ui::IStatusView {
public:
    void Render(const StateSnapshot& snapshot) override {
        lastHeight_.store(snapshot.state.blockHeight);
        ++renders_;
    }

    int Renders() const { return renders_.load(); }
    int64_t LastHeight() const { return lastHeight_.load(); }

private:
    std::atomic<int> renders_{0};
    std::atomic<int64_t> lastHeight_{0};
};

class ThrowingView : public ui::IStatusView {
public:
    void Render(const StateSnapshot&) override {
        ++calls_;
        throw std::runtime_error("terminal gone");
    }

    int Calls() const { return calls_.load(); }

private:
    std::atomic<int> calls_{0};
};

bool WaitUntil(const std::function<bool()>& condition,
               util::Milliseconds timeout = util::Milliseconds(5000)) {
    auto deadline = util::SteadyClock::now() + timeout;
    while (util::SteadyClock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(util::Milliseconds(5));
    }
    return condition();
}

} // namespace

// ============================================================================
// Poller Tests
// ============================================================================

class PollerTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_.When("block-height", CommandResult::Success("4320"));
        executor_.When("peers", CommandResult::Success("50"));
    }

    FakeExecutor executor_;
    util::ThreadPool pool_{2};
    chain::WalletAdapter wallet_{executor_, pool_, WalletConfig()};
    FakeMarketFeed feed_;
    StateStore store_;
    RecordingNotifier notifier_;
};

TEST_F(PollerTest, TickUpdatesHeightAndPeers) {
    staking::AnomalyDetector detector(10);
    Poller poller(wallet_, feed_, store_, notifier_, detector);

    poller.Tick();

    SharedState state = store_.Get();
    EXPECT_EQ(state.blockHeight, 4320);
    EXPECT_EQ(state.peerCount, 50);
    EXPECT_EQ(poller.CyclesSinceRefresh(), 1);
    EXPECT_TRUE(notifier_.Messages().empty());
}

TEST_F(PollerTest, StallAlert) {
    staking::AnomalyDetector detector(10);
    Poller poller(wallet_, feed_, store_, notifier_, detector);

    for (int i = 0; i < 10; ++i) {
        poller.Tick();
    }
    EXPECT_TRUE(notifier_.Messages().empty());

    poller.Tick();
    ASSERT_EQ(notifier_.Messages().size(), 1u);
    EXPECT_EQ(notifier_.Messages()[0],
              "WARNING! Block height has not changed for 100 seconds.\nLast height: 4320");
}

TEST_F(PollerTest, LowPeerAlert) {
    executor_.When("peers", CommandResult::Success("2"));
    staking::AnomalyDetector detector(10, staking::STALL_ALERT_THRESHOLD, 3);
    Poller poller(wallet_, feed_, store_, notifier_, detector);

    for (int i = 0; i < 3; ++i) {
        poller.Tick();
    }

    EXPECT_EQ(notifier_.CountContaining("Low peer count for 30 seconds"), 1u);
    EXPECT_EQ(notifier_.CountContaining("Current Count: 2"), 1u);
}

TEST_F(PollerTest, HeightFailureSkipsPeers) {
    executor_.When("block-height", CommandResult::Failure(1, "node down"));
    staking::AnomalyDetector detector(10);
    Poller poller(wallet_, feed_, store_, notifier_, detector);

    poller.Tick();

    EXPECT_EQ(executor_.CountContaining("peers"), 0u);
    EXPECT_EQ(store_.Get().blockHeight, 0);
    EXPECT_EQ(poller.CyclesSinceRefresh(), 0);
}

TEST_F(PollerTest, SlowRefreshCadence) {
    executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("1500", "0", "3")));
    feed_.SetSnapshot(Market(0.2));
    staking::AnomalyDetector detector(10);
    Poller poller(wallet_, feed_, store_, notifier_, detector);

    for (int i = 0; i < SLOW_REFRESH_CYCLES; ++i) {
        poller.Tick();
    }
    EXPECT_EQ(executor_.CountContaining("stake-info"), 0u);
    EXPECT_EQ(feed_.Calls(), 0);

    poller.Tick();
    EXPECT_EQ(executor_.CountContaining("stake-info"), 1u);
    EXPECT_EQ(feed_.Calls(), 1);
    EXPECT_EQ(poller.CyclesSinceRefresh(), 0);

    SharedState state = store_.Get();
    EXPECT_DOUBLE_EQ(state.stakeInfo.stakeAmount, 1500.0);
    EXPECT_DOUBLE_EQ(state.Price(), 0.2);
}

TEST_F(PollerTest, RefreshKeepsPreviousValues) {
    store_.SetMarket(Market(0.3));
    chain::StakeInfo info;
    info.stakeAmount = 900.0;
    store_.SetStakeInfo(info);

    staking::AnomalyDetector detector(10);
    Poller poller(wallet_, feed_, store_, notifier_, detector);
    poller.RefreshSlowData();  // Feed and stake-info both unavailable

    SharedState state = store_.Get();
    EXPECT_DOUBLE_EQ(state.Price(), 0.3);
    EXPECT_DOUBLE_EQ(state.stakeInfo.stakeAmount, 900.0);
}

TEST_F(PollerTest, InitialRefresh) {
    feed_.SetSnapshot(Market(0.25));
    executor_.When("profiles", CommandResult::Success("Public account - pubA\n"));
    executor_.When("pubA", CommandResult::Success("12"));
    staking::AnomalyDetector detector(10);
    Poller poller(wallet_, feed_, store_, notifier_, detector);

    poller.InitialRefresh();

    SharedState state = store_.Get();
    EXPECT_EQ(state.blockHeight, 4320);
    EXPECT_DOUBLE_EQ(state.balances.publicTotal, 12.0);
    EXPECT_DOUBLE_EQ(state.Price(), 0.25);
}

// ============================================================================
// LoopCoordinator Tests
// ============================================================================

class LoopCoordinatorTest : public PollerTest {
protected:
    void SetUp() override {
        PollerTest::SetUp();
        executor_.When("stake-info", CommandResult::Success(StakeInfoOutput("2000", "0", "1")));
        timing_.tick = util::Milliseconds(1);
    }

    LoopTiming timing_;
    util::CancellationToken token_;
    staking::AnomalyDetector detector_{10};
};

TEST_F(LoopCoordinatorTest, RunsAllLoops) {
    Poller poller(wallet_, feed_, store_, notifier_, detector_);
    staking::DecisionEngine engine(wallet_, store_, notifier_, staking::DecisionConfig(), &token_);
    staking::EpochScheduler scheduler(store_, token_, timing_.tick);
    CountingView view;

    LoopCoordinator coordinator(poller, engine, scheduler, store_, {&view}, token_, timing_);
    coordinator.Start();
    EXPECT_TRUE(coordinator.IsRunning());

    bool progressed = WaitUntil([&] {
        return coordinator.DecisionCycles() >= 1 && coordinator.PollCycles() >= 2 &&
               view.Renders() >= 2 && view.LastHeight() == 4320;
    });

    coordinator.Stop();
    coordinator.Join();

    EXPECT_TRUE(progressed);
    EXPECT_FALSE(coordinator.IsRunning());
    EXPECT_EQ(store_.Get().lastActionTaken, "Startup @ Block #4320");
    EXPECT_GT(store_.Get().remainingSeconds, 0);
    EXPECT_EQ(coordinator.Renders(), static_cast<uint64_t>(view.Renders()));
}

TEST_F(LoopCoordinatorTest, ViewErrorsDoNotStopLoops) {
    Poller poller(wallet_, feed_, store_, notifier_, detector_);
    staking::DecisionEngine engine(wallet_, store_, notifier_, staking::DecisionConfig(), &token_);
    staking::EpochScheduler scheduler(store_, token_, timing_.tick);
    ThrowingView view;

    LoopCoordinator coordinator(poller, engine, scheduler, store_, {&view}, token_, timing_);
    coordinator.Start();

    bool retried = WaitUntil([&] { return view.Calls() >= 3 && coordinator.PollCycles() >= 1; });

    coordinator.Stop();
    coordinator.Join();

    EXPECT_TRUE(retried);
    EXPECT_EQ(coordinator.Renders(), 0u);
}

TEST_F(LoopCoordinatorTest, DestructorStopsLoops) {
    Poller poller(wallet_, feed_, store_, notifier_, detector_);
    staking::DecisionEngine engine(wallet_, store_, notifier_, staking::DecisionConfig(), &token_);
    staking::EpochScheduler scheduler(store_, token_, timing_.tick);

    {
        LoopCoordinator coordinator(poller, engine, scheduler, store_, {}, token_, timing_);
        coordinator.Start();
        WaitUntil([&] { return coordinator.DecisionCycles() >= 1; });
    }

    EXPECT_TRUE(token_.StopRequested());
}

} // namespace test
} // namespace node
} // namespace stakeguard
