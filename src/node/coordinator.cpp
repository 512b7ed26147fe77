// STAKEGUARD - Loop Coordinator Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/node/coordinator.h"
#include "stakeguard/chain/wallet.h"
#include "stakeguard/market/price_feed.h"
#include "stakeguard/node/state.h"
#include "stakeguard/notify/notifier.h"
#include "stakeguard/staking/anomaly.h"
#include "stakeguard/staking/decision.h"
#include "stakeguard/staking/epoch.h"
#include "stakeguard/ui/status_view.h"
#include "stakeguard/util/logging.h"

namespace stakeguard {
namespace node {

// ============================================================================
// Poller Implementation
// ============================================================================

Poller::Poller(chain::WalletAdapter& wallet, market::IMarketFeed& feed, StateStore& store,
               notify::INotifier& notifier, staking::AnomalyDetector& detector,
               int slowRefreshCycles)
    : wallet_(wallet), feed_(feed), store_(store), notifier_(notifier),
      detector_(detector), slowRefreshCycles_(slowRefreshCycles) {}

void Poller::InitialRefresh() {
    if (auto snapshot = feed_.FetchSnapshot()) {
        store_.SetMarket(*snapshot);
    }
    if (auto height = wallet_.FetchBlockHeight()) {
        store_.SetBlockHeight(*height);
    }
    if (auto balances = wallet_.FetchBalances()) {
        store_.SetBalances(*balances);
    }
    LOG_DEBUG(util::LogCategory::POLL) << "Initial refresh complete";
}

void Poller::RefreshSlowData() {
    if (auto balances = wallet_.FetchBalances()) {
        store_.SetBalances(*balances);
    }
    if (auto info = wallet_.FetchStakeInfo()) {
        store_.SetStakeInfo(*info);
    }
    if (auto snapshot = feed_.FetchSnapshot()) {
        store_.SetMarket(*snapshot);
    }
}

void Poller::Tick() {
    auto height = wallet_.FetchBlockHeight();
    if (!height) {
        LOG_ERROR(util::LogCategory::POLL) << "Failed to fetch block height. Retrying next cycle.";
        return;
    }

    if (auto alert = detector_.ObserveHeight(*height)) {
        Alert(*alert);
    }
    store_.SetBlockHeight(*height);

    if (++cyclesSinceRefresh_ > slowRefreshCycles_) {
        RefreshSlowData();
        cyclesSinceRefresh_ = 0;
    }

    auto peers = wallet_.FetchPeerCount();
    if (!peers) {
        LOG_ERROR(util::LogCategory::POLL) << "Failed to fetch peers. Retrying next cycle.";
        return;
    }
    store_.SetPeerCount(*peers);

    if (auto alert = detector_.ObservePeers(*peers)) {
        Alert(*alert);
    }
}

void Poller::Alert(const std::string& message) {
    LOG_ERROR(util::LogCategory::POLL) << message;
    notifier_.Notify(message, store_.Get());
}

// ============================================================================
// LoopCoordinator Implementation
// ============================================================================

LoopCoordinator::LoopCoordinator(Poller& poller, staking::DecisionEngine& engine,
                                 staking::EpochScheduler& scheduler, StateStore& store,
                                 std::vector<ui::IStatusView*> views,
                                 util::CancellationToken& token, const LoopTiming& timing)
    : poller_(poller), engine_(engine), scheduler_(scheduler), store_(store),
      views_(std::move(views)), token_(token), timing_(timing) {}

LoopCoordinator::~LoopCoordinator() {
    Stop();
    Join();
}

void LoopCoordinator::Start() {
    if (running_.exchange(true)) {
        return;
    }

    threads_.emplace_back(&LoopCoordinator::PollLoop, this);
    threads_.emplace_back(&LoopCoordinator::DecisionLoop, this);
    threads_.emplace_back(&LoopCoordinator::PresentationLoop, this);

    LOG_INFO(util::LogCategory::DEFAULT) << "Started polling, decision and presentation loops";
}

void LoopCoordinator::Stop() {
    token_.RequestStop();
}

void LoopCoordinator::Join() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    running_.store(false);
}

bool LoopCoordinator::WaitTicks(int64_t ticks) {
    return token_.WaitFor(timing_.tick * ticks);
}

void LoopCoordinator::PollLoop() {
    while (!token_.StopRequested()) {
        try {
            poller_.Tick();
            ++pollCycles_;
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::POLL) << "Error in polling loop: " << e.what();
        }
        if (!WaitTicks(timing_.pollTicks)) {
            break;
        }
    }
    LOG_DEBUG(util::LogCategory::POLL) << "Polling loop stopped";
}

void LoopCoordinator::DecisionLoop() {
    while (!token_.StopRequested()) {
        int64_t sleepSeconds = 0;
        try {
            staking::CycleOutcome outcome = engine_.RunCycle();
            ++decisionCycles_;
            LOG_DEBUG(util::LogCategory::STAKE) << "Cycle outcome "
                                                << staking::CycleKindToString(outcome.kind)
                                                << " at block #" << outcome.blockHeight
                                                << ", next in " << outcome.sleepSeconds << "s";
            if (outcome.kind == staking::CycleKind::Interrupted) {
                break;
            }
            sleepSeconds = outcome.sleepSeconds;
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::STAKE) << "Error in decision loop: " << e.what();
            sleepSeconds = timing_.errorDelayTicks;
        }
        if (!scheduler_.SleepWithFeedback(sleepSeconds)) {
            break;
        }
    }
    LOG_DEBUG(util::LogCategory::STAKE) << "Decision loop stopped";
}

void LoopCoordinator::PresentationLoop() {
    while (!token_.StopRequested()) {
        int64_t delay = timing_.presentationTicks;
        try {
            StateSnapshot snapshot = store_.Snapshot();
            for (ui::IStatusView* view : views_) {
                view->Render(snapshot);
            }
            ++renders_;
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::DISPLAY) << "Error in status display: " << e.what();
            delay = timing_.errorDelayTicks;
        }
        if (!WaitTicks(delay)) {
            break;
        }
    }
}

} // namespace node
} // namespace stakeguard
