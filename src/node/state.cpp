// STAKEGUARD - Shared State Store Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/node/state.h"

#include <algorithm>

namespace stakeguard {
namespace node {

// ============================================================================
// BoundedLog Implementation
// ============================================================================

BoundedLog::BoundedLog(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

void BoundedLog::Append(std::string entry) {
    if (entries_.size() >= capacity_) {
        entries_.pop_front();
    }
    entries_.push_back(std::move(entry));
}

std::vector<std::string> BoundedLog::Entries() const {
    return std::vector<std::string>(entries_.begin(), entries_.end());
}

// ============================================================================
// SharedState
// ============================================================================

bool SharedState::operator==(const SharedState& other) const {
    return blockHeight == other.blockHeight &&
           peerCount == other.peerCount &&
           remainingSeconds == other.remainingSeconds &&
           completionTimeLabel == other.completionTimeLabel &&
           lastNoActionBlock == other.lastNoActionBlock &&
           lastClaimBlock == other.lastClaimBlock &&
           stakeInfo == other.stakeInfo &&
           balances == other.balances &&
           lastActionTaken == other.lastActionTaken &&
           firstRun == other.firstRun &&
           market == other.market;
}

// ============================================================================
// StateStore Implementation
// ============================================================================

StateStore::StateStore() : log_(STATUS_LOG_CAPACITY) {}

StateSnapshot StateStore::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StateSnapshot snapshot;
    snapshot.state = state_;
    snapshot.logEntries = log_.Entries();
    return snapshot;
}

SharedState StateStore::Get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void StateStore::Update(const std::function<void(SharedState&)>& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    mutator(state_);
}

void StateStore::Replace(const SharedState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

void StateStore::SetBlockHeight(int64_t height) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.blockHeight = height;
}

void StateStore::SetPeerCount(int64_t peers) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.peerCount = peers;
}

void StateStore::SetStakeInfo(const chain::StakeInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.stakeInfo = info;
}

void StateStore::SetBalances(const chain::Balances& balances) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.balances = balances;
}

void StateStore::SetMarket(const market::MarketSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.market = snapshot;
}

void StateStore::SetLastAction(const std::string& action) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.lastActionTaken = action;
}

void StateStore::StartCountdown(int64_t seconds, const std::string& completionLabel) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.remainingSeconds = std::max<int64_t>(seconds, 0);
    state_.completionTimeLabel = completionLabel;
}

void StateStore::DecrementCountdown(int64_t seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.remainingSeconds = std::max<int64_t>(state_.remainingSeconds - seconds, 0);
}

void StateStore::AppendLogEntry(std::string entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_.Append(std::move(entry));
}

} // namespace node
} // namespace stakeguard
