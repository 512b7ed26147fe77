// STAKEGUARD - Shared State Store
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// The single process-wide record written by the polling and decision loops
// and read by the presentation loop. All access goes through StateStore,
// which hands out whole-record copies under one mutex.

#ifndef STAKEGUARD_NODE_STATE_H
#define STAKEGUARD_NODE_STATE_H

#include "stakeguard/chain/wallet.h"
#include "stakeguard/market/price_feed.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stakeguard {
namespace node {

/// Number of status entries retained for display
constexpr size_t STATUS_LOG_CAPACITY = 20;

// ============================================================================
// Bounded Log
// ============================================================================

/**
 * Fixed-capacity FIFO of status entries. Appending to a full log evicts
 * the oldest entry.
 */
class BoundedLog {
public:
    explicit BoundedLog(size_t capacity = STATUS_LOG_CAPACITY);

    void Append(std::string entry);
    void Clear() { entries_.clear(); }

    size_t Size() const { return entries_.size(); }
    size_t Capacity() const { return capacity_; }
    bool Empty() const { return entries_.empty(); }

    /// Oldest first
    std::vector<std::string> Entries() const;

private:
    size_t capacity_;
    std::deque<std::string> entries_;
};

// ============================================================================
// Shared State
// ============================================================================

struct SharedState {
    int64_t blockHeight{0};
    int64_t peerCount{0};

    // Countdown for the next decision cycle
    int64_t remainingSeconds{0};
    std::string completionTimeLabel;

    std::optional<int64_t> lastNoActionBlock;
    int64_t lastClaimBlock{0};

    chain::StakeInfo stakeInfo;
    chain::Balances balances;

    std::string lastActionTaken{"None"};
    bool firstRun{true};

    /// Unset until the feed has answered at least once
    std::optional<market::MarketSnapshot> market;

    /// Price for fiat conversions; 0 when unknown
    double Price() const { return market ? market->price : 0.0; }

    bool operator==(const SharedState& other) const;
    bool operator!=(const SharedState& other) const { return !(*this == other); }
};

/// Full read-only view handed to presentation consumers
struct StateSnapshot {
    SharedState state;
    std::vector<std::string> logEntries;
};

// ============================================================================
// State Store
// ============================================================================

class StateStore {
public:
    StateStore();

    /// Copy of the full record and the status log
    StateSnapshot Snapshot() const;

    /// Copy of the record only
    SharedState Get() const;

    /// Apply `mutator` to the record while holding the lock
    void Update(const std::function<void(SharedState&)>& mutator);

    /// Replace the whole record
    void Replace(const SharedState& state);

    // Convenience writers; each is one atomic update

    void SetBlockHeight(int64_t height);
    void SetPeerCount(int64_t peers);
    void SetStakeInfo(const chain::StakeInfo& info);
    void SetBalances(const chain::Balances& balances);
    void SetMarket(const market::MarketSnapshot& snapshot);
    void SetLastAction(const std::string& action);
    void StartCountdown(int64_t seconds, const std::string& completionLabel);

    /// Reduce the countdown by `seconds`, never below zero
    void DecrementCountdown(int64_t seconds);

    void AppendLogEntry(std::string entry);

private:
    mutable std::mutex mutex_;
    SharedState state_;
    BoundedLog log_;
};

} // namespace node
} // namespace stakeguard

#endif // STAKEGUARD_NODE_STATE_H
