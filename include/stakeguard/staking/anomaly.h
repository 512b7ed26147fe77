// STAKEGUARD - Node Anomaly Detector
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#ifndef STAKEGUARD_STAKING_ANOMALY_H
#define STAKEGUARD_STAKING_ANOMALY_H

#include <cstdint>
#include <optional>
#include <string>

namespace stakeguard {
namespace staking {

/// Consecutive unchanged heights before a stall alert
constexpr int STALL_ALERT_THRESHOLD = 10;

/// Consecutive low-peer observations before a peer alert
constexpr int LOW_PEER_ALERT_THRESHOLD = 240;

/// Polling cadence the counters are expressed in
constexpr int64_t POLL_INTERVAL_SECONDS = 10;

/**
 * Counts sustained stall and low-peer episodes across polling cycles.
 * Each counter resets after raising an alert, so a continuing episode
 * re-alerts only after another full threshold of observations.
 */
class AnomalyDetector {
public:
    explicit AnomalyDetector(int64_t minPeers,
                             int stallThreshold = STALL_ALERT_THRESHOLD,
                             int lowPeerThreshold = LOW_PEER_ALERT_THRESHOLD);

    /**
     * Record one block-height observation. The first observation only sets
     * the baseline.
     * @return Alert message when the stall threshold is reached
     */
    std::optional<std::string> ObserveHeight(int64_t height);

    /**
     * Record one peer-count observation.
     * @return Alert message when the low-peer threshold is reached
     */
    std::optional<std::string> ObservePeers(int64_t peerCount);

    int StallCount() const { return stallCount_; }
    int LowPeerCount() const { return lowPeerCount_; }
    std::optional<int64_t> LastHeight() const { return lastHeight_; }

private:
    int64_t minPeers_;
    int stallThreshold_;
    int lowPeerThreshold_;

    std::optional<int64_t> lastHeight_;
    int stallCount_{0};
    int lowPeerCount_{0};
};

} // namespace staking
} // namespace stakeguard

#endif // STAKEGUARD_STAKING_ANOMALY_H
