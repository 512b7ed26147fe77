// STAKEGUARD - Node Anomaly Detector Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/staking/anomaly.h"

#include <sstream>

namespace stakeguard {
namespace staking {

AnomalyDetector::AnomalyDetector(int64_t minPeers, int stallThreshold, int lowPeerThreshold)
    : minPeers_(minPeers), stallThreshold_(stallThreshold), lowPeerThreshold_(lowPeerThreshold) {}

std::optional<std::string> AnomalyDetector::ObserveHeight(int64_t height) {
    if (lastHeight_ && *lastHeight_ == height) {
        ++stallCount_;
    } else {
        stallCount_ = 0;
    }
    lastHeight_ = height;

    if (stallCount_ < stallThreshold_) {
        return std::nullopt;
    }

    std::ostringstream ss;
    ss << "WARNING! Block height has not changed for "
       << stallCount_ * POLL_INTERVAL_SECONDS << " seconds.\n"
       << "Last height: " << height;
    stallCount_ = 0;
    return ss.str();
}

std::optional<std::string> AnomalyDetector::ObservePeers(int64_t peerCount) {
    if (peerCount < minPeers_ || peerCount <= 0) {
        ++lowPeerCount_;
    } else {
        lowPeerCount_ = 0;
    }

    if (lowPeerCount_ < lowPeerThreshold_) {
        return std::nullopt;
    }

    std::ostringstream ss;
    ss << "WARNING! Low peer count for "
       << lowPeerCount_ * POLL_INTERVAL_SECONDS << " seconds.\n"
       << "Current Count: " << peerCount;
    lowPeerCount_ = 0;
    return ss.str();
}

} // namespace staking
} // namespace stakeguard
