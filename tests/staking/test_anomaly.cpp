// STAKEGUARD - Anomaly Detector Tests
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include <gtest/gtest.h>

#include "stakeguard/staking/anomaly.h"

namespace stakeguard {
namespace staking {
namespace test {

class AnomalyDetectorTest : public ::testing::Test {
protected:
    AnomalyDetector detector_{10};
};

// ============================================================================
// Block Height Stall
// ============================================================================

TEST_F(AnomalyDetectorTest, FirstObservationIsBaseline) {
    EXPECT_FALSE(detector_.ObserveHeight(100).has_value());
    EXPECT_EQ(detector_.StallCount(), 0);
    EXPECT_EQ(detector_.LastHeight(), std::optional<int64_t>(100));
}

TEST_F(AnomalyDetectorTest, StallAlertAfterThreshold) {
    detector_.ObserveHeight(100);

    int alerts = 0;
    std::string message;
    for (int i = 0; i < STALL_ALERT_THRESHOLD; ++i) {
        if (auto alert = detector_.ObserveHeight(100)) {
            ++alerts;
            message = *alert;
        }
    }

    EXPECT_EQ(alerts, 1);
    EXPECT_EQ(message, "WARNING! Block height has not changed for 100 seconds.\n"
                       "Last height: 100");
    EXPECT_EQ(detector_.StallCount(), 0);
}

TEST_F(AnomalyDetectorTest, OneShortOfThresholdIsQuiet) {
    detector_.ObserveHeight(100);
    for (int i = 0; i < STALL_ALERT_THRESHOLD - 1; ++i) {
        EXPECT_FALSE(detector_.ObserveHeight(100).has_value());
    }
    EXPECT_EQ(detector_.StallCount(), STALL_ALERT_THRESHOLD - 1);
}

TEST_F(AnomalyDetectorTest, ProgressResetsStall) {
    detector_.ObserveHeight(100);
    for (int i = 0; i < 5; ++i) {
        detector_.ObserveHeight(100);
    }
    EXPECT_FALSE(detector_.ObserveHeight(101).has_value());
    EXPECT_EQ(detector_.StallCount(), 0);
}

TEST_F(AnomalyDetectorTest, TwoStallEpisodesTwoAlerts) {
    int alerts = 0;

    // First episode
    detector_.ObserveHeight(100);
    for (int i = 0; i < STALL_ALERT_THRESHOLD; ++i) {
        if (detector_.ObserveHeight(100)) ++alerts;
    }

    // Chain moves, then stalls again
    detector_.ObserveHeight(200);
    for (int i = 0; i < STALL_ALERT_THRESHOLD; ++i) {
        if (detector_.ObserveHeight(200)) ++alerts;
    }

    EXPECT_EQ(alerts, 2);
}

TEST_F(AnomalyDetectorTest, ContinuingStallRealertsAfterFullThreshold) {
    int alerts = 0;
    detector_.ObserveHeight(100);
    for (int i = 0; i < 2 * STALL_ALERT_THRESHOLD; ++i) {
        if (detector_.ObserveHeight(100)) ++alerts;
    }
    EXPECT_EQ(alerts, 2);
}

// ============================================================================
// Low Peers
// ============================================================================

TEST_F(AnomalyDetectorTest, LowPeerAlertAfterThreshold) {
    int alerts = 0;
    std::string message;
    for (int i = 0; i < LOW_PEER_ALERT_THRESHOLD; ++i) {
        if (auto alert = detector_.ObservePeers(3)) {
            ++alerts;
            message = *alert;
        }
    }

    EXPECT_EQ(alerts, 1);
    EXPECT_EQ(message, "WARNING! Low peer count for 2400 seconds.\nCurrent Count: 3");
    EXPECT_EQ(detector_.LowPeerCount(), 0);
}

TEST_F(AnomalyDetectorTest, HealthyPeersResetCounter) {
    for (int i = 0; i < LOW_PEER_ALERT_THRESHOLD - 1; ++i) {
        detector_.ObservePeers(3);
    }
    EXPECT_FALSE(detector_.ObservePeers(10).has_value());
    EXPECT_EQ(detector_.LowPeerCount(), 0);
}

TEST_F(AnomalyDetectorTest, ZeroPeersAlwaysLow) {
    AnomalyDetector lenient(0, STALL_ALERT_THRESHOLD, 2);
    EXPECT_FALSE(lenient.ObservePeers(0).has_value());
    auto alert = lenient.ObservePeers(0);
    ASSERT_TRUE(alert.has_value());
    EXPECT_NE(alert->find("Current Count: 0"), std::string::npos);
}

TEST_F(AnomalyDetectorTest, CustomThresholds) {
    AnomalyDetector quick(5, 2, 3);

    quick.ObserveHeight(7);
    EXPECT_FALSE(quick.ObserveHeight(7).has_value());
    auto stall = quick.ObserveHeight(7);
    ASSERT_TRUE(stall.has_value());
    EXPECT_NE(stall->find("20 seconds"), std::string::npos);

    EXPECT_FALSE(quick.ObservePeers(4).has_value());
    EXPECT_FALSE(quick.ObservePeers(4).has_value());
    EXPECT_TRUE(quick.ObservePeers(4).has_value());
}

} // namespace test
} // namespace staking
} // namespace stakeguard
