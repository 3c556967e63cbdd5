#include <gtest/gtest.h>
#include "signflow/confidence_gate.hpp"
#include <string>

using namespace signflow;

namespace {

HandLandmarks make_hand(const std::string& label, float score, float cx, float cy) {
    HandLandmarks hand;
    hand.handedness = label;
    hand.score = score;
    for (int i = 0; i < constants::kHandPoints; ++i) {
        hand.points.push_back({cx + 0.005f * i, cy - 0.0125f * i, 0.01f});
    }
    return hand;
}

// Signer-right hand ("Left" from the detector) at (cx, 0.6)
LandmarkFrame hand_frame(float score, float cx = 0.5f) {
    LandmarkFrame frame;
    frame.hands.push_back(make_hand("Left", score, cx, 0.6f));
    return frame;
}

// Adds a pose whose signer-right wrist sits at (x, y)
void add_pose(LandmarkFrame& frame, float x, float y, float visibility) {
    frame.pose.assign(constants::kPosePoints, PosePoint{});
    frame.pose[constants::kPoseRightWrist] = PosePoint{{x, y, 0.0f}, visibility};
}

} // namespace

class ConfidenceGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.require_pose_anchor = false;
        config_.acquire_confidence = 0.70f;
        config_.acquire_frames = 2;
        config_.hold_confidence = 0.40f;
        config_.hold_frames = 1;
        config_.skip_after_still_frames = 5;
        config_.motion_threshold = 0.02f;
    }

    GateConfig config_;
};

// Test acquire/hold asymmetry
TEST_F(ConfidenceGateTest, AcquireThenHoldAtLowerConfidence) {
    ConfidenceGate gate(config_);

    EXPECT_EQ(gate.admit(hand_frame(0.75f)), GateDecision::Reject);
    EXPECT_EQ(gate.state(HandSide::Right), TrackState::Searching);
    EXPECT_EQ(gate.admit(hand_frame(0.75f)), GateDecision::Process);
    EXPECT_EQ(gate.state(HandSide::Right), TrackState::Acquired);

    // Below C_acquire but above C_hold keeps the hand
    LandmarkFrame admitted;
    EXPECT_EQ(gate.admit(hand_frame(0.45f), &admitted), GateDecision::Process);
    EXPECT_EQ(admitted.hands.size(), 1u);

    // Below C_hold releases it after N_hold frames
    EXPECT_EQ(gate.admit(hand_frame(0.35f)), GateDecision::Reject);
    EXPECT_EQ(gate.state(HandSide::Right), TrackState::Searching);

    // Back to searching: C_hold is no longer enough
    EXPECT_EQ(gate.admit(hand_frame(0.45f)), GateDecision::Reject);
}

TEST_F(ConfidenceGateTest, AcquireNeedsConsecutiveFrames) {
    ConfidenceGate gate(config_);
    EXPECT_EQ(gate.admit(hand_frame(0.75f)), GateDecision::Reject);
    EXPECT_EQ(gate.admit(hand_frame(0.50f)), GateDecision::Reject);
    EXPECT_EQ(gate.admit(hand_frame(0.75f)), GateDecision::Reject);
    EXPECT_EQ(gate.admit(hand_frame(0.75f)), GateDecision::Process);
}

TEST_F(ConfidenceGateTest, HoldFramesToleratesShortDips) {
    config_.hold_frames = 3;
    ConfidenceGate gate(config_);
    gate.admit(hand_frame(0.9f));
    gate.admit(hand_frame(0.9f));
    ASSERT_EQ(gate.state(HandSide::Right), TrackState::Acquired);

    EXPECT_EQ(gate.admit(hand_frame(0.2f)), GateDecision::Reject);
    EXPECT_EQ(gate.admit(hand_frame(0.2f)), GateDecision::Reject);
    EXPECT_EQ(gate.state(HandSide::Right), TrackState::Acquired);
    EXPECT_EQ(gate.admit(hand_frame(0.5f)), GateDecision::Process);

    gate.admit(hand_frame(0.2f));
    gate.admit(hand_frame(0.2f));
    gate.admit(hand_frame(0.2f));
    EXPECT_EQ(gate.state(HandSide::Right), TrackState::Searching);
}

TEST_F(ConfidenceGateTest, MissingHandCountsAsMiss) {
    ConfidenceGate gate(config_);
    gate.admit(hand_frame(0.9f));
    gate.admit(hand_frame(0.9f));
    ASSERT_EQ(gate.state(HandSide::Right), TrackState::Acquired);

    EXPECT_EQ(gate.admit(LandmarkFrame{}), GateDecision::Reject);
    EXPECT_EQ(gate.state(HandSide::Right), TrackState::Searching);
}

TEST_F(ConfidenceGateTest, LowTrustResetsEntity) {
    ConfidenceGate gate(config_);
    EXPECT_FALSE(gate.update_track(HandSide::Left, 0.9f, 1.0f));
    EXPECT_TRUE(gate.update_track(HandSide::Left, 0.9f, 1.0f));
    EXPECT_EQ(gate.state(HandSide::Left), TrackState::Acquired);

    EXPECT_FALSE(gate.update_track(HandSide::Left, 0.9f, 0.2f));
    EXPECT_EQ(gate.state(HandSide::Left), TrackState::Searching);
}

// Test pose anchoring
TEST_F(ConfidenceGateTest, PoseAnchorRequiredWhenEnabled) {
    config_.require_pose_anchor = true;
    ConfidenceGate gate(config_);

    // No pose at all
    gate.admit(hand_frame(0.9f));
    EXPECT_EQ(gate.admit(hand_frame(0.9f)), GateDecision::Reject);

    // Visible pose wrist on top of the hand wrist
    LandmarkFrame anchored = hand_frame(0.9f);
    add_pose(anchored, 0.5f, 0.6f, 0.9f);
    gate.admit(anchored);
    EXPECT_EQ(gate.admit(anchored), GateDecision::Process);
}

TEST_F(ConfidenceGateTest, PoseAnchorTrust) {
    config_.require_pose_anchor = true;
    ConfidenceGate gate(config_);

    LandmarkFrame frame = hand_frame(0.9f);
    add_pose(frame, 0.5f, 0.6f, 0.8f);
    EXPECT_FLOAT_EQ(gate.hand_trust(frame, frame.hands[0]), 0.8f);

    LandmarkFrame far = hand_frame(0.9f);
    add_pose(far, 0.9f, 0.2f, 0.9f);
    EXPECT_FLOAT_EQ(gate.hand_trust(far, far.hands[0]), 0.0f);

    LandmarkFrame dim = hand_frame(0.9f);
    add_pose(dim, 0.5f, 0.6f, 0.3f);
    gate.admit(dim);
    EXPECT_EQ(gate.admit(dim), GateDecision::Reject);
}

TEST_F(ConfidenceGateTest, JumpingPoseAnchorIsNotTrusted) {
    config_.require_pose_anchor = true;
    ConfidenceGate gate(config_);

    LandmarkFrame first = hand_frame(0.9f, 0.1f);
    add_pose(first, 0.1f, 0.6f, 0.9f);
    gate.admit(first);

    LandmarkFrame jumped = hand_frame(0.9f, 0.6f);
    add_pose(jumped, 0.6f, 0.6f, 0.9f);
    EXPECT_FLOAT_EQ(gate.hand_trust(jumped, jumped.hands[0]), 0.0f);
}

// Test motion gating
TEST_F(ConfidenceGateTest, StillHandsAreSkippedAfterThreshold) {
    ConfidenceGate gate(config_);
    gate.admit(hand_frame(0.9f));
    EXPECT_EQ(gate.admit(hand_frame(0.9f)), GateDecision::Process);

    for (int i = 1; i <= 5; ++i) {
        EXPECT_EQ(gate.admit(hand_frame(0.9f)), GateDecision::Process) << "still frame " << i;
        EXPECT_EQ(gate.still_frames(), i);
    }
    EXPECT_EQ(gate.admit(hand_frame(0.9f)), GateDecision::Skip);
    EXPECT_EQ(gate.admit(hand_frame(0.9f)), GateDecision::Skip);

    // Movement resumes processing
    EXPECT_EQ(gate.admit(hand_frame(0.9f, 0.6f)), GateDecision::Process);
    EXPECT_EQ(gate.still_frames(), 0);
    EXPECT_GT(gate.last_displacement(), 0.02f);
}

TEST_F(ConfidenceGateTest, MotionRestartsAfterGap) {
    ConfidenceGate gate(config_);
    gate.admit(hand_frame(0.9f));
    EXPECT_EQ(gate.admit(hand_frame(0.9f)), GateDecision::Process);

    // Hands leave, then come back elsewhere
    EXPECT_EQ(gate.admit(LandmarkFrame{}), GateDecision::Reject);
    EXPECT_EQ(gate.admit(hand_frame(0.9f, 0.8f)), GateDecision::Reject);
    EXPECT_EQ(gate.admit(hand_frame(0.9f, 0.8f)), GateDecision::Process);

    // No displacement against the hands from before the gap
    EXPECT_FLOAT_EQ(gate.last_displacement(), 0.0f);
    EXPECT_EQ(gate.still_frames(), 0);
}

TEST_F(ConfidenceGateTest, ZeroDisablesStillSkipping) {
    config_.skip_after_still_frames = 0;
    ConfidenceGate gate(config_);
    for (int i = 0; i < 20; ++i) gate.admit(hand_frame(0.9f));
    EXPECT_EQ(gate.admit(hand_frame(0.9f)), GateDecision::Process);
}

TEST_F(ConfidenceGateTest, GhostHandsNeverReachTracking) {
    ConfidenceGate gate(config_);
    LandmarkFrame frame;
    HandLandmarks ghost = make_hand("Left", 0.99f, 0.5f, 0.6f);
    for (auto& p : ghost.points) {
        p.x = 0.5f;
        p.y = 0.6f;
    }
    frame.hands.push_back(ghost);
    gate.admit(frame);
    EXPECT_EQ(gate.admit(frame), GateDecision::Reject);
    EXPECT_EQ(gate.state(HandSide::Right), TrackState::Searching);
}

TEST_F(ConfidenceGateTest, EmptyFrameRejected) {
    ConfidenceGate gate(config_);
    LandmarkFrame admitted;
    EXPECT_EQ(gate.admit(LandmarkFrame{}, &admitted), GateDecision::Reject);
    EXPECT_TRUE(admitted.hands.empty());
    EXPECT_STREQ(decision_name(GateDecision::Reject), "reject");
}
