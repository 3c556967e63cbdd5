#include <gtest/gtest.h>
#include "signflow/motion_analysis.hpp"
#include <string>

using namespace signflow;

namespace {

HandLandmarks make_hand(const std::string& label, float cx, float cy) {
    HandLandmarks hand;
    hand.handedness = label;
    hand.score = 0.9f;
    for (int i = 0; i < constants::kHandPoints; ++i) {
        hand.points.push_back({cx + 0.005f * i, cy - 0.0125f * i, 0.01f});
    }
    return hand;
}

LandmarkFrame frame_at(int64_t t, float wrist_y) {
    LandmarkFrame frame;
    frame.timestamp_ms = t;
    frame.hands.push_back(make_hand("Left", 0.5f, wrist_y));
    return frame;
}

} // namespace

// Test static vs dynamic classification
TEST(MotionVarianceTest, StillWristIsStatic) {
    MotionVarianceDetector detector;
    for (int i = 0; i < 10; ++i) detector.add_sample({0.5f, 0.5f, 0.0f});
    EXPECT_TRUE(detector.has_enough_data());
    EXPECT_FLOAT_EQ(detector.variance(), 0.0f);
    EXPECT_FALSE(detector.is_dynamic());
}

TEST(MotionVarianceTest, MovingWristIsDynamic) {
    MotionVarianceDetector detector;
    for (int i = 0; i < 10; ++i) {
        detector.add_sample({i % 2 == 0 ? 0.0f : 0.5f, 0.5f, 0.0f});
    }
    EXPECT_NEAR(detector.variance(), 0.0625f, 1e-5f);
    EXPECT_TRUE(detector.is_dynamic());
}

TEST(MotionVarianceTest, NeedsMinimumSamples) {
    MotionVarianceDetector detector(10, 0.01f, 5);
    for (int i = 0; i < 4; ++i) detector.add_sample({i * 0.3f, 0.0f, 0.0f});
    EXPECT_FALSE(detector.has_enough_data());
    EXPECT_FALSE(detector.is_dynamic());
}

TEST(MotionVarianceTest, WindowDropsOldSamples) {
    MotionVarianceDetector detector(4, 0.01f, 2);
    detector.add_sample({0.0f, 0.0f, 0.0f});
    detector.add_sample({1.0f, 0.0f, 0.0f});
    for (int i = 0; i < 4; ++i) detector.add_sample({0.5f, 0.5f, 0.0f});
    EXPECT_FLOAT_EQ(detector.variance(), 0.0f);
}

TEST(MotionVarianceTest, PrefersSignerRightWrist) {
    MotionVarianceDetector detector(10, 0.01f, 1);
    LandmarkFrame frame;
    frame.hands.push_back(make_hand("Right", 0.1f, 0.9f));   // signer-left
    frame.hands.push_back(make_hand("Left", 0.7f, 0.3f));    // signer-right
    detector.add_frame(frame);
    detector.add_sample({0.7f, 0.3f, 0.01f});
    EXPECT_NEAR(detector.variance(), 0.0f, 1e-6f);

    detector.reset();
    EXPECT_FALSE(detector.has_enough_data());
    detector.add_frame(LandmarkFrame{});
    EXPECT_FALSE(detector.has_enough_data());
}

// Test the hands-down boundary
TEST(HandsDownTest, FiresOnceAfterHold) {
    HandsDownDetector detector(1500, 0.9f);
    EXPECT_FALSE(detector.update(frame_at(0, 0.95f)));
    EXPECT_TRUE(detector.hands_down());
    EXPECT_FALSE(detector.update(frame_at(1000, 0.95f)));
    EXPECT_FALSE(detector.update(frame_at(1500, 0.95f)));
    EXPECT_TRUE(detector.update(frame_at(1501, 0.95f)));
    EXPECT_FALSE(detector.update(frame_at(3000, 0.95f)));
}

TEST(HandsDownTest, RaisingHandRearms) {
    HandsDownDetector detector(1500, 0.9f);
    detector.update(frame_at(0, 0.95f));
    EXPECT_TRUE(detector.update(frame_at(1600, 0.95f)));

    EXPECT_FALSE(detector.update(frame_at(1700, 0.5f)));
    EXPECT_FALSE(detector.hands_down());

    EXPECT_FALSE(detector.update(frame_at(2000, 0.95f)));
    EXPECT_FALSE(detector.update(frame_at(3400, 0.95f)));
    EXPECT_TRUE(detector.update(frame_at(3501, 0.95f)));
}

TEST(HandsDownTest, NoHandsCountsAsDown) {
    HandsDownDetector detector(1000, 0.9f);
    LandmarkFrame empty;
    empty.timestamp_ms = 0;
    EXPECT_FALSE(detector.update(empty));
    empty.timestamp_ms = 1200;
    EXPECT_TRUE(detector.update(empty));
}

TEST(HandsDownTest, ZeroHoldDisables) {
    HandsDownDetector detector(0, 0.9f);
    EXPECT_FALSE(detector.update(frame_at(0, 0.95f)));
    EXPECT_FALSE(detector.update(frame_at(10000, 0.95f)));
    EXPECT_FALSE(detector.hands_down());
}
