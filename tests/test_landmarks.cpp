#include <gtest/gtest.h>
#include "signflow/landmarks.hpp"
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

} // namespace

// The detector labels hands from a mirrored view
TEST(LandmarksTest, SignerSideSwapsDetectorLabels) {
    EXPECT_EQ(signer_side("Left"), HandSide::Right);
    EXPECT_EQ(signer_side("Right"), HandSide::Left);
}

TEST(LandmarksTest, UnknownHandednessLabels) {
    EXPECT_EQ(signer_side(""), HandSide::Unknown);
    EXPECT_EQ(signer_side("left"), HandSide::Unknown);
    EXPECT_EQ(signer_side("Both"), HandSide::Unknown);
    EXPECT_STREQ(side_name(HandSide::Unknown), "unknown");
}

TEST(LandmarksTest, HandSpanIsWristToMiddleTip) {
    HandLandmarks hand = make_hand("Left", 0.9f, 0.5f, 0.8f);
    float expected = distance(hand.points[constants::kWrist], hand.points[constants::kMiddleTip]);
    EXPECT_FLOAT_EQ(hand_span(hand), expected);
    EXPECT_GT(hand_span(hand), 0.08f);

    HandLandmarks partial;
    partial.points.resize(5);
    EXPECT_FLOAT_EQ(hand_span(partial), 0.0f);
}

TEST(LandmarksTest, GhostFilterKeepsPlausibleHands) {
    std::vector<HandLandmarks> hands = {make_hand("Left", 0.9f, 0.5f, 0.8f),
                                        make_hand("Right", 0.9f, 0.2f, 0.8f)};
    auto kept = filter_ghost_hands(hands, 0.08f, 15);
    EXPECT_EQ(kept.size(), 2u);
}

TEST(LandmarksTest, GhostFilterDropsTinyHands) {
    HandLandmarks hand = make_hand("Left", 0.9f, 0.5f, 0.8f);
    for (auto& p : hand.points) {
        p.x = 0.5f + (p.x - 0.5f) * 0.1f;
        p.y = 0.8f + (p.y - 0.8f) * 0.1f;
    }
    EXPECT_LT(hand_span(hand), 0.08f);
    EXPECT_TRUE(filter_ghost_hands({hand}, 0.08f, 15).empty());
}

TEST(LandmarksTest, GhostFilterDropsMostlyZeroHands) {
    HandLandmarks hand = make_hand("Left", 0.9f, 0.5f, 0.8f);
    for (size_t i = 1; i < hand.points.size(); ++i) {
        if (i == constants::kMiddleTip) continue;
        hand.points[i] = Point3{};
    }
    EXPECT_LT(count_nonzero_coords(hand), 15);
    EXPECT_TRUE(filter_ghost_hands({hand}, 0.08f, 15).empty());
}

TEST(LandmarksTest, GhostFilterDropsUnlabelledHands) {
    HandLandmarks hand = make_hand("", 0.9f, 0.5f, 0.8f);
    EXPECT_TRUE(filter_ghost_hands({hand}, 0.08f, 15).empty());
}

TEST(LandmarksTest, FindHandUsesSignerSide) {
    LandmarkFrame frame;
    frame.hands.push_back(make_hand("Left", 0.9f, 0.5f, 0.8f));

    const HandLandmarks* right = find_hand(frame, HandSide::Right);
    ASSERT_NE(right, nullptr);
    EXPECT_EQ(right->handedness, "Left");
    EXPECT_EQ(find_hand(frame, HandSide::Left), nullptr);
}
