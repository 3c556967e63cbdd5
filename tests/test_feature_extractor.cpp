#include <gtest/gtest.h>
#include "signflow/feature_extractor.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

using namespace signflow;

namespace {

LandmarkFrame frame_with_hand(int64_t t, float cx = 0.5f) {
    LandmarkFrame frame;
    frame.timestamp_ms = t;
    HandLandmarks hand;
    hand.handedness = "Left";
    hand.score = 0.9f;
    for (int i = 0; i < constants::kHandPoints; ++i) {
        hand.points.push_back({cx + 0.005f * i, 0.8f - 0.0125f * i, 0.01f});
    }
    frame.hands.push_back(hand);
    return frame;
}

} // namespace

class FeatureExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.window_length = 30;
        config_.frame_dims = constants::kFrameDims;
        config_.reset_after_inference = false;
    }

    FeatureConfig config_;
};

TEST_F(FeatureExtractorTest, InitAcceptsDefaultLayout) {
    FeatureExtractor extractor;
    EXPECT_TRUE(extractor.init(config_));
    EXPECT_EQ(extractor.buffered(), 0u);
}

TEST_F(FeatureExtractorTest, InitRejectsWrongFrameWidth) {
    config_.frame_dims = 200;
    FeatureExtractor extractor;
    EXPECT_FALSE(extractor.init(config_));
}

TEST_F(FeatureExtractorTest, InitRejectsMissingScaler) {
    config_.scaler_path = "/nonexistent/scaler.json";
    FeatureExtractor extractor;
    EXPECT_FALSE(extractor.init(config_));
}

TEST_F(FeatureExtractorTest, NoWindowUntilFull) {
    FeatureExtractor extractor;
    ASSERT_TRUE(extractor.init(config_));

    for (int i = 0; i < 29; ++i) {
        EXPECT_FALSE(extractor.process(frame_with_hand(i * 33), i * 33).has_value()) << "frame " << i;
    }
    auto window = extractor.process(frame_with_hand(29 * 33), 29 * 33);
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->frames, 30);
    EXPECT_EQ(window->dims, constants::kFrameDims);
    EXPECT_EQ(window->data.size(), static_cast<size_t>(30 * constants::kFrameDims));
    EXPECT_EQ(window->start_ms, 0);
    EXPECT_EQ(window->end_ms, 29 * 33);
}

TEST_F(FeatureExtractorTest, SlidingWindowEmitsEveryFrame) {
    FeatureExtractor extractor;
    ASSERT_TRUE(extractor.init(config_));
    for (int i = 0; i < 30; ++i) (void)extractor.process(frame_with_hand(i), i);

    for (int i = 30; i < 40; ++i) {
        auto window = extractor.process(frame_with_hand(i), i);
        ASSERT_TRUE(window.has_value());
        EXPECT_EQ(window->start_ms, i - 29);
        EXPECT_EQ(window->end_ms, i);
    }
    EXPECT_EQ(extractor.buffered(), 30u);
}

TEST_F(FeatureExtractorTest, ResetModeRefillsBeforeNextWindow) {
    config_.reset_after_inference = true;
    FeatureExtractor extractor;
    ASSERT_TRUE(extractor.init(config_));

    int windows = 0;
    for (int i = 0; i < 60; ++i) {
        auto window = extractor.process(frame_with_hand(i), i);
        if (window) {
            ++windows;
            EXPECT_TRUE(i == 29 || i == 59) << "unexpected window at frame " << i;
        }
    }
    EXPECT_EQ(windows, 2);
    EXPECT_EQ(extractor.buffered(), 0u);
}

TEST_F(FeatureExtractorTest, WidthMismatchThrows) {
    FeatureExtractor extractor;
    ASSERT_TRUE(extractor.init(config_));
    EXPECT_THROW(extractor.process_vector(std::vector<float>(200, 0.0f), 0), std::invalid_argument);
    EXPECT_NO_THROW(extractor.process_vector(std::vector<float>(constants::kFrameDims, 0.0f), 0));
}

TEST_F(FeatureExtractorTest, ResetClearsBuffer) {
    FeatureExtractor extractor;
    ASSERT_TRUE(extractor.init(config_));
    for (int i = 0; i < 10; ++i) (void)extractor.process(frame_with_hand(i), i);
    EXPECT_EQ(extractor.buffered(), 10u);
    extractor.reset();
    EXPECT_EQ(extractor.buffered(), 0u);
}

// scaled = (x - 0.5) * 2, missing entities stay zero
TEST(FeatureLayoutTest, ScalingContract) {
    LandmarkFrame frame;
    HandLandmarks hand;
    hand.handedness = "Right";   // signer's left hand
    hand.points.assign(constants::kHandPoints, Point3{0.5f, 0.75f, 0.25f});
    frame.hands.push_back(hand);

    std::vector<float> v = FeatureExtractor::frame_vector(frame);
    ASSERT_EQ(v.size(), static_cast<size_t>(constants::kFrameDims));
    EXPECT_FLOAT_EQ(v[0], 0.0f);
    EXPECT_FLOAT_EQ(v[1], 0.5f);
    EXPECT_FLOAT_EQ(v[2], -0.5f);

    // Signer-right hand and face are missing
    for (int i = constants::kHandDims; i < constants::kFrameDims; ++i) {
        EXPECT_FLOAT_EQ(v[i], 0.0f) << "index " << i;
    }
}

TEST(FeatureLayoutTest, SignerRightHandFillsSecondBlock) {
    LandmarkFrame frame;
    HandLandmarks hand;
    hand.handedness = "Left";    // signer's right hand
    hand.points.assign(constants::kHandPoints, Point3{1.0f, 0.0f, 0.5f});
    frame.hands.push_back(hand);

    std::vector<float> v = FeatureExtractor::frame_vector(frame);
    EXPECT_FLOAT_EQ(v[0], 0.0f);
    EXPECT_FLOAT_EQ(v[constants::kHandDims + 0], 1.0f);
    EXPECT_FLOAT_EQ(v[constants::kHandDims + 1], -1.0f);
    EXPECT_FLOAT_EQ(v[constants::kHandDims + 2], 0.0f);
}

TEST(FeatureLayoutTest, FaceUsesFirstPointsOnly) {
    LandmarkFrame frame;
    frame.face.assign(100, Point3{1.0f, 1.0f, 1.0f});
    std::vector<float> v = FeatureExtractor::frame_vector(frame);
    ASSERT_EQ(v.size(), static_cast<size_t>(constants::kFrameDims));
    EXPECT_FLOAT_EQ(v[2 * constants::kHandDims], 1.0f);
    EXPECT_FLOAT_EQ(v[constants::kFrameDims - 1], 1.0f);
}

TEST(FeatureScalerTest, LoadsStandardization) {
    nlohmann::json j;
    j["mean"] = std::vector<float>(4, 1.0f);
    j["std"] = std::vector<float>{2.0f, 2.0f, 0.0f, 4.0f};

    FeatureScaler scaler;
    ASSERT_TRUE(scaler.load_from_string(j.dump(), 4));
    EXPECT_TRUE(scaler.has_standardization());

    std::vector<float> v{3.0f, 1.0f, 2.0f, 5.0f};
    scaler.standardize(v);
    EXPECT_FLOAT_EQ(v[0], 1.0f);
    EXPECT_FLOAT_EQ(v[1], 0.0f);
    EXPECT_FLOAT_EQ(v[2], 1.0f);   // zero std treated as 1
    EXPECT_FLOAT_EQ(v[3], 1.0f);
}

TEST(FeatureScalerTest, RejectsWrongDimensions) {
    nlohmann::json j;
    j["mean"] = std::vector<float>(3, 0.0f);
    j["std"] = std::vector<float>(3, 1.0f);
    FeatureScaler scaler;
    EXPECT_FALSE(scaler.load_from_string(j.dump(), 4));
    EXPECT_FALSE(scaler.load_from_string("not json", 4));
    EXPECT_FALSE(scaler.has_standardization());
}
