#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace signflow {

namespace constants {
    constexpr int kHandPoints = 21;
    constexpr int kCoordsPerPoint = 3;
    constexpr int kHandDims = kHandPoints * kCoordsPerPoint;        // 63
    constexpr int kFacePoints = 37;
    constexpr int kFaceDims = kFacePoints * kCoordsPerPoint;        // 111
    constexpr int kFrameDims = 2 * kHandDims + kFaceDims;           // 237
    constexpr int kPosePoints = 33;
    constexpr int kPoseLeftWrist = 15;
    constexpr int kPoseRightWrist = 16;
    constexpr int kWrist = 0;
    constexpr int kMiddleTip = 12;
} // namespace constants

struct Point3 {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
};

// Pose points additionally carry the detector's visibility estimate
struct PosePoint {
    Point3 position;
    float visibility{0.0f};
};

enum class HandSide {
    Left,    // signer's left hand
    Right,   // signer's right hand
    Unknown
};

struct HandLandmarks {
    std::vector<Point3> points;     // 21 points, MediaPipe order
    std::string handedness;         // detector label ("Left"/"Right")
    float score{0.0f};              // detector presence/handedness score
};

// One detector result. Ephemeral: consumed by the gate and feature extractor.
struct LandmarkFrame {
    int64_t timestamp_ms{0};
    uint32_t width{0};
    uint32_t height{0};
    uint64_t session_id{0};
    bool full_detection{true};      // false when produced by tracking only
    std::vector<HandLandmarks> hands;
    std::vector<PosePoint> pose;    // empty when no pose stream
    std::vector<Point3> face;
};

// The detector reports handedness from a mirrored camera view: its "Left"
// is the signer's right hand and vice versa.
HandSide signer_side(const std::string& handedness);
const char* side_name(HandSide side);

float distance(const Point3& a, const Point3& b);

// Wrist to middle fingertip distance, 0 when the hand is incomplete
float hand_span(const HandLandmarks& hand);

int count_nonzero_coords(const HandLandmarks& hand);

// Drops implausible hands: too small a span or mostly zero coordinates
std::vector<HandLandmarks> filter_ghost_hands(const std::vector<HandLandmarks>& hands,
                                              float min_hand_span,
                                              int min_valid_values);

// Hand for the given signer side, or nullptr
const HandLandmarks* find_hand(const LandmarkFrame& frame, HandSide side);

} // namespace signflow
