#include "signflow/landmarks.hpp"
#include <cmath>

namespace signflow {

HandSide signer_side(const std::string& handedness) {
    if (handedness == "Left") return HandSide::Right;
    if (handedness == "Right") return HandSide::Left;
    return HandSide::Unknown;
}

const char* side_name(HandSide side) {
    switch (side) {
        case HandSide::Left: return "left";
        case HandSide::Right: return "right";
        default: return "unknown";
    }
}

float distance(const Point3& a, const Point3& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    float dz = a.z - b.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

float hand_span(const HandLandmarks& hand) {
    if (hand.points.size() <= static_cast<size_t>(constants::kMiddleTip)) return 0.0f;
    return distance(hand.points[constants::kWrist], hand.points[constants::kMiddleTip]);
}

int count_nonzero_coords(const HandLandmarks& hand) {
    int count = 0;
    for (const auto& p : hand.points) {
        if (p.x != 0.0f) ++count;
        if (p.y != 0.0f) ++count;
        if (p.z != 0.0f) ++count;
    }
    return count;
}

std::vector<HandLandmarks> filter_ghost_hands(const std::vector<HandLandmarks>& hands,
                                              float min_hand_span,
                                              int min_valid_values) {
    std::vector<HandLandmarks> kept;
    kept.reserve(hands.size());
    for (const auto& hand : hands) {
        if (signer_side(hand.handedness) == HandSide::Unknown) continue;
        if (count_nonzero_coords(hand) < min_valid_values) continue;
        if (hand_span(hand) < min_hand_span) continue;
        kept.push_back(hand);
    }
    return kept;
}

const HandLandmarks* find_hand(const LandmarkFrame& frame, HandSide side) {
    for (const auto& hand : frame.hands) {
        if (signer_side(hand.handedness) == side) return &hand;
    }
    return nullptr;
}

} // namespace signflow
