#include "signflow/motion_analysis.hpp"

namespace signflow {

MotionVarianceDetector::MotionVarianceDetector(size_t window_size, float variance_threshold,
                                               size_t min_samples)
    : window_size_(window_size == 0 ? 1 : window_size),
      threshold_(variance_threshold),
      min_samples_(min_samples) {
}

void MotionVarianceDetector::add_frame(const LandmarkFrame& frame) {
    // Dominant hand first: the signer's right, then left
    const HandLandmarks* hand = find_hand(frame, HandSide::Right);
    if (!hand || hand->points.empty()) hand = find_hand(frame, HandSide::Left);
    if (!hand || hand->points.empty()) return;
    add_sample(hand->points[constants::kWrist]);
}

void MotionVarianceDetector::add_sample(const Point3& wrist) {
    samples_.push_back(wrist);
    while (samples_.size() > window_size_) samples_.pop_front();
}

float MotionVarianceDetector::variance() const {
    if (samples_.empty()) return 0.0f;
    float mx = 0.0f, my = 0.0f, mz = 0.0f;
    for (const auto& p : samples_) {
        mx += p.x; my += p.y; mz += p.z;
    }
    float n = static_cast<float>(samples_.size());
    mx /= n; my /= n; mz /= n;

    float acc = 0.0f;
    for (const auto& p : samples_) {
        float dx = p.x - mx, dy = p.y - my, dz = p.z - mz;
        acc += dx * dx + dy * dy + dz * dz;
    }
    return acc / n;
}

// ---------------------------------------------------------------------------

HandsDownDetector::HandsDownDetector(int64_t hold_ms, float wrist_y)
    : hold_ms_(hold_ms), wrist_y_(wrist_y) {
}

void HandsDownDetector::configure(int64_t hold_ms, float wrist_y) {
    hold_ms_ = hold_ms;
    wrist_y_ = wrist_y;
}

void HandsDownDetector::reset() {
    down_since_ms_ = -1;
    fired_ = false;
}

bool HandsDownDetector::update(const LandmarkFrame& frame) {
    if (hold_ms_ <= 0) return false;

    bool raised = false;
    for (const auto& hand : frame.hands) {
        if (hand.points.empty()) continue;
        if (hand.points[constants::kWrist].y <= wrist_y_) {
            raised = true;
            break;
        }
    }

    if (raised) {
        reset();
        return false;
    }
    if (down_since_ms_ < 0) down_since_ms_ = frame.timestamp_ms;
    if (!fired_ && frame.timestamp_ms - down_since_ms_ > hold_ms_) {
        fired_ = true;
        return true;
    }
    return false;
}

} // namespace signflow
