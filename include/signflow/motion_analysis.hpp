#pragma once

#include "signflow/landmarks.hpp"
#include <cstdint>
#include <deque>

namespace signflow {

// Static vs dynamic sign classification from wrist position variance
class MotionVarianceDetector {
public:
    explicit MotionVarianceDetector(size_t window_size = 10, float variance_threshold = 0.01f,
                                    size_t min_samples = 5);

    void add_frame(const LandmarkFrame& frame);
    void add_sample(const Point3& wrist);

    bool has_enough_data() const { return samples_.size() >= min_samples_; }
    float variance() const;
    bool is_dynamic() const { return has_enough_data() && variance() > threshold_; }
    void reset() { samples_.clear(); }

private:
    size_t window_size_;
    float threshold_;
    size_t min_samples_;
    std::deque<Point3> samples_;
};

// Reports "hands down" once every visible wrist has stayed below the
// configured line (or no hand was visible) for longer than hold_ms.
// Fires once per lowering; raising a hand re-arms it.
class HandsDownDetector {
public:
    HandsDownDetector(int64_t hold_ms = 1500, float wrist_y = 0.9f);

    // True on the frame the hold time is first exceeded
    bool update(const LandmarkFrame& frame);

    bool hands_down() const { return down_since_ms_ >= 0; }
    void configure(int64_t hold_ms, float wrist_y);
    void reset();

private:
    int64_t hold_ms_;
    float wrist_y_;
    int64_t down_since_ms_{-1};
    bool fired_{false};
};

} // namespace signflow
