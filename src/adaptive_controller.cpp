#include "signflow/adaptive_controller.hpp"
#include <algorithm>
#include <iostream>

namespace signflow {

AdaptiveController::AdaptiveController() {
    reset();
}

AdaptiveController::AdaptiveController(const AdaptiveConfig& config, const CadenceConfig& cadence) {
    configure(config, cadence);
}

void AdaptiveController::configure(const AdaptiveConfig& config, const CadenceConfig& cadence) {
    config_ = config;
    base_cadence_ = cadence.detect_cadence;
    reset();
}

void AdaptiveController::reset() {
    frame_skip_ = std::clamp(config_.base_skip, config_.min_skip, config_.max_skip);
    cadence_ = base_cadence_;
    intervals_.clear();
    interval_sum_ = 0;
    last_frame_ms_ = -1;
    last_eval_ms_ = -1;
    low_intervals_ = 0;
    degraded_ = false;
}

float AdaptiveController::current_fps() const {
    if (intervals_.empty() || interval_sum_ <= 0) return 0.0f;
    double mean = static_cast<double>(interval_sum_) / static_cast<double>(intervals_.size());
    return static_cast<float>(1000.0 / mean);
}

AdaptiveStep AdaptiveController::record_frame(int64_t timestamp_ms) {
    if (last_frame_ms_ >= 0 && timestamp_ms > last_frame_ms_) {
        int64_t interval = timestamp_ms - last_frame_ms_;
        intervals_.push_back(interval);
        interval_sum_ += interval;
        while (intervals_.size() > static_cast<size_t>(config_.fps_window_frames)) {
            interval_sum_ -= intervals_.front();
            intervals_.pop_front();
        }
    }
    last_frame_ms_ = timestamp_ms;

    if (last_eval_ms_ < 0) {
        last_eval_ms_ = timestamp_ms;
        return AdaptiveStep::None;
    }
    if (timestamp_ms - last_eval_ms_ < config_.interval_ms) return AdaptiveStep::None;
    last_eval_ms_ = timestamp_ms;
    return evaluate();
}

AdaptiveStep AdaptiveController::evaluate() {
    float fps = current_fps();
    if (fps <= 0.0f) return AdaptiveStep::None;

    float target = config_.target_fps;
    if (fps < target * config_.degraded_ratio) {
        ++low_intervals_;
        if (!degraded_ && low_intervals_ >= config_.degraded_intervals) {
            degraded_ = true;
            std::cerr << "[Adaptive] Performance degraded: " << fps << " fps against target "
                      << target << "\n";
            if (on_degraded_) on_degraded_(fps);
        }
    } else {
        low_intervals_ = 0;
        degraded_ = false;
    }

    if (!config_.enabled) return AdaptiveStep::None;

    AdaptiveStep step = AdaptiveStep::None;
    if (fps < target * config_.low_ratio) {
        int skip = std::min(frame_skip_ + 1, config_.max_skip);
        int cadence = std::min(cadence_ + 1, config_.max_cadence);
        if (skip != frame_skip_ || cadence != cadence_) step = AdaptiveStep::Throttle;
        frame_skip_ = skip;
        cadence_ = cadence;
    } else if (fps > target * config_.high_ratio) {
        int skip = std::max(frame_skip_ - 1, config_.min_skip);
        int cadence = std::max(cadence_ - 1, config_.min_cadence);
        if (skip != frame_skip_ || cadence != cadence_) step = AdaptiveStep::Relax;
        frame_skip_ = skip;
        cadence_ = cadence;
    }

    if (verbose && step != AdaptiveStep::None) {
        std::cerr << "[Adaptive] fps=" << fps << " target=" << target << " skip=" << frame_skip_
                  << " cadence=" << cadence_ << "\n";
    }
    return step;
}

} // namespace signflow
