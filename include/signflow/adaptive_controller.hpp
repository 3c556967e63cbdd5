#pragma once

#include "signflow/pipeline_config.hpp"
#include <cstdint>
#include <deque>
#include <functional>

namespace signflow {

enum class AdaptiveStep {
    None,
    Throttle,   // fps under target: skip more, detect less often
    Relax       // fps over target: back toward full rate
};

/**
 * Two-threshold ratchet over the realized frame rate.
 *
 * Frame intervals are averaged over the last fps_window_frames frames.
 * The rate is compared with the target once per interval_ms and at most
 * one step is taken per comparison.
 */
class AdaptiveController {
public:
    using DegradedCallback = std::function<void(float fps)>;

    AdaptiveController();
    AdaptiveController(const AdaptiveConfig& config, const CadenceConfig& cadence);

    // Call once per frame the worker picks up
    AdaptiveStep record_frame(int64_t timestamp_ms);

    float current_fps() const;
    int frame_skip() const { return frame_skip_; }
    int cadence() const { return cadence_; }
    bool degraded() const { return degraded_; }

    // Fired once when the rate stays far below target
    void set_degraded_callback(DegradedCallback callback) { on_degraded_ = std::move(callback); }

    void configure(const AdaptiveConfig& config, const CadenceConfig& cadence);
    const AdaptiveConfig& get_config() const { return config_; }
    void reset();

    bool verbose{false};

private:
    AdaptiveStep evaluate();

    AdaptiveConfig config_;
    int base_cadence_{5};
    int frame_skip_{1};
    int cadence_{5};

    std::deque<int64_t> intervals_;
    int64_t interval_sum_{0};
    int64_t last_frame_ms_{-1};
    int64_t last_eval_ms_{-1};

    int low_intervals_{0};
    bool degraded_{false};
    DegradedCallback on_degraded_;
};

} // namespace signflow
