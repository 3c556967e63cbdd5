#include "signflow/cadence_controller.hpp"
#include <algorithm>
#include <iostream>

namespace signflow {

CadenceController::CadenceController()
    : CadenceController(CadenceConfig{}) {
}

CadenceController::CadenceController(const CadenceConfig& config)
    : config_(config), default_cadence_(std::max(1, config.detect_cadence)) {
    reset();
}

void CadenceController::set_config(const CadenceConfig& config) {
    config_ = config;
    set_default_cadence(config.detect_cadence);
}

void CadenceController::reset() {
    state_ = CadenceState{};
    state_.cadence = default_cadence_;
}

void CadenceController::set_default_cadence(int cadence) {
    cadence = std::max(1, cadence);
    if (cadence == default_cadence_) return;
    bool at_default = state_.cadence == default_cadence_;
    default_cadence_ = cadence;
    // A drift-reduced cadence stays reduced until tracking recovers
    if (at_default) state_.cadence = default_cadence_;
}

bool CadenceController::should_run_full_detection(uint64_t frame_index) {
    bool full = state_.force_next || (frame_index % static_cast<uint64_t>(state_.cadence) == 0);
    state_.force_next = false;
    if (full) {
        state_.frames_since_detection = 0;
    } else {
        ++state_.frames_since_detection;
    }
    return full;
}

void CadenceController::restore_default() {
    if (state_.cadence != default_cadence_ && verbose) {
        std::cerr << "[Cadence] Tracking stable: restored detect cadence to " << default_cadence_ << "\n";
    }
    state_.cadence = default_cadence_;
    state_.drift_episodes = 0;
    state_.sustained_drift = false;
}

void CadenceController::on_tracking_result(int entities_found) {
    if (entities_found > 0) {
        state_.tracked = true;
        state_.lost_frames = 0;
        ++state_.present_run;

        if (state_.sustained_drift) {
            if (state_.present_run >= default_cadence_) restore_default();
        } else if (state_.drift_episodes > 0) {
            state_.cadence = default_cadence_;
            if (state_.present_run >= default_cadence_) restore_default();
        }
        return;
    }

    state_.present_run = 0;
    if (!state_.tracked) return;

    ++state_.lost_frames;
    if (state_.lost_frames <= config_.drift_threshold) return;

    state_.lost_frames = 0;
    ++state_.drift_episodes;
    state_.cadence = std::max(1, state_.cadence / 2);
    state_.force_next = true;
    if (state_.drift_episodes >= config_.sustained_drift_episodes) {
        state_.sustained_drift = true;
    }
    if (verbose) {
        std::cerr << "[Cadence] Tracking drift (episode " << state_.drift_episodes
                  << (state_.sustained_drift ? ", sustained" : "")
                  << "): detect cadence " << state_.cadence << "\n";
    }
}

} // namespace signflow
