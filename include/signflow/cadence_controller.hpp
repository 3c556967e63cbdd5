#pragma once

#include "signflow/pipeline_config.hpp"
#include <cstdint>

namespace signflow {

// Mutable per-entity cadence bookkeeping
struct CadenceState {
    int cadence{5};               // full detection every N frames
    int lost_frames{0};           // consecutive frames without the tracked entity
    int drift_episodes{0};        // episodes since tracking was last stable
    int present_run{0};           // consecutive frames with the entity present
    int frames_since_detection{0};
    bool tracked{false};          // the entity was seen since the last reset
    bool force_next{false};
    bool sustained_drift{false};
};

/**
 * Chooses full detection or cheap tracking per frame.
 *
 * Drift watchdog: once a tracked entity has been absent for more than
 * drift_threshold frames, one drift episode is counted, cadence is halved
 * (floor 1) and the next frame is forced to run full detection.
 * A transient episode restores the default cadence on the first frame the
 * entity is seen again. After sustained_drift_episodes episodes in a row
 * the cadence stays reduced until the entity has been present for a full
 * default cadence cycle.
 */
class CadenceController {
public:
    CadenceController();
    explicit CadenceController(const CadenceConfig& config);

    // Called once per frame, in arrival order
    bool should_run_full_detection(uint64_t frame_index);

    // Called with the number of entities found in the frame
    void on_tracking_result(int entities_found);

    // Adaptive resource control moves the default cadence
    void set_default_cadence(int cadence);
    int default_cadence() const { return default_cadence_; }

    int cadence() const { return state_.cadence; }
    bool sustained_drift() const { return state_.sustained_drift; }
    const CadenceState& state() const { return state_; }

    void set_config(const CadenceConfig& config);
    void reset();

    bool verbose{false};

private:
    CadenceConfig config_;
    int default_cadence_{5};
    CadenceState state_;

    void restore_default();
};

} // namespace signflow
