#pragma once

#include "signflow/landmarks.hpp"
#include "signflow/pipeline_config.hpp"
#include <optional>
#include <vector>

namespace signflow {

enum class GateDecision {
    Process,   // trusted and moving: feed the feature window
    Skip,      // trusted but still long enough to skip classification
    Reject     // nothing trustworthy in this frame
};

const char* decision_name(GateDecision decision);

enum class TrackState {
    Searching,
    Acquired
};

// Per-entity hysteresis state
struct HysteresisTrack {
    TrackState state{TrackState::Searching};
    int acquire_run{0};   // consecutive frames at or above C_acquire while searching
    int miss_run{0};      // consecutive frames below C_hold while acquired

    void reset() noexcept {
        state = TrackState::Searching;
        acquire_run = 0;
        miss_run = 0;
    }
};

/**
 * Decides per frame whether hand landmarks can be trusted and whether they
 * moved enough to warrant classification.
 *
 * Trust: when a pose anchor is required, each hand's wrist must sit close
 * to the matching pose wrist and that pose wrist must be visible and steady.
 * Trust below min_trust resets the entity to searching.
 *
 * Hysteresis: searching -> acquired after N_acquire consecutive frames at or
 * above C_acquire. An acquired entity is admitted on every frame at or above
 * C_hold and is released after N_hold consecutive frames below it.
 *
 * Motion: with at least one admitted hand, frames whose mean landmark
 * displacement stays below motion_threshold count as still. After
 * skip_after_still_frames still frames further still frames are skipped
 * (0 disables skipping). Any moving frame resets the count.
 */
class ConfidenceGate {
public:
    ConfidenceGate();
    explicit ConfidenceGate(const GateConfig& config);

    // `admitted` receives the frame restricted to admitted hands
    GateDecision admit(const LandmarkFrame& frame, LandmarkFrame* admitted = nullptr);

    // One hysteresis step for one entity; true when the frame is admitted
    bool update_track(HandSide side, float confidence, float trust);

    // Pose-anchor trust for a hand in [0, 1]
    float hand_trust(const LandmarkFrame& frame, const HandLandmarks& hand) const;

    TrackState state(HandSide side) const;
    int still_frames() const { return still_frames_; }
    float last_displacement() const { return last_displacement_; }

    void set_config(const GateConfig& config) { config_ = config; }
    const GateConfig& get_config() const { return config_; }
    void reset();

private:
    GateConfig config_;
    HysteresisTrack tracks_[2];
    std::optional<Point3> last_anchor_[2];
    std::vector<HandLandmarks> last_admitted_;
    int still_frames_{0};
    float last_displacement_{0.0f};

    static int slot(HandSide side) { return side == HandSide::Right ? 1 : 0; }
    std::optional<float> displacement(const std::vector<HandLandmarks>& hands) const;
    void update_anchors(const LandmarkFrame& frame);
};

} // namespace signflow
