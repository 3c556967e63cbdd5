#include "signflow/confidence_gate.hpp"
#include <algorithm>

namespace signflow {

const char* decision_name(GateDecision decision) {
    switch (decision) {
        case GateDecision::Process: return "process";
        case GateDecision::Skip: return "skip";
        case GateDecision::Reject: return "reject";
    }
    return "reject";
}

namespace {

int pose_wrist_index(HandSide side) {
    return side == HandSide::Left ? constants::kPoseLeftWrist : constants::kPoseRightWrist;
}

} // namespace

ConfidenceGate::ConfidenceGate() = default;

ConfidenceGate::ConfidenceGate(const GateConfig& config)
    : config_(config) {
}

void ConfidenceGate::reset() {
    tracks_[0].reset();
    tracks_[1].reset();
    last_anchor_[0].reset();
    last_anchor_[1].reset();
    last_admitted_.clear();
    still_frames_ = 0;
    last_displacement_ = 0.0f;
}

TrackState ConfidenceGate::state(HandSide side) const {
    return tracks_[slot(side)].state;
}

float ConfidenceGate::hand_trust(const LandmarkFrame& frame, const HandLandmarks& hand) const {
    if (!config_.require_pose_anchor) return 1.0f;

    HandSide side = signer_side(hand.handedness);
    if (side == HandSide::Unknown || hand.points.empty()) return 0.0f;

    int idx = pose_wrist_index(side);
    if (static_cast<int>(frame.pose.size()) <= idx) return 0.0f;

    const PosePoint& anchor = frame.pose[idx];
    if (distance(anchor.position, hand.points[constants::kWrist]) > config_.max_wrist_distance) {
        return 0.0f;
    }
    // A pose wrist that jumped since the last frame is not a stable anchor
    const auto& prev = last_anchor_[slot(side)];
    if (prev && distance(*prev, anchor.position) > config_.max_wrist_distance) {
        return 0.0f;
    }
    return std::clamp(anchor.visibility, 0.0f, 1.0f);
}

bool ConfidenceGate::update_track(HandSide side, float confidence, float trust) {
    if (side == HandSide::Unknown) return false;
    HysteresisTrack& track = tracks_[slot(side)];

    if (trust < config_.min_trust) {
        track.reset();
        return false;
    }

    if (track.state == TrackState::Searching) {
        if (confidence >= config_.acquire_confidence) {
            ++track.acquire_run;
            if (track.acquire_run >= config_.acquire_frames) {
                track.state = TrackState::Acquired;
                track.acquire_run = 0;
                track.miss_run = 0;
                return true;
            }
        } else {
            track.acquire_run = 0;
        }
        return false;
    }

    if (confidence >= config_.hold_confidence) {
        track.miss_run = 0;
        return true;
    }
    ++track.miss_run;
    if (track.miss_run >= config_.hold_frames) {
        track.reset();
    }
    return false;
}

std::optional<float> ConfidenceGate::displacement(const std::vector<HandLandmarks>& hands) const {
    if (last_admitted_.empty() || last_admitted_.size() != hands.size()) return std::nullopt;

    float total = 0.0f;
    int count = 0;
    for (const auto& hand : hands) {
        HandSide side = signer_side(hand.handedness);
        auto prev = std::find_if(last_admitted_.begin(), last_admitted_.end(),
                                 [side](const HandLandmarks& h) { return signer_side(h.handedness) == side; });
        if (prev == last_admitted_.end() || prev->points.size() != hand.points.size()) {
            return std::nullopt;
        }
        for (size_t i = 0; i < hand.points.size(); ++i) {
            total += distance(hand.points[i], prev->points[i]);
            ++count;
        }
    }
    if (count == 0) return std::nullopt;
    return total / static_cast<float>(count);
}

void ConfidenceGate::update_anchors(const LandmarkFrame& frame) {
    for (HandSide side : {HandSide::Left, HandSide::Right}) {
        int idx = pose_wrist_index(side);
        if (static_cast<int>(frame.pose.size()) > idx) {
            last_anchor_[slot(side)] = frame.pose[idx].position;
        } else {
            last_anchor_[slot(side)].reset();
        }
    }
}

GateDecision ConfidenceGate::admit(const LandmarkFrame& frame, LandmarkFrame* admitted) {
    std::vector<HandLandmarks> candidates =
        filter_ghost_hands(frame.hands, config_.min_hand_span, config_.min_valid_values);

    std::vector<HandLandmarks> accepted;
    for (HandSide side : {HandSide::Left, HandSide::Right}) {
        auto it = std::find_if(candidates.begin(), candidates.end(),
                               [side](const HandLandmarks& h) { return signer_side(h.handedness) == side; });
        if (it == candidates.end()) {
            // Absence counts as a low-confidence frame, not a trust failure
            update_track(side, 0.0f, 1.0f);
            continue;
        }
        if (update_track(side, it->score, hand_trust(frame, *it))) {
            accepted.push_back(*it);
        }
    }
    update_anchors(frame);

    if (admitted) {
        *admitted = frame;
        admitted->hands = accepted;
    }

    if (accepted.empty()) {
        still_frames_ = 0;
        last_admitted_.clear();
        return GateDecision::Reject;
    }

    auto moved = displacement(accepted);
    last_admitted_ = std::move(accepted);
    last_displacement_ = moved.value_or(0.0f);

    if (!moved || *moved >= config_.motion_threshold) {
        still_frames_ = 0;
        return GateDecision::Process;
    }
    ++still_frames_;
    if (config_.skip_after_still_frames > 0 && still_frames_ > config_.skip_after_still_frames) {
        return GateDecision::Skip;
    }
    return GateDecision::Process;
}

} // namespace signflow
