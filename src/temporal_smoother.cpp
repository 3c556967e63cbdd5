#include "signflow/temporal_smoother.hpp"
#include <cmath>

namespace signflow {

const char* verdict_name(SmootherVerdict verdict) {
    switch (verdict) {
        case SmootherVerdict::Accepted: return "accepted";
        case SmootherVerdict::LowConfidence: return "low_confidence";
        case SmootherVerdict::SequenceFull: return "sequence_full";
        case SmootherVerdict::TransitionCooldown: return "transition_cooldown";
        case SmootherVerdict::SameLabelCooldown: return "same_label_cooldown";
    }
    return "low_confidence";
}

TemporalSmoother::TemporalSmoother() = default;

TemporalSmoother::TemporalSmoother(const SmootherConfig& config)
    : config_(config) {
}

void TemporalSmoother::reset() {
    ema_.clear();
    last_label_.reset();
    last_accept_ms_ = 0;
    stable_label_.clear();
    stable_frames_ = 0;
}

float TemporalSmoother::smoothed(const std::string& label) const {
    auto it = ema_.find(label);
    return it == ema_.end() ? 0.0f : it->second;
}

SmootherDecision TemporalSmoother::evaluate(const RecognitionResult& result, int64_t now_ms,
                                            bool sequence_full) {
    SmootherDecision decision;
    if (!std::isfinite(result.confidence)) {
        decision.verdict = SmootherVerdict::LowConfidence;
        return decision;
    }

    // Display stability, independent of acceptance
    if (result.label == stable_label_) {
        ++stable_frames_;
    } else {
        stable_label_ = result.label;
        stable_frames_ = 1;
    }
    decision.stable_frames = stable_frames_;
    decision.display_update = stable_frames_ >= config_.display_stable_frames ||
                              result.confidence >= config_.display_high_confidence;

    // Gate 1: the EMA moves on every candidate
    auto it = ema_.find(result.label);
    float value = it == ema_.end()
        ? result.confidence
        : result.confidence * config_.alpha + it->second * (1.0f - config_.alpha);
    ema_[result.label] = value;
    decision.smoothed_confidence = value;

    if (!(value >= config_.min_smoothed_confidence)) {
        decision.verdict = SmootherVerdict::LowConfidence;
        return decision;
    }

    // Gate 2
    if (sequence_full) {
        decision.verdict = SmootherVerdict::SequenceFull;
        return decision;
    }

    if (last_label_) {
        int64_t elapsed = now_ms - last_accept_ms_;
        if (config_.strategy == DebounceStrategy::SingleShotWithCooldown) {
            if (elapsed < config_.single_shot_cooldown_ms) {
                decision.verdict = SmootherVerdict::TransitionCooldown;
                return decision;
            }
        } else {
            // Gate 4 before gate 3: a repeat is held to the longer cooldown
            if (*last_label_ == result.label && elapsed < config_.same_label_cooldown_ms) {
                decision.verdict = SmootherVerdict::SameLabelCooldown;
                return decision;
            }
            if (elapsed < config_.transition_cooldown_ms) {
                decision.verdict = SmootherVerdict::TransitionCooldown;
                return decision;
            }
        }
    }

    last_label_ = result.label;
    last_accept_ms_ = now_ms;
    decision.verdict = SmootherVerdict::Accepted;
    return decision;
}

} // namespace signflow
