#pragma once

#include "signflow/pipeline_config.hpp"
#include "signflow/recognition_result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace signflow {

enum class SmootherVerdict {
    Accepted,
    LowConfidence,       // smoothed score below min_smoothed_confidence
    SequenceFull,        // accumulator at capacity
    TransitionCooldown,  // too soon after the previous token
    SameLabelCooldown    // repeat of the previous token without a pause
};

const char* verdict_name(SmootherVerdict verdict);

struct SmootherDecision {
    SmootherVerdict verdict{SmootherVerdict::LowConfidence};
    float smoothed_confidence{0.0f};
    int stable_frames{0};
    bool display_update{false};   // UI-facing result should refresh

    bool accepted() const { return verdict == SmootherVerdict::Accepted; }
};

/**
 * Turns raw per-window classifier output into accepted tokens.
 *
 * Gates, in order, each independent of the others:
 *   1. per-label EMA  smoothed = raw * alpha + prev * (1 - alpha), seeded
 *      with the first raw score; rejected below min_smoothed_confidence.
 *      The EMA is updated for every candidate, accepted or not.
 *   2. sequence cap
 *   3. transition cooldown since the last accepted token
 *   4. longer cooldown when repeating the last accepted label
 * SingleShotWithCooldown replaces 3 and 4 with one flat cooldown.
 *
 * The display stability counter is tracked separately and never affects
 * acceptance.
 */
class TemporalSmoother {
public:
    TemporalSmoother();
    explicit TemporalSmoother(const SmootherConfig& config);

    SmootherDecision evaluate(const RecognitionResult& result, int64_t now_ms, bool sequence_full);

    float smoothed(const std::string& label) const;
    const std::optional<std::string>& last_accepted_label() const { return last_label_; }
    int64_t last_accepted_ms() const { return last_accept_ms_; }

    void set_config(const SmootherConfig& config) { config_ = config; }
    const SmootherConfig& get_config() const { return config_; }
    void reset();

private:
    SmootherConfig config_;
    std::unordered_map<std::string, float> ema_;
    std::optional<std::string> last_label_;
    int64_t last_accept_ms_{0};

    std::string stable_label_;
    int stable_frames_{0};
};

} // namespace signflow
