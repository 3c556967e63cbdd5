#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace signflow {

enum class Profile {
    UltraLite,
    Lite,
    Balanced,
    Accuracy
};

enum class DebounceStrategy {
    MultiFrameStable,        // all four acceptance gates
    SingleShotWithCooldown   // confidence + cap + one flat cooldown
};

enum class DetectorMode {
    Sync,   // detect-and-wait on the worker thread
    Async   // detector calls back later with a tagged result
};

const char* profile_label(Profile profile);
const char* profile_key(Profile profile);
bool parse_profile(const std::string& text, Profile& out);
Profile next_profile(Profile profile);
Profile lighter_profile(Profile profile);   // UltraLite stays UltraLite

const char* strategy_key(DebounceStrategy strategy);
bool parse_strategy(const std::string& text, DebounceStrategy& out);

// Presence and motion gating
struct GateConfig {
    float acquire_confidence{0.70f};   // C_acquire
    int acquire_frames{2};             // N_acquire
    float hold_confidence{0.40f};      // C_hold
    int hold_frames{1};                // N_hold

    bool require_pose_anchor{true};    // pose wrist must back each hand
    float min_trust{0.50f};            // pose wrist visibility floor
    float max_wrist_distance{0.15f};   // hand wrist vs pose wrist (normalized)

    float motion_threshold{0.02f};     // mean landmark displacement
    int skip_after_still_frames{5};

    float min_hand_span{0.08f};        // ghost hand filter
    int min_valid_values{15};

    [[nodiscard]] bool validate() const noexcept;
};

struct CadenceConfig {
    int detect_cadence{5};             // full detection every N frames
    int drift_threshold{4};            // lost frames before a drift episode
    int sustained_drift_episodes{3};

    [[nodiscard]] bool validate() const noexcept;
};

struct FeatureConfig {
    int window_length{30};
    int frame_dims{237};
    bool reset_after_inference{false}; // sliding window by default
    std::string scaler_path;           // optional mean/std JSON

    [[nodiscard]] bool validate() const noexcept;
};

struct ClassifierConfig {
    std::string model_path;
    std::string labels_path;
    std::string origin_priors_path;
    std::string manifest_path;         // SHA-256 manifest for the assets above
    int num_threads{2};
    std::vector<std::string> delegate_order{"GPU", "XNNPACK", "CPU"};
    std::vector<std::string> origin_labels{"ASL", "FSL"};
    float origin_confidence_threshold{0.60f};
    int top_k{5};
    int static_output_limit{3};        // identical outputs tolerated in a row
    bool verbose{false};

    [[nodiscard]] bool validate() const noexcept;
};

struct SmootherConfig {
    DebounceStrategy strategy{DebounceStrategy::MultiFrameStable};
    float alpha{0.70f};
    float min_smoothed_confidence{0.65f};
    int64_t transition_cooldown_ms{600};
    int64_t same_label_cooldown_ms{1500};
    int64_t single_shot_cooldown_ms{1000};
    int display_stable_frames{3};
    float display_high_confidence{0.75f};

    [[nodiscard]] bool validate() const noexcept;
};

struct AccumulatorConfig {
    int capacity{7};
    int64_t alphabet_idle_ms{1000};
    int64_t silence_commit_ms{2000};   // 0 disables
    int64_t hands_down_ms{1500};       // 0 disables
    float hands_down_y{0.90f};

    [[nodiscard]] bool validate() const noexcept;
};

struct AdaptiveConfig {
    bool enabled{true};
    float target_fps{18.0f};
    int base_skip{2};
    int min_skip{1};
    int max_skip{4};
    int min_cadence{4};
    int max_cadence{8};
    int fps_window_frames{120};
    int64_t interval_ms{1000};
    float low_ratio{0.8f};
    float high_ratio{1.2f};
    float degraded_ratio{0.5f};
    int degraded_intervals{3};

    [[nodiscard]] bool validate() const noexcept;
};

// One complete, named parameter set
struct PipelineConfig {
    Profile profile{Profile::Balanced};
    DetectorMode detector_mode{DetectorMode::Sync};
    bool verbose{false};

    GateConfig gate;
    CadenceConfig cadence;
    FeatureConfig feature;
    ClassifierConfig classifier;
    SmootherConfig smoother;
    AccumulatorConfig accumulator;
    AdaptiveConfig adaptive;

    static PipelineConfig preset(Profile profile);

    // JSON profile file; missing keys keep the preset named by "profile"
    [[nodiscard]] bool load_from_file(const std::string& path);
    [[nodiscard]] bool load_from_string(const std::string& text);
    bool save_to_file(const std::string& path) const;
    std::string to_json_string() const;

    [[nodiscard]] bool validate() const noexcept;
};

// Holds the active parameter set. Readers get an immutable snapshot, so a
// profile switch never exposes a partially applied configuration.
class ProfileRegistry {
public:
    ProfileRegistry();
    explicit ProfileRegistry(const PipelineConfig& config);

    std::shared_ptr<const PipelineConfig> active() const;
    uint64_t version() const;

    // Replaces the whole set; rejected when it does not validate
    bool set_active(const PipelineConfig& config);

    // Switches to a built-in preset, keeping asset paths and logging flags
    bool select(Profile profile);
    Profile cycle();

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const PipelineConfig> active_;
    uint64_t version_{0};

    ProfileRegistry(const ProfileRegistry&) = delete;
    ProfileRegistry& operator=(const ProfileRegistry&) = delete;
};

} // namespace signflow
