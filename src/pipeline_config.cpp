#include "signflow/pipeline_config.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

namespace signflow {

using json = nlohmann::json;

const char* profile_label(Profile profile) {
    switch (profile) {
        case Profile::UltraLite: return "Ultra Lite";
        case Profile::Lite: return "Lite";
        case Profile::Balanced: return "Balanced";
        case Profile::Accuracy: return "Accuracy";
    }
    return "Balanced";
}

const char* profile_key(Profile profile) {
    switch (profile) {
        case Profile::UltraLite: return "ultra_lite";
        case Profile::Lite: return "lite";
        case Profile::Balanced: return "balanced";
        case Profile::Accuracy: return "accuracy";
    }
    return "balanced";
}

bool parse_profile(const std::string& text, Profile& out) {
    std::string key;
    for (char c : text) {
        if (c == ' ' || c == '-' || c == '_') continue;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (key == "ultralite") out = Profile::UltraLite;
    else if (key == "lite") out = Profile::Lite;
    else if (key == "balanced") out = Profile::Balanced;
    else if (key == "accuracy") out = Profile::Accuracy;
    else return false;
    return true;
}

Profile next_profile(Profile profile) {
    switch (profile) {
        case Profile::UltraLite: return Profile::Lite;
        case Profile::Lite: return Profile::Balanced;
        case Profile::Balanced: return Profile::Accuracy;
        case Profile::Accuracy: return Profile::UltraLite;
    }
    return Profile::Balanced;
}

Profile lighter_profile(Profile profile) {
    switch (profile) {
        case Profile::UltraLite: return Profile::UltraLite;
        case Profile::Lite: return Profile::UltraLite;
        case Profile::Balanced: return Profile::Lite;
        case Profile::Accuracy: return Profile::Balanced;
    }
    return Profile::Lite;
}

const char* strategy_key(DebounceStrategy strategy) {
    return strategy == DebounceStrategy::SingleShotWithCooldown ? "single_shot" : "multi_frame_stable";
}

bool parse_strategy(const std::string& text, DebounceStrategy& out) {
    if (text == "multi_frame_stable") out = DebounceStrategy::MultiFrameStable;
    else if (text == "single_shot") out = DebounceStrategy::SingleShotWithCooldown;
    else return false;
    return true;
}

bool GateConfig::validate() const noexcept {
    if (acquire_confidence < 0.0f || acquire_confidence > 1.0f) return false;
    if (hold_confidence < 0.0f || hold_confidence > acquire_confidence) return false;
    if (acquire_frames < 1 || hold_frames < 1) return false;
    if (min_trust < 0.0f || min_trust > 1.0f) return false;
    if (max_wrist_distance <= 0.0f) return false;
    if (motion_threshold < 0.0f || skip_after_still_frames < 0) return false;
    if (min_hand_span < 0.0f || min_valid_values < 0) return false;
    return true;
}

bool CadenceConfig::validate() const noexcept {
    return detect_cadence >= 1 && drift_threshold >= 0 && sustained_drift_episodes >= 1;
}

bool FeatureConfig::validate() const noexcept {
    return window_length >= 1 && frame_dims >= 1;
}

bool ClassifierConfig::validate() const noexcept {
    if (num_threads < 1 || top_k < 1 || static_output_limit < 1) return false;
    if (origin_confidence_threshold < 0.0f || origin_confidence_threshold > 1.0f) return false;
    if (delegate_order.empty()) return false;
    return true;
}

bool SmootherConfig::validate() const noexcept {
    if (alpha <= 0.0f || alpha > 1.0f) return false;
    if (min_smoothed_confidence < 0.0f || min_smoothed_confidence > 1.0f) return false;
    if (transition_cooldown_ms < 0 || same_label_cooldown_ms < 0 || single_shot_cooldown_ms < 0) return false;
    if (display_stable_frames < 1) return false;
    return true;
}

bool AccumulatorConfig::validate() const noexcept {
    if (capacity < 1) return false;
    if (alphabet_idle_ms < 0 || silence_commit_ms < 0 || hands_down_ms < 0) return false;
    return true;
}

bool AdaptiveConfig::validate() const noexcept {
    if (target_fps <= 0.0f) return false;
    if (min_skip < 1 || max_skip < min_skip) return false;
    if (base_skip < min_skip || base_skip > max_skip) return false;
    if (min_cadence < 1 || max_cadence < min_cadence) return false;
    if (fps_window_frames < 2 || interval_ms <= 0) return false;
    if (low_ratio <= 0.0f || high_ratio <= low_ratio) return false;
    if (degraded_ratio <= 0.0f || degraded_ratio > low_ratio || degraded_intervals < 1) return false;
    return true;
}

bool PipelineConfig::validate() const noexcept {
    if (!gate.validate()) return false;
    if (!cadence.validate()) return false;
    if (!feature.validate()) return false;
    if (!classifier.validate()) return false;
    if (!smoother.validate()) return false;
    if (!accumulator.validate()) return false;
    if (!adaptive.validate()) return false;
    return true;
}

PipelineConfig PipelineConfig::preset(Profile profile) {
    PipelineConfig c;
    c.profile = profile;
    switch (profile) {
        case Profile::UltraLite:
            c.adaptive.target_fps = 12.0f;
            c.adaptive.base_skip = 5; c.adaptive.min_skip = 3; c.adaptive.max_skip = 8;
            c.cadence.detect_cadence = 12; c.adaptive.min_cadence = 10; c.adaptive.max_cadence = 16;
            c.cadence.drift_threshold = 6;
            c.gate.motion_threshold = 0.03f;
            c.gate.skip_after_still_frames = 8;
            c.gate.acquire_confidence = 0.75f;
            c.smoother.min_smoothed_confidence = 0.75f;
            c.classifier.num_threads = 1;
            break;
        case Profile::Lite:
            c.adaptive.target_fps = 16.0f;
            c.adaptive.base_skip = 3; c.adaptive.min_skip = 2; c.adaptive.max_skip = 6;
            c.cadence.detect_cadence = 8; c.adaptive.min_cadence = 6; c.adaptive.max_cadence = 12;
            c.cadence.drift_threshold = 5;
            c.gate.motion_threshold = 0.025f;
            c.gate.skip_after_still_frames = 6;
            c.gate.acquire_confidence = 0.70f;
            c.smoother.min_smoothed_confidence = 0.70f;
            c.classifier.num_threads = 2;
            break;
        case Profile::Balanced:
            // struct defaults
            break;
        case Profile::Accuracy:
            c.adaptive.target_fps = 20.0f;
            c.adaptive.base_skip = 1; c.adaptive.min_skip = 1; c.adaptive.max_skip = 3;
            c.cadence.detect_cadence = 4; c.adaptive.min_cadence = 3; c.adaptive.max_cadence = 6;
            c.cadence.drift_threshold = 3;
            c.gate.motion_threshold = 0.015f;
            c.gate.skip_after_still_frames = 4;
            c.gate.acquire_confidence = 0.65f;
            c.smoother.min_smoothed_confidence = 0.60f;
            c.classifier.num_threads = 4;
            break;
    }
    return c;
}

namespace {

template <typename T>
void read_field(const json& section, const char* key, T& field) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) field = it->get<T>();
}

const json& section_of(const json& root, const char* key) {
    static const json empty = json::object();
    auto it = root.find(key);
    if (it == root.end() || !it->is_object()) return empty;
    return *it;
}

} // namespace

bool PipelineConfig::load_from_string(const std::string& text) {
    PipelineConfig loaded = *this;
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            std::cerr << "[Config] Profile document must be a JSON object\n";
            return false;
        }

        if (root.contains("profile")) {
            Profile p;
            if (!parse_profile(root.at("profile").get<std::string>(), p)) {
                std::cerr << "[Config] Unknown profile: " << root.at("profile") << "\n";
                return false;
            }
            ClassifierConfig assets = loaded.classifier;
            loaded = preset(p);
            loaded.classifier.model_path = assets.model_path;
            loaded.classifier.labels_path = assets.labels_path;
            loaded.classifier.origin_priors_path = assets.origin_priors_path;
            loaded.classifier.manifest_path = assets.manifest_path;
        }
        if (root.contains("detector_mode")) {
            std::string mode = root.at("detector_mode").get<std::string>();
            if (mode == "sync") loaded.detector_mode = DetectorMode::Sync;
            else if (mode == "async") loaded.detector_mode = DetectorMode::Async;
            else {
                std::cerr << "[Config] Unknown detector_mode: " << mode << "\n";
                return false;
            }
        }
        read_field(root, "verbose", loaded.verbose);

        const json& g = section_of(root, "gate");
        read_field(g, "acquire_confidence", loaded.gate.acquire_confidence);
        read_field(g, "acquire_frames", loaded.gate.acquire_frames);
        read_field(g, "hold_confidence", loaded.gate.hold_confidence);
        read_field(g, "hold_frames", loaded.gate.hold_frames);
        read_field(g, "require_pose_anchor", loaded.gate.require_pose_anchor);
        read_field(g, "min_trust", loaded.gate.min_trust);
        read_field(g, "max_wrist_distance", loaded.gate.max_wrist_distance);
        read_field(g, "motion_threshold", loaded.gate.motion_threshold);
        read_field(g, "skip_after_still_frames", loaded.gate.skip_after_still_frames);
        read_field(g, "min_hand_span", loaded.gate.min_hand_span);
        read_field(g, "min_valid_values", loaded.gate.min_valid_values);

        const json& cd = section_of(root, "cadence");
        read_field(cd, "detect_cadence", loaded.cadence.detect_cadence);
        read_field(cd, "drift_threshold", loaded.cadence.drift_threshold);
        read_field(cd, "sustained_drift_episodes", loaded.cadence.sustained_drift_episodes);

        const json& f = section_of(root, "feature");
        read_field(f, "window_length", loaded.feature.window_length);
        read_field(f, "frame_dims", loaded.feature.frame_dims);
        read_field(f, "reset_after_inference", loaded.feature.reset_after_inference);
        read_field(f, "scaler_path", loaded.feature.scaler_path);

        const json& cl = section_of(root, "classifier");
        read_field(cl, "model_path", loaded.classifier.model_path);
        read_field(cl, "labels_path", loaded.classifier.labels_path);
        read_field(cl, "origin_priors_path", loaded.classifier.origin_priors_path);
        read_field(cl, "manifest_path", loaded.classifier.manifest_path);
        read_field(cl, "num_threads", loaded.classifier.num_threads);
        read_field(cl, "delegate_order", loaded.classifier.delegate_order);
        read_field(cl, "origin_labels", loaded.classifier.origin_labels);
        read_field(cl, "origin_confidence_threshold", loaded.classifier.origin_confidence_threshold);
        read_field(cl, "top_k", loaded.classifier.top_k);
        read_field(cl, "static_output_limit", loaded.classifier.static_output_limit);
        read_field(cl, "verbose", loaded.classifier.verbose);

        const json& s = section_of(root, "smoother");
        if (s.contains("strategy")) {
            if (!parse_strategy(s.at("strategy").get<std::string>(), loaded.smoother.strategy)) {
                std::cerr << "[Config] Unknown smoother strategy: " << s.at("strategy") << "\n";
                return false;
            }
        }
        read_field(s, "alpha", loaded.smoother.alpha);
        read_field(s, "min_smoothed_confidence", loaded.smoother.min_smoothed_confidence);
        read_field(s, "transition_cooldown_ms", loaded.smoother.transition_cooldown_ms);
        read_field(s, "same_label_cooldown_ms", loaded.smoother.same_label_cooldown_ms);
        read_field(s, "single_shot_cooldown_ms", loaded.smoother.single_shot_cooldown_ms);
        read_field(s, "display_stable_frames", loaded.smoother.display_stable_frames);
        read_field(s, "display_high_confidence", loaded.smoother.display_high_confidence);

        const json& a = section_of(root, "accumulator");
        read_field(a, "capacity", loaded.accumulator.capacity);
        read_field(a, "alphabet_idle_ms", loaded.accumulator.alphabet_idle_ms);
        read_field(a, "silence_commit_ms", loaded.accumulator.silence_commit_ms);
        read_field(a, "hands_down_ms", loaded.accumulator.hands_down_ms);
        read_field(a, "hands_down_y", loaded.accumulator.hands_down_y);

        const json& ad = section_of(root, "adaptive");
        read_field(ad, "enabled", loaded.adaptive.enabled);
        read_field(ad, "target_fps", loaded.adaptive.target_fps);
        read_field(ad, "base_skip", loaded.adaptive.base_skip);
        read_field(ad, "min_skip", loaded.adaptive.min_skip);
        read_field(ad, "max_skip", loaded.adaptive.max_skip);
        read_field(ad, "min_cadence", loaded.adaptive.min_cadence);
        read_field(ad, "max_cadence", loaded.adaptive.max_cadence);
        read_field(ad, "fps_window_frames", loaded.adaptive.fps_window_frames);
        read_field(ad, "interval_ms", loaded.adaptive.interval_ms);
        read_field(ad, "low_ratio", loaded.adaptive.low_ratio);
        read_field(ad, "high_ratio", loaded.adaptive.high_ratio);
        read_field(ad, "degraded_ratio", loaded.adaptive.degraded_ratio);
        read_field(ad, "degraded_intervals", loaded.adaptive.degraded_intervals);
    } catch (const json::exception& e) {
        std::cerr << "[Config] Invalid profile JSON: " << e.what() << "\n";
        return false;
    }

    if (!loaded.validate()) {
        std::cerr << "[Config] Profile values out of range\n";
        return false;
    }
    *this = loaded;
    return true;
}

bool PipelineConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << path << "\n";
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

std::string PipelineConfig::to_json_string() const {
    json root;
    root["profile"] = profile_key(profile);
    root["detector_mode"] = detector_mode == DetectorMode::Async ? "async" : "sync";
    root["verbose"] = verbose;

    root["gate"] = {
        {"acquire_confidence", gate.acquire_confidence},
        {"acquire_frames", gate.acquire_frames},
        {"hold_confidence", gate.hold_confidence},
        {"hold_frames", gate.hold_frames},
        {"require_pose_anchor", gate.require_pose_anchor},
        {"min_trust", gate.min_trust},
        {"max_wrist_distance", gate.max_wrist_distance},
        {"motion_threshold", gate.motion_threshold},
        {"skip_after_still_frames", gate.skip_after_still_frames},
        {"min_hand_span", gate.min_hand_span},
        {"min_valid_values", gate.min_valid_values}};
    root["cadence"] = {
        {"detect_cadence", cadence.detect_cadence},
        {"drift_threshold", cadence.drift_threshold},
        {"sustained_drift_episodes", cadence.sustained_drift_episodes}};
    root["feature"] = {
        {"window_length", feature.window_length},
        {"frame_dims", feature.frame_dims},
        {"reset_after_inference", feature.reset_after_inference},
        {"scaler_path", feature.scaler_path}};
    root["classifier"] = {
        {"model_path", classifier.model_path},
        {"labels_path", classifier.labels_path},
        {"origin_priors_path", classifier.origin_priors_path},
        {"manifest_path", classifier.manifest_path},
        {"num_threads", classifier.num_threads},
        {"delegate_order", classifier.delegate_order},
        {"origin_labels", classifier.origin_labels},
        {"origin_confidence_threshold", classifier.origin_confidence_threshold},
        {"top_k", classifier.top_k},
        {"static_output_limit", classifier.static_output_limit},
        {"verbose", classifier.verbose}};
    root["smoother"] = {
        {"strategy", strategy_key(smoother.strategy)},
        {"alpha", smoother.alpha},
        {"min_smoothed_confidence", smoother.min_smoothed_confidence},
        {"transition_cooldown_ms", smoother.transition_cooldown_ms},
        {"same_label_cooldown_ms", smoother.same_label_cooldown_ms},
        {"single_shot_cooldown_ms", smoother.single_shot_cooldown_ms},
        {"display_stable_frames", smoother.display_stable_frames},
        {"display_high_confidence", smoother.display_high_confidence}};
    root["accumulator"] = {
        {"capacity", accumulator.capacity},
        {"alphabet_idle_ms", accumulator.alphabet_idle_ms},
        {"silence_commit_ms", accumulator.silence_commit_ms},
        {"hands_down_ms", accumulator.hands_down_ms},
        {"hands_down_y", accumulator.hands_down_y}};
    root["adaptive"] = {
        {"enabled", adaptive.enabled},
        {"target_fps", adaptive.target_fps},
        {"base_skip", adaptive.base_skip},
        {"min_skip", adaptive.min_skip},
        {"max_skip", adaptive.max_skip},
        {"min_cadence", adaptive.min_cadence},
        {"max_cadence", adaptive.max_cadence},
        {"fps_window_frames", adaptive.fps_window_frames},
        {"interval_ms", adaptive.interval_ms},
        {"low_ratio", adaptive.low_ratio},
        {"high_ratio", adaptive.high_ratio},
        {"degraded_ratio", adaptive.degraded_ratio},
        {"degraded_intervals", adaptive.degraded_intervals}};
    return root.dump(2);
}

bool PipelineConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to save to: " << path << "\n";
        return false;
    }
    file << to_json_string() << "\n";
    return static_cast<bool>(file);
}

// ---------------------------------------------------------------------------

ProfileRegistry::ProfileRegistry()
    : active_(std::make_shared<const PipelineConfig>(PipelineConfig::preset(Profile::Balanced))) {
}

ProfileRegistry::ProfileRegistry(const PipelineConfig& config)
    : active_(std::make_shared<const PipelineConfig>(config)) {
}

std::shared_ptr<const PipelineConfig> ProfileRegistry::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

uint64_t ProfileRegistry::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

bool ProfileRegistry::set_active(const PipelineConfig& config) {
    if (!config.validate()) {
        std::cerr << "[Config] Rejected invalid parameter set for profile "
                  << profile_label(config.profile) << "\n";
        return false;
    }
    auto next = std::make_shared<const PipelineConfig>(config);
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = std::move(next);
    ++version_;
    return true;
}

bool ProfileRegistry::select(Profile profile) {
    auto current = active();
    PipelineConfig next = PipelineConfig::preset(profile);
    next.detector_mode = current->detector_mode;
    next.verbose = current->verbose;
    next.feature.scaler_path = current->feature.scaler_path;
    next.classifier.model_path = current->classifier.model_path;
    next.classifier.labels_path = current->classifier.labels_path;
    next.classifier.origin_priors_path = current->classifier.origin_priors_path;
    next.classifier.manifest_path = current->classifier.manifest_path;
    next.classifier.verbose = current->classifier.verbose;
    if (current->verbose) {
        std::cerr << "[Config] Switching profile " << profile_label(current->profile)
                  << " -> " << profile_label(profile) << "\n";
    }
    return set_active(next);
}

Profile ProfileRegistry::cycle() {
    Profile next = next_profile(active()->profile);
    if (!select(next)) {
        std::cerr << "[Config] Could not switch to " << profile_label(next) << "\n";
    }
    return active()->profile;
}

} // namespace signflow
