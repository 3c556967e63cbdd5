#pragma once

#include "signflow/landmarks.hpp"
#include "signflow/pipeline_config.hpp"
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace signflow {

/**
 * Fixed scaling contract shared with training:
 *
 *     scaled = (x - 0.5) * 2.0
 *
 * applied to every present landmark coordinate, mapping the detector's
 * [0, 1] range to [-1, 1]. Slots of missing entities stay at 0.0.
 * An optional per-dimension standardization (v - mean) / std is applied
 * afterwards when a scaler file is configured.
 */
class FeatureScaler {
public:
    static constexpr float kCenter = 0.5f;
    static constexpr float kScale = 2.0f;

    static float scale(float x) { return (x - kCenter) * kScale; }

    // JSON {"mean": [...], "std": [...]} with exactly `dims` entries each
    [[nodiscard]] bool load_from_file(const std::string& path, int dims);
    [[nodiscard]] bool load_from_string(const std::string& text, int dims);

    bool has_standardization() const { return !mean_.empty(); }
    void standardize(std::vector<float>& v) const;

private:
    std::vector<float> mean_;
    std::vector<float> std_;
};

// One classifier input: `frames` consecutive per-frame vectors, row-major
struct FeatureWindow {
    int frames{0};
    int dims{0};
    int64_t start_ms{0};
    int64_t end_ms{0};
    std::vector<float> data;

    const float* frame(int index) const { return data.data() + static_cast<size_t>(index) * dims; }
};

class FeatureExtractor {
public:
    FeatureExtractor();
    explicit FeatureExtractor(const FeatureConfig& config);

    // Loads the optional scaler. False on any configuration error.
    bool init(const FeatureConfig& config);

    // Flattened per-frame layout: signer-left hand (63), signer-right hand
    // (63), face (111). Missing entities and missing points are zero-filled,
    // extra points are ignored. Coordinates are scaled.
    static std::vector<float> frame_vector(const LandmarkFrame& frame);

    // Returns a window once `window_length` frames are buffered, then on
    // every further frame (sliding) or after every full refill (reset mode).
    std::optional<FeatureWindow> process(const LandmarkFrame& frame, int64_t timestamp_ms);

    // Same for an already extracted vector. Throws std::invalid_argument
    // when its width differs from the configured frame width.
    std::optional<FeatureWindow> process_vector(std::vector<float> vec, int64_t timestamp_ms);

    void reset();
    size_t buffered() const { return buffer_.size(); }
    const FeatureConfig& get_config() const { return config_; }

private:
    FeatureConfig config_;
    FeatureScaler scaler_;
    std::deque<std::vector<float>> buffer_;
    std::deque<int64_t> timestamps_;
};

} // namespace signflow
