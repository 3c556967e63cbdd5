#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace signflow {

struct TopPrediction {
    int index{0};
    std::string label;
    float value{0.0f};
};

struct FeatureVectorStats {
    size_t size{0};
    size_t nonzero_count{0};
    float min{0.0f};
    float max{0.0f};
    float mean{0.0f};
    bool all_zeros{true};
    bool has_nan{false};
};

struct DebugInfo {
    FeatureVectorStats features;
    std::vector<TopPrediction> raw_logits;
    std::vector<TopPrediction> probabilities;
};

// Classifier output for one window. Immutable once produced.
struct RecognitionResult {
    std::string label;
    float confidence{0.0f};
    int index{-1};

    std::optional<std::string> origin;
    std::optional<float> origin_confidence;
    bool origin_estimated{false};   // taken from priors, not from a model head

    int64_t timestamp_ms{0};
    uint64_t session_id{0};
    bool is_dynamic{false};
    std::optional<DebugInfo> debug;

    // "ASL", "ASL~" for prior-based estimates, "UNKNOWN" when unresolved
    std::string origin_display() const {
        if (!origin) return "UNKNOWN";
        return origin_estimated ? *origin + "~" : *origin;
    }
};

} // namespace signflow
