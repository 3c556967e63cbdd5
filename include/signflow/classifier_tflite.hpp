/**
 * @file classifier_tflite.hpp
 * @brief TensorFlow Lite backend for the gloss classifier
 *
 * Runs a window of scaled landmark features through a .tflite model with
 * one gloss head and an optional origin head. Hardware delegates are probed
 * in the configured order; plain CPU execution is the last resort and
 * always succeeds once the model loads.
 */

#pragma once

#include "signflow/classifier.hpp"
#include <memory>
#include <string>

namespace signflow {
namespace tflite {

// Forward declaration
struct TFLiteClassifierImpl;

class TFLiteClassifierBackend : public ClassifierBackend {
public:
    TFLiteClassifierBackend();
    ~TFLiteClassifierBackend() override;

    /**
     * @brief Load the model and attach the first delegate that works
     * @return false when TFLite is not compiled in, the model is missing,
     *         or its input does not hold window_frames * frame_dims values
     */
    bool init(const ClassifierConfig& config, int window_frames, int frame_dims) override;

    std::optional<RawOutput> run(const FeatureWindow& window) override;

    // "GPU", "XNNPACK" or "CPU"
    std::string backend_name() const override;

    // "FP32", "FP16" or "INT8"
    std::string model_variant() const override;

    static bool is_available();

private:
    std::unique_ptr<TFLiteClassifierImpl> impl_;

    // Disable copy
    TFLiteClassifierBackend(const TFLiteClassifierBackend&) = delete;
    TFLiteClassifierBackend& operator=(const TFLiteClassifierBackend&) = delete;
};

} // namespace tflite
} // namespace signflow
