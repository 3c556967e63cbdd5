#pragma once

#include "signflow/feature_extractor.hpp"
#include "signflow/label_map.hpp"
#include "signflow/origin_resolver.hpp"
#include "signflow/pipeline_config.hpp"
#include "signflow/recognition_result.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace signflow {

// Raw model output for one window
struct RawOutput {
    std::vector<float> gloss_logits;
    std::vector<float> origin_logits;   // empty for single-head models
};

/**
 * @brief Execution backend for the external classifier model
 *
 * Implementations are not required to be reentrant; the adapter
 * serializes every call.
 */
class ClassifierBackend {
public:
    virtual ~ClassifierBackend() = default;

    // False when the backend cannot run on this machine or model
    virtual bool init(const ClassifierConfig& config, int window_frames, int frame_dims) = 0;

    // std::nullopt on a failed inference
    virtual std::optional<RawOutput> run(const FeatureWindow& window) = 0;

    virtual std::string backend_name() const = 0;
    virtual std::string model_variant() const = 0;
};

// Returns caller-supplied logits; used for offline replay and in tests
class ReplayClassifierBackend : public ClassifierBackend {
public:
    bool init(const ClassifierConfig& config, int window_frames, int frame_dims) override;
    std::optional<RawOutput> run(const FeatureWindow& window) override;
    std::string backend_name() const override { return "REPLAY"; }
    std::string model_variant() const override { return "REPLAY"; }

    void set_logits(std::vector<float> gloss_logits, std::vector<float> origin_logits = {});
    void clear_logits();
    uint64_t calls() const { return calls_; }

private:
    mutable std::mutex mutex_;
    std::optional<RawOutput> next_;
    std::atomic<uint64_t> calls_{0};
};

std::vector<float> softmax(const std::vector<float>& logits);

/**
 * @brief Runs the classifier on ready windows
 *
 * Tries its backends in priority order and keeps the first that
 * initializes. infer() never throws: any backend failure is logged and
 * reported as std::nullopt so the caller moves on to the next window.
 */
class ClassifierAdapter {
public:
    ClassifierAdapter();
    ~ClassifierAdapter();

    // Loads labels and origin priors named in the config, then selects a
    // backend. False when an asset is missing or no backend is available.
    bool init(const ClassifierConfig& config, const FeatureConfig& feature,
              std::vector<std::unique_ptr<ClassifierBackend>> backends);

    std::optional<RecognitionResult> infer(const FeatureWindow& window);

    void set_labels(LabelMap labels);
    void set_origin_resolver(OriginResolver resolver);

    bool available() const { return backend_ != nullptr; }
    std::string active_backend() const;
    std::string model_variant() const;

    // True once after the model produced the same output too many times in a row
    bool consume_static_output();
    uint64_t failures() const { return failures_; }

private:
    ClassifierConfig config_;
    std::unique_ptr<ClassifierBackend> backend_;
    LabelMap labels_;
    OriginResolver origin_resolver_;

    std::mutex infer_mutex_;
    std::vector<float> last_logits_;
    int static_count_{0};
    std::atomic<bool> static_flag_{false};
    std::atomic<uint64_t> failures_{0};
    bool label_mismatch_logged_{false};

    std::optional<RecognitionResult> build_result(const FeatureWindow& window, const RawOutput& output);
    void track_static_output(const std::vector<float>& logits);

    // Disable copy
    ClassifierAdapter(const ClassifierAdapter&) = delete;
    ClassifierAdapter& operator=(const ClassifierAdapter&) = delete;
};

} // namespace signflow
