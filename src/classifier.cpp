#include "signflow/classifier.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <stdexcept>

namespace signflow {

bool ReplayClassifierBackend::init(const ClassifierConfig&, int, int) {
    return true;
}

std::optional<RawOutput> ReplayClassifierBackend::run(const FeatureWindow&) {
    ++calls_;
    std::lock_guard<std::mutex> lock(mutex_);
    return next_;
}

void ReplayClassifierBackend::set_logits(std::vector<float> gloss_logits, std::vector<float> origin_logits) {
    std::lock_guard<std::mutex> lock(mutex_);
    next_ = RawOutput{std::move(gloss_logits), std::move(origin_logits)};
}

void ReplayClassifierBackend::clear_logits() {
    std::lock_guard<std::mutex> lock(mutex_);
    next_.reset();
}

std::vector<float> softmax(const std::vector<float>& logits) {
    std::vector<float> probs(logits.size(), 0.0f);
    if (logits.empty()) return probs;
    float max_logit = *std::max_element(logits.begin(), logits.end());
    float sum = 0.0f;
    for (size_t i = 0; i < logits.size(); ++i) {
        probs[i] = std::exp(logits[i] - max_logit);
        sum += probs[i];
    }
    for (auto& p : probs) p /= sum;
    return probs;
}

namespace {

bool has_non_finite(const std::vector<float>& v) {
    return std::any_of(v.begin(), v.end(), [](float x) { return !std::isfinite(x); });
}

FeatureVectorStats compute_stats(const std::vector<float>& data) {
    FeatureVectorStats stats;
    stats.size = data.size();
    if (data.empty()) return stats;
    stats.min = data[0];
    stats.max = data[0];
    double sum = 0.0;
    for (float v : data) {
        if (std::isnan(v)) {
            stats.has_nan = true;
            continue;
        }
        if (v != 0.0f) ++stats.nonzero_count;
        stats.min = std::min(stats.min, v);
        stats.max = std::max(stats.max, v);
        sum += v;
    }
    stats.mean = static_cast<float>(sum / static_cast<double>(data.size()));
    stats.all_zeros = stats.nonzero_count == 0;
    return stats;
}

std::vector<TopPrediction> top_k(const std::vector<float>& values, const LabelMap& labels, int k) {
    std::vector<int> order(values.size());
    std::iota(order.begin(), order.end(), 0);
    size_t n = std::min(order.size(), static_cast<size_t>(std::max(k, 0)));
    std::partial_sort(order.begin(), order.begin() + n, order.end(),
                      [&values](int a, int b) { return values[a] > values[b]; });
    std::vector<TopPrediction> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back({order[i], labels.label(order[i]), values[order[i]]});
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------

ClassifierAdapter::ClassifierAdapter() = default;

ClassifierAdapter::~ClassifierAdapter() = default;

bool ClassifierAdapter::init(const ClassifierConfig& config, const FeatureConfig& feature,
                             std::vector<std::unique_ptr<ClassifierBackend>> backends) {
    config_ = config;
    backend_.reset();

    if (!config.labels_path.empty()) {
        LabelMap labels;
        if (!labels.load_from_file(config.labels_path)) return false;
        labels_ = std::move(labels);
    }

    origin_resolver_ = OriginResolver(config.origin_labels, config.origin_confidence_threshold);
    if (!config.origin_priors_path.empty() &&
        !origin_resolver_.load_priors_from_file(config.origin_priors_path)) {
        return false;
    }

    for (auto& candidate : backends) {
        if (!candidate) continue;
        bool ok = false;
        try {
            ok = candidate->init(config, feature.window_length, feature.frame_dims);
        } catch (const std::exception& e) {
            std::cerr << "[Classifier] Backend " << candidate->backend_name()
                      << " threw during init: " << e.what() << "\n";
        }
        if (ok) {
            backend_ = std::move(candidate);
            break;
        }
        std::cerr << "[Classifier] Backend " << candidate->backend_name()
                  << " unavailable, trying next\n";
    }

    if (!backend_) {
        std::cerr << "[Classifier] ERROR: no recognition backend available\n";
        return false;
    }
    if (config_.verbose) {
        std::cerr << "[Classifier] Active backend: " << backend_->backend_name()
                  << " (" << backend_->model_variant() << "), labels: " << labels_.size() << "\n";
    }
    return true;
}

void ClassifierAdapter::set_labels(LabelMap labels) {
    std::lock_guard<std::mutex> lock(infer_mutex_);
    labels_ = std::move(labels);
}

void ClassifierAdapter::set_origin_resolver(OriginResolver resolver) {
    std::lock_guard<std::mutex> lock(infer_mutex_);
    origin_resolver_ = std::move(resolver);
}

std::string ClassifierAdapter::active_backend() const {
    return backend_ ? backend_->backend_name() : "NONE";
}

std::string ClassifierAdapter::model_variant() const {
    return backend_ ? backend_->model_variant() : "UNKNOWN";
}

bool ClassifierAdapter::consume_static_output() {
    return static_flag_.exchange(false);
}

void ClassifierAdapter::track_static_output(const std::vector<float>& logits) {
    bool same = logits.size() == last_logits_.size() &&
                std::equal(logits.begin(), logits.end(), last_logits_.begin(),
                           [](float a, float b) { return std::fabs(a - b) <= 1e-4f; });
    if (!same) {
        static_count_ = 0;
        last_logits_ = logits;
        return;
    }
    ++static_count_;
    if (static_count_ > config_.static_output_limit) {
        std::cerr << "[Classifier] Model output static for " << static_count_
                  << " windows, requesting window reset\n";
        static_count_ = 0;
        static_flag_ = true;
    }
}

std::optional<RecognitionResult> ClassifierAdapter::infer(const FeatureWindow& window) {
    std::lock_guard<std::mutex> lock(infer_mutex_);
    if (!backend_) return std::nullopt;

    std::optional<RawOutput> output;
    try {
        output = backend_->run(window);
    } catch (const std::exception& e) {
        std::cerr << "[Classifier] Inference threw: " << e.what() << "\n";
        ++failures_;
        return std::nullopt;
    }
    if (!output || output->gloss_logits.empty()) {
        if (config_.verbose) std::cerr << "[Classifier] Inference produced no output\n";
        ++failures_;
        return std::nullopt;
    }
    if (has_non_finite(output->gloss_logits)) {
        std::cerr << "[Classifier] Model output is not finite, dropping window\n";
        ++failures_;
        return std::nullopt;
    }
    return build_result(window, *output);
}

std::optional<RecognitionResult> ClassifierAdapter::build_result(const FeatureWindow& window,
                                                                 const RawOutput& output) {
    track_static_output(output.gloss_logits);

    if (!labels_.empty() && labels_.size() != output.gloss_logits.size() && !label_mismatch_logged_) {
        std::cerr << "[Classifier] Label count " << labels_.size() << " differs from model classes "
                  << output.gloss_logits.size() << "\n";
        label_mismatch_logged_ = true;
    }

    std::vector<float> probs = softmax(output.gloss_logits);
    if (has_non_finite(probs)) {
        std::cerr << "[Classifier] Probabilities are not finite, dropping window\n";
        ++failures_;
        return std::nullopt;
    }
    auto best = std::max_element(probs.begin(), probs.end());
    int index = static_cast<int>(std::distance(probs.begin(), best));

    RecognitionResult result;
    result.index = index;
    result.label = labels_.label(index);
    result.confidence = *best;
    result.timestamp_ms = window.end_ms;

    OriginBadge badge;
    bool resolved = false;
    if (!output.origin_logits.empty() && !has_non_finite(output.origin_logits)) {
        badge = origin_resolver_.resolve_multi_head(softmax(output.origin_logits));
        resolved = true;
    } else if (origin_resolver_.has_priors()) {
        badge = origin_resolver_.resolve_from_priors(result.label);
        resolved = true;
    }
    if (resolved && badge.origin != "UNKNOWN") {
        result.origin = badge.origin;
        result.origin_confidence = badge.confidence;
        result.origin_estimated = badge.estimated;
    }

    DebugInfo debug;
    debug.features = compute_stats(window.data);
    debug.raw_logits = top_k(output.gloss_logits, labels_, config_.top_k);
    debug.probabilities = top_k(probs, labels_, config_.top_k);
    result.debug = std::move(debug);

    if (config_.verbose) {
        std::cerr << "[Classifier] " << result.label << " conf=" << result.confidence
                  << " origin=" << result.origin_display() << "\n";
    }
    return result;
}

} // namespace signflow
