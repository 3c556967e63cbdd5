#include "signflow/feature_extractor.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace signflow {

namespace {

void append_points(std::vector<float>& out, const std::vector<Point3>& points, int max_points) {
    int n = std::min(static_cast<int>(points.size()), max_points);
    for (int i = 0; i < n; ++i) {
        out.push_back(FeatureScaler::scale(points[i].x));
        out.push_back(FeatureScaler::scale(points[i].y));
        out.push_back(FeatureScaler::scale(points[i].z));
    }
    out.resize(out.size() + static_cast<size_t>(max_points - n) * constants::kCoordsPerPoint, 0.0f);
}

} // namespace

bool FeatureScaler::load_from_string(const std::string& text, int dims) {
    try {
        auto j = nlohmann::json::parse(text);
        auto mean = j.at("mean").get<std::vector<float>>();
        auto stdev = j.at("std").get<std::vector<float>>();
        if (static_cast<int>(mean.size()) != dims || static_cast<int>(stdev.size()) != dims) {
            std::cerr << "[FeatureScaler] ERROR: expected " << dims << " dims, got mean="
                      << mean.size() << " std=" << stdev.size() << "\n";
            return false;
        }
        for (auto& s : stdev) {
            if (s <= 1e-6f) s = 1.0f;
        }
        mean_ = std::move(mean);
        std_ = std::move(stdev);
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[FeatureScaler] ERROR: invalid scaler file: " << e.what() << "\n";
        return false;
    }
}

bool FeatureScaler::load_from_file(const std::string& path, int dims) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[FeatureScaler] ERROR: missing scaler asset: " << path << "\n";
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str(), dims);
}

void FeatureScaler::standardize(std::vector<float>& v) const {
    if (mean_.size() != v.size()) return;
    for (size_t i = 0; i < v.size(); ++i) {
        v[i] = (v[i] - mean_[i]) / std_[i];
    }
}

// ---------------------------------------------------------------------------

FeatureExtractor::FeatureExtractor() = default;

FeatureExtractor::FeatureExtractor(const FeatureConfig& config)
    : config_(config) {
}

bool FeatureExtractor::init(const FeatureConfig& config) {
    if (!config.validate()) {
        std::cerr << "[FeatureExtractor] ERROR: invalid feature config\n";
        return false;
    }
    if (config.frame_dims != constants::kFrameDims) {
        std::cerr << "[FeatureExtractor] ERROR: frame width " << config.frame_dims
                  << " does not match landmark layout " << constants::kFrameDims << "\n";
        return false;
    }
    FeatureScaler scaler;
    if (!config.scaler_path.empty() && !scaler.load_from_file(config.scaler_path, config.frame_dims)) {
        return false;
    }
    config_ = config;
    scaler_ = std::move(scaler);
    reset();
    return true;
}

std::vector<float> FeatureExtractor::frame_vector(const LandmarkFrame& frame) {
    std::vector<float> out;
    out.reserve(constants::kFrameDims);

    const HandLandmarks* left = find_hand(frame, HandSide::Left);
    const HandLandmarks* right = find_hand(frame, HandSide::Right);
    static const std::vector<Point3> none;

    append_points(out, left ? left->points : none, constants::kHandPoints);
    append_points(out, right ? right->points : none, constants::kHandPoints);
    append_points(out, frame.face, constants::kFacePoints);
    return out;
}

std::optional<FeatureWindow> FeatureExtractor::process(const LandmarkFrame& frame, int64_t timestamp_ms) {
    return process_vector(frame_vector(frame), timestamp_ms);
}

std::optional<FeatureWindow> FeatureExtractor::process_vector(std::vector<float> vec, int64_t timestamp_ms) {
    if (static_cast<int>(vec.size()) != config_.frame_dims) {
        std::ostringstream msg;
        msg << "feature width mismatch: expected " << config_.frame_dims << ", got " << vec.size();
        std::cerr << "[FeatureExtractor] ERROR: " << msg.str() << "\n";
        throw std::invalid_argument(msg.str());
    }
    if (scaler_.has_standardization()) scaler_.standardize(vec);

    buffer_.push_back(std::move(vec));
    timestamps_.push_back(timestamp_ms);
    while (static_cast<int>(buffer_.size()) > config_.window_length) {
        buffer_.pop_front();
        timestamps_.pop_front();
    }
    if (static_cast<int>(buffer_.size()) < config_.window_length) {
        return std::nullopt;
    }

    FeatureWindow window;
    window.frames = config_.window_length;
    window.dims = config_.frame_dims;
    window.start_ms = timestamps_.front();
    window.end_ms = timestamps_.back();
    window.data.reserve(static_cast<size_t>(window.frames) * window.dims);
    for (const auto& row : buffer_) {
        window.data.insert(window.data.end(), row.begin(), row.end());
    }

    if (config_.reset_after_inference) reset();
    return window;
}

void FeatureExtractor::reset() {
    buffer_.clear();
    timestamps_.clear();
}

} // namespace signflow
