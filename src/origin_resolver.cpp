#include "signflow/origin_resolver.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace signflow {

OriginResolver::OriginResolver(std::vector<std::string> origin_labels, float confidence_threshold)
    : origin_labels_(std::move(origin_labels)), threshold_(confidence_threshold) {
}

bool OriginResolver::load_priors_from_string(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            std::cerr << "[OriginResolver] ERROR: priors must be a JSON object\n";
            return false;
        }
        std::map<std::string, std::map<std::string, int>> priors;
        for (auto it = j.begin(); it != j.end(); ++it) {
            priors[it.key()] = it.value().get<std::map<std::string, int>>();
        }
        priors_ = std::move(priors);
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[OriginResolver] ERROR: invalid priors file: " << e.what() << "\n";
        return false;
    }
}

bool OriginResolver::load_priors_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[OriginResolver] ERROR: missing priors asset: " << path << "\n";
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_priors_from_string(buffer.str());
}

OriginBadge OriginResolver::resolve_multi_head(const std::vector<float>& probabilities) const {
    OriginBadge badge;
    if (probabilities.empty()) return badge;

    auto best = std::max_element(probabilities.begin(), probabilities.end());
    size_t index = static_cast<size_t>(std::distance(probabilities.begin(), best));
    badge.confidence = *best;
    if (*best >= threshold_ && index < origin_labels_.size()) {
        badge.origin = origin_labels_[index];
    }
    return badge;
}

OriginBadge OriginResolver::resolve_from_priors(const std::string& gloss) const {
    OriginBadge badge;
    badge.estimated = true;

    auto it = priors_.find(gloss);
    if (it == priors_.end()) return badge;

    int total = 0;
    int best_count = 0;
    std::string best_origin;
    for (const auto& entry : it->second) {
        total += entry.second;
        if (entry.second > best_count) {
            best_count = entry.second;
            best_origin = entry.first;
        }
    }
    if (total <= 0 || best_origin.empty()) return badge;

    badge.origin = best_origin;
    badge.confidence = static_cast<float>(best_count) / static_cast<float>(total);
    return badge;
}

} // namespace signflow
