#pragma once

#include <map>
#include <string>
#include <vector>

namespace signflow {

struct OriginBadge {
    std::string origin{"UNKNOWN"};
    float confidence{0.0f};
    bool estimated{false};
};

// Picks the source language of a gloss, either from the model's origin head
// or from per-gloss prior counts when the model has a single head.
class OriginResolver {
public:
    explicit OriginResolver(std::vector<std::string> origin_labels = {"ASL", "FSL"},
                            float confidence_threshold = 0.6f);

    // JSON {"<gloss>": {"ASL": n, "FSL": m}, ...}
    [[nodiscard]] bool load_priors_from_file(const std::string& path);
    [[nodiscard]] bool load_priors_from_string(const std::string& text);

    OriginBadge resolve_multi_head(const std::vector<float>& probabilities) const;
    OriginBadge resolve_from_priors(const std::string& gloss) const;

    bool has_priors() const { return !priors_.empty(); }
    const std::vector<std::string>& origin_labels() const { return origin_labels_; }

private:
    std::vector<std::string> origin_labels_;
    float threshold_;
    std::map<std::string, std::map<std::string, int>> priors_;
};

} // namespace signflow
