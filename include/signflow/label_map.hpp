#pragma once

#include <string>
#include <vector>

namespace signflow {

// Index -> gloss label table for the classifier output head
class LabelMap {
public:
    LabelMap() = default;
    explicit LabelMap(std::vector<std::string> labels) : labels_(std::move(labels)) {}

    // Accepts a JSON array or an object with a "labels" array
    [[nodiscard]] bool load_from_file(const std::string& path);
    [[nodiscard]] bool load_from_string(const std::string& text);

    // Label for index, or "CLASS_<index>" when out of range
    std::string label(int index) const;

    size_t size() const { return labels_.size(); }
    bool empty() const { return labels_.empty(); }
    const std::vector<std::string>& labels() const { return labels_; }

    // Single ASCII letter labels belong to the fingerspelling alphabet
    static bool is_alphabet_letter(const std::string& label);

private:
    std::vector<std::string> labels_;
};

} // namespace signflow
