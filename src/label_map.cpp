#include "signflow/label_map.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

namespace signflow {

bool LabelMap::load_from_string(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        const nlohmann::json* arr = &j;
        if (j.is_object()) {
            auto it = j.find("labels");
            if (it == j.end()) {
                std::cerr << "[LabelMap] ERROR: object without \"labels\" array\n";
                return false;
            }
            arr = &*it;
        }
        auto labels = arr->get<std::vector<std::string>>();
        if (labels.empty()) {
            std::cerr << "[LabelMap] ERROR: label list is empty\n";
            return false;
        }
        labels_ = std::move(labels);
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[LabelMap] ERROR: invalid label file: " << e.what() << "\n";
        return false;
    }
}

bool LabelMap::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[LabelMap] ERROR: missing label asset: " << path << "\n";
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

std::string LabelMap::label(int index) const {
    if (index >= 0 && index < static_cast<int>(labels_.size())) return labels_[index];
    return "CLASS_" + std::to_string(index);
}

bool LabelMap::is_alphabet_letter(const std::string& label) {
    return label.size() == 1 && std::isalpha(static_cast<unsigned char>(label[0])) != 0;
}

} // namespace signflow
