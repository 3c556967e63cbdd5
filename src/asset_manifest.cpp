#include "signflow/asset_manifest.hpp"
#include "signflow/crypto.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace signflow {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string parent_dir(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string join(const std::string& dir, const std::string& name) {
    if (name.empty() || name[0] == '/' || dir.empty() || dir == ".") return name;
    return dir.back() == '/' ? dir + name : dir + "/" + name;
}

} // namespace

bool verify_asset(const std::string& path, const std::string& expected_hex) {
    std::string actual = crypto::sha256_file_hex(path);
    if (actual.empty()) {
        std::cerr << "[Assets] ERROR: cannot read " << path << "\n";
        return false;
    }
    if (actual != lower(expected_hex)) {
        std::cerr << "[Assets] ERROR: digest mismatch for " << path << "\n"
                  << "  expected " << lower(expected_hex) << "\n"
                  << "  actual   " << actual << "\n";
        return false;
    }
    return true;
}

bool AssetManifest::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[Assets] ERROR: cannot open manifest " << path << "\n";
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return load_from_string(buffer.str(), parent_dir(path));
}

bool AssetManifest::load_from_string(const std::string& text, const std::string& base_dir) {
    files_.clear();
    signature_.clear();
    base_dir_ = base_dir;
    try {
        auto root = nlohmann::json::parse(text);
        if (!root.contains("files") || !root.at("files").is_object()) {
            std::cerr << "[Assets] ERROR: manifest has no \"files\" object\n";
            return false;
        }
        for (const auto& item : root.at("files").items()) {
            files_[item.key()] = lower(item.value().get<std::string>());
        }
        if (root.contains("signature")) signature_ = root.at("signature").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Assets] ERROR: invalid manifest: " << e.what() << "\n";
        files_.clear();
        return false;
    }
    return true;
}

std::string AssetManifest::resolve(const std::string& relative) const {
    return join(base_dir_, relative);
}

bool AssetManifest::contains(const std::string& path) const {
    if (files_.count(path)) return true;
    return std::any_of(files_.begin(), files_.end(),
                       [&](const auto& entry) { return resolve(entry.first) == path; });
}

bool AssetManifest::verify(const std::string& path) const {
    auto it = files_.find(path);
    if (it != files_.end()) return verify_asset(resolve(it->first), it->second);
    for (const auto& entry : files_) {
        if (resolve(entry.first) == path) return verify_asset(path, entry.second);
    }
    std::cerr << "[Assets] ERROR: " << path << " is not listed in the manifest\n";
    return false;
}

bool AssetManifest::verify_all() const {
    for (const auto& entry : files_) {
        if (!verify_asset(resolve(entry.first), entry.second)) return false;
    }
    return true;
}

bool AssetManifest::verify_signature(const std::string& secret) const {
    if (signature_.empty()) {
        std::cerr << "[Assets] ERROR: manifest is not signed\n";
        return false;
    }
    nlohmann::json root;
    root["files"] = files_;
    std::vector<uint8_t> cbor = nlohmann::json::to_cbor(root);
    std::string payload(cbor.begin(), cbor.end());
    if (crypto::hmac_sha256_hex(payload, secret) != lower(signature_)) {
        std::cerr << "[Assets] ERROR: manifest signature mismatch\n";
        return false;
    }
    return true;
}

std::string AssetManifest::build(const std::vector<std::string>& paths, const std::string& base_dir,
                                 std::vector<std::string>* failed) {
    nlohmann::json root;
    root["files"] = nlohmann::json::object();
    for (const auto& rel : paths) {
        std::string digest = crypto::sha256_file_hex(join(base_dir, rel));
        if (digest.empty()) {
            if (failed) failed->push_back(rel);
            continue;
        }
        root["files"][rel] = digest;
    }
    return root.dump(2);
}

} // namespace signflow
