#pragma once

#include <map>
#include <string>
#include <vector>

namespace signflow {

// True when the file exists and its SHA-256 matches expected_hex
bool verify_asset(const std::string& path, const std::string& expected_hex);

/**
 * @brief SHA-256 digests for model, label and scaler files
 *
 * JSON layout: {"files": {"<path relative to the manifest>": "<hex>"},
 *               "signature": "<optional hex>"}
 */
class AssetManifest {
public:
    bool load_from_file(const std::string& path);
    bool load_from_string(const std::string& text, const std::string& base_dir = ".");

    // Checks every listed file; false on the first missing or mismatched one
    bool verify_all() const;

    // Checks one asset by absolute or manifest-relative path. A path not
    // listed in the manifest fails.
    bool verify(const std::string& path) const;

    // HMAC-SHA256 over the CBOR form of {"files": ...}; false when unsigned
    bool verify_signature(const std::string& secret) const;

    bool contains(const std::string& path) const;
    const std::map<std::string, std::string>& files() const { return files_; }
    const std::string& base_dir() const { return base_dir_; }
    const std::string& signature() const { return signature_; }

    // Manifest for `paths` relative to `base_dir`; skips unreadable files
    static std::string build(const std::vector<std::string>& paths, const std::string& base_dir,
                             std::vector<std::string>* failed = nullptr);

private:
    std::string resolve(const std::string& relative) const;

    std::string base_dir_{"."};
    std::map<std::string, std::string> files_;
    std::string signature_;
};

} // namespace signflow
