// asset_digest.cpp
// Writes or refreshes the SHA-256 manifest for model, label and scaler files.
// Usage: signflow_asset_digest <manifest.json> [file ...]
// Files are given relative to the manifest's directory. With no files, the
// ones already listed in the manifest are re-hashed.
// If environment variable SIGNFLOW_SECRET is set, an HMAC-SHA256 signature
// over the CBOR form of the manifest is added.

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "signflow/asset_manifest.hpp"
#include "signflow/crypto.hpp"

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        std::cerr << "Usage: signflow_asset_digest <manifest.json> [file ...]\n";
        return 2;
    }
    std::string path = argv[1];
    std::string base_dir = ".";
    auto slash = path.find_last_of('/');
    if (slash != std::string::npos)
        base_dir = slash == 0 ? "/" : path.substr(0, slash);

    std::vector<std::string> files;
    for (int i = 2; i < argc; ++i)
        files.push_back(argv[i]);

    if (files.empty())
    {
        signflow::AssetManifest existing;
        if (!existing.load_from_file(path))
        {
            std::cerr << "Nothing to hash: no files given and no readable manifest at " << path << "\n";
            return 2;
        }
        for (const auto &entry : existing.files())
            files.push_back(entry.first);
    }

    std::vector<std::string> failed;
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(signflow::AssetManifest::build(files, base_dir, &failed));
    } catch (const std::exception &e) {
        std::cerr << "JSON error: " << e.what() << "\n";
        return 2;
    }
    for (const auto &f : failed)
        std::cerr << "Failed to read " << f << "\n";
    if (!failed.empty())
        return 2;

    // Serialize to CBOR deterministic representation
    const char *secret_env = std::getenv("SIGNFLOW_SECRET");
    if (secret_env && *secret_env)
    {
        std::vector<uint8_t> cbor = nlohmann::json::to_cbor(j);
        std::string payload(cbor.begin(), cbor.end());
        j["signature"] = signflow::crypto::hmac_sha256_hex(payload, std::string(secret_env));
    }

    // Write atomically to a temp file then rename
    std::string tmp = path + ".tmp";
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open())
    {
        std::cerr << "Failed to open temp file for writing: " << tmp << "\n";
        return 2;
    }
    out << j.dump(2) << "\n";
    out.close();

    if (std::rename(tmp.c_str(), path.c_str()) != 0)
    {
        std::perror("rename");
        std::remove(tmp.c_str());
        return 2;
    }

    std::cout << "Wrote " << files.size() << " digests to " << path << "\n";
    if (j.contains("signature"))
        std::cout << "Signature: " << j["signature"].get<std::string>() << "\n";
    return 0;
}
