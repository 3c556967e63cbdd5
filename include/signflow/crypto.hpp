#pragma once
#include <string>

namespace signflow {
namespace crypto {

// Lowercase hex HMAC-SHA256 of data, keyed with key
std::string hmac_sha256_hex(const std::string& data, const std::string& key);
// Lowercase hex SHA256 digest of data
std::string sha256_hex(const std::string& data);
// Digest of a file read in chunks; empty when the file cannot be read
std::string sha256_file_hex(const std::string& path);

} // namespace crypto
} // namespace signflow
