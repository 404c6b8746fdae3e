#pragma once
#include <string>
#include <vector>

namespace pattern_harness {

// Lowercase hex SHA-256 of the data. Throws std::runtime_error if OpenSSL fails.
std::string sha256_hex(const std::string& data);

// Fingerprint of an output sequence: each line terminated by '\n' before hashing.
std::string output_digest(const std::vector<std::string>& lines);

}
