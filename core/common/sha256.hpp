#pragma once

#include <string>

namespace hearth {

// Lower-case hex SHA-256 of data; empty string if the digest cannot be computed
std::string sha256_hex(const std::string &data);

// 64 hex digits, either case
bool is_sha256_hex(const std::string &text);

}  // namespace hearth
