#pragma once
#include <cstdint>
#include <string>
#include <string_view>

// Lowercase hex SHA-256 of data. Throws std::runtime_error if OpenSSL fails.
std::string sha256_hex(std::string_view data);

// "<prefix>-<32 hex chars>", random per call.
std::string generate_id(const std::string& prefix);

// Wall clock in milliseconds since the epoch; used for timestamps and idle checks.
int64_t now_millis();
