#pragma once
#include <string>
#include <vector>
#include <cstdint>

// Lowercase hex SHA-256 of the input.
std::string sha256_hex(const std::string& data);
std::string sha256_hex(const std::vector<uint8_t>& data);

// Lowercase hex of `nbytes` bytes from the OpenSSL CSPRNG. Empty on failure.
std::string random_hex(size_t nbytes);
