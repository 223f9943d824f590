#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Decodes bytes as UTF-8, replacing every ill-formed subsequence with U+FFFD.
// The result is always valid UTF-8 and safe to put into a JSON string.
std::string utf8_lossy(const std::vector<uint8_t>& bytes);
std::string utf8_lossy(const std::string& bytes);

// True when `bytes` is well-formed UTF-8.
bool is_valid_utf8(const std::string& bytes);
