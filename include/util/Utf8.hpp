// UTF-8 validation for strings read from the host
#pragma once
#include <string>

namespace hostpulse::util {

// Length of the well-formed UTF-8 sequence starting at s[i], 0 if it is not one
int u8_valid_len(const std::string& s, size_t i);

// Copy of s with every byte that is not part of a well-formed sequence
// replaced by U+FFFD. Valid input is returned unchanged.
std::string to_valid_utf8(const std::string& s);

} // namespace hostpulse::util
