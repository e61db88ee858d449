#include "util/Utf8.hpp"

namespace hostpulse::util {

static bool cont(unsigned char c) { return (c & 0xC0) == 0x80; }

int u8_valid_len(const std::string& s, size_t i) {
  if (i >= s.size()) return 0;
  auto at = [&](size_t k) -> unsigned char { return static_cast<unsigned char>(s[i + k]); };
  unsigned char c = at(0);
  if (c < 0x80) return 1;
  int len = 0;
  unsigned char lo = 0x80, hi = 0xBF; // bounds for the second byte
  if (c >= 0xC2 && c <= 0xDF) len = 2;
  else if (c == 0xE0) { len = 3; lo = 0xA0; }
  else if (c == 0xED) { len = 3; hi = 0x9F; }  // no surrogates
  else if (c >= 0xE1 && c <= 0xEF) len = 3;
  else if (c == 0xF0) { len = 4; lo = 0x90; }
  else if (c == 0xF4) { len = 4; hi = 0x8F; }  // <= U+10FFFF
  else if (c >= 0xF1 && c <= 0xF3) len = 4;
  else return 0;
  if (i + static_cast<size_t>(len) > s.size()) return 0;
  if (at(1) < lo || at(1) > hi) return 0;
  for (int k = 2; k < len; ++k)
    if (!cont(at(static_cast<size_t>(k)))) return 0;
  return len;
}

std::string to_valid_utf8(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size();) {
    int len = u8_valid_len(s, i);
    if (len == 0) {
      out += "\xEF\xBF\xBD";
      ++i;
      continue;
    }
    out.append(s, i, static_cast<size_t>(len));
    i += static_cast<size_t>(len);
  }
  return out;
}

} // namespace hostpulse::util
