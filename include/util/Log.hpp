// stderr diagnostics; stdout carries JSON only
#pragma once
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace hostpulse::util {

// True when HOSTPULSE_LOG (or hostpulse_log) is set to 1/t/y.
inline bool log_enabled() {
  const char* v = std::getenv("HOSTPULSE_LOG");
  if (!v || !*v) v = std::getenv("hostpulse_log");
  return v && (v[0]=='1'||v[0]=='t'||v[0]=='T'||v[0]=='y'||v[0]=='Y');
}

__attribute__((format(printf, 1, 2)))
inline void log_error(const char* fmt, ...) {
  std::fputs("hostpulse: ", stderr);
  va_list ap; va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fputc('\n', stderr);
}

__attribute__((format(printf, 1, 2)))
inline void log_debug(const char* fmt, ...) {
  if (!log_enabled()) return;
  std::fputs("hostpulse: ", stderr);
  va_list ap; va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fputc('\n', stderr);
}

} // namespace hostpulse::util
