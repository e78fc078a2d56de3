#pragma once

#include <chrono>
#include <ctime>
#include <string>

// Global inline controls for diagnostics printed to stderr
inline bool gVerbose = false; // per-message protocol/session traces

// UTC timestamp, e.g. "2024-05-01T12:30:05Z" (iso) or "20240501_123005" (compact, for filenames)
inline std::string formatUtc(std::chrono::system_clock::time_point tp, bool compact) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), compact ? "%Y%m%d_%H%M%S" : "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buf);
}
