#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace chunkingest {

// Приводит timestamp к секундам (UTC).
// Если приходит миллисекунды/микросекунды — конвертируем эвристикой.
inline std::time_t to_time_t_seconds(int64_t ts) {
  if (ts > 10'000'000'000LL) {
    if (ts > 10'000'000'000'000LL) {
      return static_cast<std::time_t>(ts / 1'000'000); // микросекунды → секунды
    }
    return static_cast<std::time_t>(ts / 1'000); // миллисекунды → секунды
  }
  return static_cast<std::time_t>(ts); // секунды
}

// ISO-8601 UTC с миллисекундами: 2025-09-01T10:02:03.123Z
std::string format_iso8601_utc(std::chrono::system_clock::time_point tp);

inline std::string utc_now_iso() {
  return format_iso8601_utc(std::chrono::system_clock::now());
}

} // namespace chunkingest
