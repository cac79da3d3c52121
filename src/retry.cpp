#include "chunkingest/retry.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace chunkingest {

Backoff::Backoff(RetryPolicy policy, std::uint32_t seed)
    : policy_(policy), rng_(seed) {
  if (policy_.max_attempts < 1)
    throw std::invalid_argument("max attempts must be >= 1");
  if (policy_.base_delay.count() < 0 || policy_.max_delay.count() < 0)
    throw std::invalid_argument("retry delays must be >= 0");
  sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

std::chrono::milliseconds Backoff::ceiling(int attempt) const {
  if (attempt < 1)
    return std::chrono::milliseconds{0};
  const std::int64_t max = policy_.max_delay.count();
  std::int64_t d = policy_.base_delay.count();
  for (int i = 1; i < attempt && d < max; ++i)
    d *= 2;
  return std::chrono::milliseconds{std::min(d, max)};
}

std::chrono::milliseconds Backoff::next_delay(int attempt) {
  const auto hi = ceiling(attempt).count();
  if (hi <= 0)
    return std::chrono::milliseconds{0};
  std::uniform_int_distribution<std::int64_t> dist(0, hi);
  return std::chrono::milliseconds{dist(rng_)};
}

void Backoff::wait(int attempt) {
  const auto d = next_delay(attempt);
  if (d.count() > 0)
    sleeper_(d);
}

} // namespace chunkingest
