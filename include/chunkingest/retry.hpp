#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>

namespace chunkingest {

struct RetryPolicy {
  int max_attempts = 5; // всего попыток, включая первую
  std::chrono::milliseconds base_delay{500};
  std::chrono::milliseconds max_delay{30'000};
};

// Экспоненциальная задержка с полным джиттером:
// попытка n (с 1) ждёт U[0, min(max, base * 2^(n-1))].
class Backoff {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  explicit Backoff(RetryPolicy policy, std::uint32_t seed = std::random_device{}());

  // Верхняя граница задержки для попытки n
  std::chrono::milliseconds ceiling(int attempt) const;
  std::chrono::milliseconds next_delay(int attempt);

  // Ждёт next_delay(attempt) через sleeper (по умолчанию sleep_for)
  void wait(int attempt);
  void set_sleeper(Sleeper s) { sleeper_ = std::move(s); }

  const RetryPolicy &policy() const { return policy_; }

private:
  RetryPolicy policy_;
  std::mt19937 rng_;
  Sleeper sleeper_;
};

} // namespace chunkingest
