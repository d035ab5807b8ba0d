#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace safs {

// Source of waiting. Tests substitute a fake that records requested delays.
class Sleeper {
public:
  virtual ~Sleeper() = default;
  virtual void sleep(std::chrono::milliseconds d) = 0;
};

class SystemSleeper : public Sleeper {
public:
  void sleep(std::chrono::milliseconds d) override;
};

// Bounded exponential backoff: delay(n) = min(maxDelay, baseDelay * 2^(n-1)),
// then scaled by a random factor in [1 - jitter, 1].
struct RetryPolicy {
  int maxAttempts = 5;
  std::chrono::milliseconds baseDelay{500};
  std::chrono::milliseconds maxDelay{30000};
  double jitter = 0.2;

  // attempt is 1-based: the delay before retry number `attempt`.
  std::chrono::milliseconds delayFor(int attempt, std::mt19937_64* rng = nullptr) const;
};

} // namespace safs
