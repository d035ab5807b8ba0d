#include "RetryPolicy.hpp"

#include <algorithm>
#include <thread>

namespace safs {

void SystemSleeper::sleep(std::chrono::milliseconds d) {
  if (d.count() > 0) std::this_thread::sleep_for(d);
}

std::chrono::milliseconds RetryPolicy::delayFor(int attempt, std::mt19937_64* rng) const {
  if (attempt < 1) attempt = 1;
  int64_t ms = baseDelay.count();
  for (int i = 1; i < attempt && ms < maxDelay.count(); ++i) ms *= 2;
  ms = std::min<int64_t>(ms, maxDelay.count());

  if (rng && jitter > 0.0) {
    std::uniform_real_distribution<double> dist(1.0 - std::min(jitter, 1.0), 1.0);
    ms = static_cast<int64_t>(static_cast<double>(ms) * dist(*rng));
  }
  return std::chrono::milliseconds(ms);
}

} // namespace safs
