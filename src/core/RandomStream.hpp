#pragma once

#include <chrono>
#include <cstdint>
#include <random>

// Explicitly owned pseudo-random source handed to the speed and physiology
// generators. A run that needs to be reproducible constructs one with a fixed
// seed; otherwise the seed comes from the clock.
class RandomStream {
public:
  RandomStream() : RandomStream(clockSeed()) {}
  explicit RandomStream(uint64_t seed) : seed_(seed), rng_(seed) {}

  // N(mean, sd) draw. sd == 0 returns mean.
  double normal(double mean, double sd) {
    if (!(sd > 0.0))
      return mean;
    std::normal_distribution<double> dist(mean, sd);
    return dist(rng_);
  }

  // Uniform integer in [lo, hi]
  int uniformInt(int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng_);
  }

  // Small integer jitter in {-1, 0, 1}
  int jitter() { return uniformInt(-1, 1); }

  uint64_t seed() const noexcept { return seed_; }

private:
  static uint64_t clockSeed() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    return static_cast<uint64_t>(ns);
  }

  uint64_t seed_;
  std::mt19937_64 rng_;
};
