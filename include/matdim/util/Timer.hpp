#pragma once

#include <chrono>

namespace matdim::util {

class Stopwatch {
public:
  using clock = std::chrono::steady_clock;

  Stopwatch() : t0_(clock::now()) {}

  void restart() { t0_ = clock::now(); }

  double seconds() const {
    return std::chrono::duration_cast<std::chrono::duration<double>>(clock::now() - t0_).count();
  }

private:
  clock::time_point t0_;
};

// Adds the lifetime of the scope to `*accumulator` (no-op for nullptr).
class ScopedTimer {
public:
  explicit ScopedTimer(double* accumulator) : acc_(accumulator) {}
  ~ScopedTimer() {
    if (acc_) *acc_ += sw_.seconds();
  }

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
  double* acc_ = nullptr;
  Stopwatch sw_;
};

} // namespace matdim::util
