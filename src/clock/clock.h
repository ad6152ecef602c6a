// Clock
//
// Story:
// Registration leases are measured against a monotonic clock. Every component
// that needs "now" (registry, cleaner, gRPC service) takes a shared Clock so
// tests can drive expiry deterministically without sleeping.
//
// Thread Safety:
// All implementations are thread-safe.

#pragma once

#include <chrono>
#include <mutex>

namespace registration {

/// Abstract interface for obtaining the current time.
/// Allows dependency injection for testing.
class Clock {
 public:
  virtual ~Clock() = default;

  /// Returns the current time point.
  virtual std::chrono::steady_clock::time_point Now() const = 0;
};

/// Real clock implementation using std::chrono::steady_clock.
/// Use this in production code.
class RealClock : public Clock {
 public:
  std::chrono::steady_clock::time_point Now() const override {
    return std::chrono::steady_clock::now();
  }
};

/// Fake clock for testing. Time is manually controlled via Advance().
/// Starts at time_point{} (epoch).
class FakeClock : public Clock {
 public:
  std::chrono::steady_clock::time_point Now() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_time_;
  }

  /// Advances the clock by the specified duration.
  void Advance(std::chrono::steady_clock::duration duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_time_ += duration;
  }

  /// Sets the clock to a specific time point.
  void SetTime(std::chrono::steady_clock::time_point time) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_time_ = time;
  }

 private:
  mutable std::mutex mutex_;
  std::chrono::steady_clock::time_point current_time_{};
};

}  // namespace registration
