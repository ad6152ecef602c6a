// Registration Cleaner
//
// Story:
// Devices are expected to refresh their registration before its lifetime
// runs out. Devices that vanish without deregistering are evicted by this
// background task: every cleanup period it scans all registrations and
// deregisters the expired ones through the registry, so listeners see the
// same unregistered event as for an explicit deregistration.
//
// Algorithm:
// 1. Start() spawns a worker thread that fires at a fixed period
// 2. Each firing takes one snapshot of all clients, filters the expired ones
//    and calls ClientRegistry::DeregisterIfExpired for each. The registry
//    re-checks the stored lease under the per-client lock, so a client
//    refreshed since the snapshot survives
// 3. A failure for one client is logged and the sweep moves on; a failure of
//    the whole sweep is logged and the schedule keeps going
// 4. Stop() cancels future firings and waits, up to the shutdown timeout, for
//    a running sweep to finish. On timeout the worker is detached and a
//    warning is logged
//
// Thread Safety:
// All public methods are thread-safe. The registry must outlive the cleaner
// and, after a timed-out Stop(), the detached sweep.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

#include "client_registry.h"

namespace registration {

/// Periodically evicts expired registrations.
///
/// Example:
///   RegistrationCleaner cleaner(&registry);  // sweeps every 2s
///   cleaner.Start();
///   ...
///   cleaner.Stop();
class RegistrationCleaner {
 public:
  /// Constructs a stopped cleaner.
  ///
  /// @param registry Registry to sweep (not owned, must outlive this object).
  /// @param cleanup_period Time between sweeps.
  /// @throws std::invalid_argument if cleanup_period is not positive.
  /// @param shutdown_timeout Maximum time Stop() waits for a running sweep.
  explicit RegistrationCleaner(
      ClientRegistry* registry,
      std::chrono::milliseconds cleanup_period = std::chrono::seconds(2),
      std::chrono::milliseconds shutdown_timeout = std::chrono::seconds(5));

  /// Destructor. Calls Stop() if running.
  ~RegistrationCleaner();

  // Non-copyable, non-movable
  RegistrationCleaner(const RegistrationCleaner&) = delete;
  RegistrationCleaner& operator=(const RegistrationCleaner&) = delete;

  /// Starts periodic sweeping. The first sweep runs one period after start.
  ///
  /// @return true if started, false if already running.
  bool Start();

  /// Stops periodic sweeping.
  ///
  /// Future sweeps are cancelled immediately. A sweep in progress is given
  /// up to the shutdown timeout to finish. No-op if not running.
  void Stop();

  /// Returns whether periodic sweeping is active.
  bool IsRunning() const;

  /// Runs one sweep synchronously on the calling thread.
  ///
  /// @return Number of clients removed.
  size_t SweepNow();

  /// Returns the number of sweeps completed since construction, including
  /// SweepNow() calls.
  uint64_t GetSweepCount() const;

 private:
  /// State shared with the worker thread. Outlives the cleaner if the worker
  /// has to be detached.
  struct RunState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
  };

  /// Worker thread function.
  static void RunLoop(std::shared_ptr<RunState> state,
                      ClientRegistry* registry,
                      std::chrono::milliseconds period,
                      std::shared_ptr<std::atomic<uint64_t>> sweep_count,
                      std::promise<void> done);

  /// Performs one sweep. Never throws.
  static size_t Sweep(ClientRegistry* registry);

  // Dependency (not owned)
  ClientRegistry* registry_;

  // Configuration
  std::chrono::milliseconds cleanup_period_;
  std::chrono::milliseconds shutdown_timeout_;

  // Worker control (protected by mutex_)
  std::shared_ptr<RunState> run_state_;
  std::thread worker_thread_;
  std::future<void> worker_done_;
  bool running_ = false;
  mutable std::mutex mutex_;

  std::shared_ptr<std::atomic<uint64_t>> sweep_count_;
};

}  // namespace registration
