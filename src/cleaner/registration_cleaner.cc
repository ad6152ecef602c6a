// Registration Cleaner - Implementation
//
// See registration_cleaner.h for the Story and algorithm description.

#include "registration_cleaner.h"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace registration {

RegistrationCleaner::RegistrationCleaner(
    ClientRegistry* registry, std::chrono::milliseconds cleanup_period,
    std::chrono::milliseconds shutdown_timeout)
    : registry_(registry),
      cleanup_period_(cleanup_period),
      shutdown_timeout_(shutdown_timeout),
      sweep_count_(std::make_shared<std::atomic<uint64_t>>(0)) {
  if (cleanup_period_ <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("cleanup period must be positive");
  }
}

RegistrationCleaner::~RegistrationCleaner() {
  Stop();
}

bool RegistrationCleaner::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return false;  // Already running
  }

  run_state_ = std::make_shared<RunState>();
  std::promise<void> done;
  worker_done_ = done.get_future();
  worker_thread_ = std::thread(&RegistrationCleaner::RunLoop, run_state_,
                               registry_, cleanup_period_, sweep_count_,
                               std::move(done));
  running_ = true;
  return true;
}

void RegistrationCleaner::Stop() {
  std::shared_ptr<RunState> state;
  std::thread worker;
  std::future<void> done;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;  // Already stopped
    }
    running_ = false;
    state = std::move(run_state_);
    worker = std::move(worker_thread_);
    done = std::move(worker_done_);
  }

  // Cancel future firings
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->cancelled = true;
  }
  state->cv.notify_all();

  // Stop() called from a listener running inside a sweep
  if (worker.get_id() == std::this_thread::get_id()) {
    worker.detach();
    return;
  }

  // Give a running sweep a bounded amount of time to finish
  if (done.wait_for(shutdown_timeout_) == std::future_status::ready) {
    worker.join();
    return;
  }

  std::cerr << "Warning: registration cleanup did not finish within "
            << shutdown_timeout_.count() << "ms, detaching cleaner thread"
            << std::endl;
  worker.detach();
}

bool RegistrationCleaner::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

size_t RegistrationCleaner::SweepNow() {
  size_t removed = Sweep(registry_);
  sweep_count_->fetch_add(1);
  return removed;
}

uint64_t RegistrationCleaner::GetSweepCount() const {
  return sweep_count_->load();
}

void RegistrationCleaner::RunLoop(
    std::shared_ptr<RunState> state, ClientRegistry* registry,
    std::chrono::milliseconds period,
    std::shared_ptr<std::atomic<uint64_t>> sweep_count,
    std::promise<void> done) {
  auto next_fire = std::chrono::steady_clock::now() + period;

  while (true) {
    // Wait for the next firing or cancellation
    {
      std::unique_lock<std::mutex> lock(state->mutex);
      if (state->cv.wait_until(lock, next_fire,
                               [&state]() { return state->cancelled; })) {
        break;
      }
    }

    Sweep(registry);
    sweep_count->fetch_add(1);

    // Fixed rate: skip firings missed while the sweep was running
    next_fire += period;
    auto now = std::chrono::steady_clock::now();
    if (next_fire <= now) {
      next_fire += ((now - next_fire) / period + 1) * period;
    }
  }

  done.set_value();
}

size_t RegistrationCleaner::Sweep(ClientRegistry* registry) {
  size_t removed = 0;

  try {
    // Clients registered after this snapshot wait for the next sweep
    std::vector<Client> snapshot = registry->AllClients();

    for (const Client& client : snapshot) {
      try {
        if (!registry->IsExpired(client)) {
          continue;
        }
        // Force de-registration; the registry re-checks the stored lease
        if (registry->DeregisterIfExpired(client.registration_id)) {
          ++removed;
        }
      } catch (const std::exception& e) {
        std::cerr << "Failed to clean up registration "
                  << client.registration_id << " (endpoint "
                  << client.endpoint << "): " << e.what() << std::endl;
      } catch (...) {
        std::cerr << "Failed to clean up registration "
                  << client.registration_id << " (endpoint "
                  << client.endpoint << "): non-standard exception"
                  << std::endl;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Unexpected error while cleaning registrations: " << e.what()
              << std::endl;
  } catch (...) {
    std::cerr << "Unexpected non-standard error while cleaning registrations"
              << std::endl;
  }

  return removed;
}

}  // namespace registration
