#include "clock/impl/interruptible_sleeper.hpp"

namespace chainrelay::clock {

  bool InterruptibleSleeper::sleepFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, delay, [this] { return interrupted_; });
  }

  void InterruptibleSleeper::interrupt() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      interrupted_ = true;
    }
    cv_.notify_all();
  }

  void InterruptibleSleeper::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = false;
  }

}  // namespace chainrelay::clock
