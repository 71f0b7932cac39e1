#ifndef CHAINRELAY_CLOCK_IMPL_INTERRUPTIBLE_SLEEPER_HPP
#define CHAINRELAY_CLOCK_IMPL_INTERRUPTIBLE_SLEEPER_HPP

#include <condition_variable>
#include <mutex>

#include "clock/sleeper.hpp"

namespace chainrelay::clock {

  class InterruptibleSleeper : public Sleeper {
   public:
    bool sleepFor(std::chrono::milliseconds delay) override;
    void interrupt() override;
    void reset() override;

   private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool interrupted_ = false;
  };

}  // namespace chainrelay::clock

#endif  // CHAINRELAY_CLOCK_IMPL_INTERRUPTIBLE_SLEEPER_HPP
