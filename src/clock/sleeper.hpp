#ifndef CHAINRELAY_CLOCK_SLEEPER_HPP
#define CHAINRELAY_CLOCK_SLEEPER_HPP

#include <chrono>

namespace chainrelay::clock {

  /**
   * Blocking delay used by long running loops. Kept behind an interface so
   * poll and backoff timing can be driven by tests without real waiting.
   */
  class Sleeper {
   public:
    virtual ~Sleeper() = default;

    /**
     * Block the calling thread
     * @param delay - how long to wait
     * @return false if the wait was cut short by interrupt()
     */
    virtual bool sleepFor(std::chrono::milliseconds delay) = 0;

    /**
     * Wake any current sleeper and make further sleeps return immediately
     * until reset() is called
     */
    virtual void interrupt() = 0;

    /**
     * Clear a previous interrupt()
     */
    virtual void reset() = 0;
  };

}  // namespace chainrelay::clock

#endif  // CHAINRELAY_CLOCK_SLEEPER_HPP
