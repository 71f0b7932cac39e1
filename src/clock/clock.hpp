#ifndef CHAINRELAY_CLOCK_HPP
#define CHAINRELAY_CLOCK_HPP

#include <chrono>

namespace chainrelay::clock {

  /**
   * Source of the current time, replaceable in tests
   * @tparam ClockType std::chrono clock the time points belong to
   */
  template <typename ClockType>
  class Clock {
   public:
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
  };

  /**
   * Wall clock, used to stamp the last successful poll
   */
  using SystemClock = Clock<std::chrono::system_clock>;

}  // namespace chainrelay::clock

#endif  // CHAINRELAY_CLOCK_HPP
