#ifndef CHAINRELAY_CLOCK_IMPL_CLOCK_IMPL_HPP
#define CHAINRELAY_CLOCK_IMPL_CLOCK_IMPL_HPP

#include "clock/clock.hpp"

namespace chainrelay::clock {

  /// Reads ClockType::now()
  template <typename ClockType>
  class ClockImpl : public Clock<ClockType> {
   public:
    typename Clock<ClockType>::TimePoint now() const override;
  };

  using SystemClockImpl = ClockImpl<std::chrono::system_clock>;

}  // namespace chainrelay::clock

#endif  // CHAINRELAY_CLOCK_IMPL_CLOCK_IMPL_HPP
