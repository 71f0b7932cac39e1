#include "clock/impl/clock_impl.hpp"

namespace chainrelay::clock {

  template <typename ClockType>
  typename Clock<ClockType>::TimePoint ClockImpl<ClockType>::now() const {
    return ClockType::now();
  }

  template class ClockImpl<std::chrono::system_clock>;

}  // namespace chainrelay::clock
