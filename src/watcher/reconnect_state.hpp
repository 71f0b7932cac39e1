#ifndef CHAINRELAY_WATCHER_RECONNECT_STATE_HPP
#define CHAINRELAY_WATCHER_RECONNECT_STATE_HPP

#include <cstdint>
#include <optional>

#include "clock/clock.hpp"

namespace chainrelay::watcher {

    /**
     * Failure bookkeeping of one poller. Reset by every successful poll.
     */
    struct ReconnectState
    {
        uint32_t                                       consecutive_failures = 0;
        std::optional<clock::SystemClock::TimePoint>   last_successful_poll;

        void recordSuccess(clock::SystemClock::TimePoint when) {
            consecutive_failures = 0;
            last_successful_poll = when;
        }

        void recordFailure() {
            ++consecutive_failures;
        }
    };

}  // namespace chainrelay::watcher

#endif // CHAINRELAY_WATCHER_RECONNECT_STATE_HPP
