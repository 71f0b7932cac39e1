#ifndef CHAINRELAY_WATCHER_PENDING_RELAY_QUEUE_HPP
#define CHAINRELAY_WATCHER_PENDING_RELAY_QUEUE_HPP

#include <deque>

#include "primitives/bridge_event.hpp"

namespace chainrelay::watcher {

    /**
     * Event waiting to be relayed again
     */
    struct PendingRelay
    {
        primitives::BridgeEvent event;
        bool                    validated           = false;
        uint32_t                submission_failures = 0;
    };

    /**
     * In-memory FIFO of events the destination could not take yet. Events
     * are unique by nonce; nothing survives a restart.
     */
    class PendingRelayQueue
    {
    public:
        /**
         * @return false if an event with the same nonce is already queued
         */
        bool push(PendingRelay item);

        bool contains(const primitives::BridgeEvent &event) const;

        /// Removes and returns every queued event, oldest first
        std::deque<PendingRelay> takeAll();

        bool empty() const {
            return items_.empty();
        }

        size_t size() const {
            return items_.size();
        }

    private:
        std::deque<PendingRelay> items_;
    };

}  // namespace chainrelay::watcher

#endif // CHAINRELAY_WATCHER_PENDING_RELAY_QUEUE_HPP
