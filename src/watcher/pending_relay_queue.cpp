#include "watcher/pending_relay_queue.hpp"

#include <algorithm>

namespace chainrelay::watcher {

    bool PendingRelayQueue::push(PendingRelay item) {
        if (contains(item.event)) {
            return false;
        }
        items_.push_back(std::move(item));
        return true;
    }

    bool PendingRelayQueue::contains(const primitives::BridgeEvent &event) const {
        if (!event.nonce) {
            return false;
        }
        return std::any_of(items_.begin(), items_.end(), [&event](const PendingRelay &item) {
            return item.event.nonce == event.nonce;
        });
    }

    std::deque<PendingRelay> PendingRelayQueue::takeAll() {
        std::deque<PendingRelay> taken;
        taken.swap(items_);
        return taken;
    }

}  // namespace chainrelay::watcher
