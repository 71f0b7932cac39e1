#ifndef CHAINRELAY_RELAY_RELAY_EXECUTOR_HPP
#define CHAINRELAY_RELAY_RELAY_EXECUTOR_HPP

#include <optional>

#include "primitives/bridge_event.hpp"
#include "primitives/relay_request.hpp"
#include "relay/error.hpp"

namespace chainrelay::relay {

  enum class RelayStatus {
    SUBMITTED,           // mint transaction accepted by the node
    ALREADY_PROCESSED,   // destination contract reports the nonce as done
    RECENTLY_SUBMITTED,  // this process submitted the nonce before
  };

  struct RelayReceipt {
    RelayStatus status = RelayStatus::SUBMITTED;
    primitives::RelayRequest request;
    std::optional<base::Hash256> tx_hash;
  };

  /**
   * Turns validated events into mint transactions on the destination chain
   */
  class RelayExecutor {
   public:
    virtual ~RelayExecutor() = default;

    /**
     * @brief Binds the destination contract through the destination link.
     * Called on every (re)connection.
     */
    virtual outcome::result<void> prepare() = 0;

    /**
     * @brief Relays one validated event. Safe to call again for the same
     * event: a nonce results in at most one mint.
     * @return RelayError::DESTINATION_UNAVAILABLE when the event could not
     * be looked at, submission errors once a transaction was attempted
     */
    virtual outcome::result<RelayReceipt> relay(
        const primitives::BridgeEvent &event) = 0;
  };

}  // namespace chainrelay::relay

#endif  // CHAINRELAY_RELAY_RELAY_EXECUTOR_HPP
