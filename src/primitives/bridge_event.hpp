#ifndef CHAINRELAY_PRIMITIVES_BRIDGE_EVENT_HPP
#define CHAINRELAY_PRIMITIVES_BRIDGE_EVENT_HPP

#include <optional>

#include "base/blob.hpp"
#include "base/uint256.hpp"
#include "chain/event_log.hpp"
#include "eth/address.hpp"

namespace chainrelay::primitives {

  /**
   * Lock observed on the source chain. Built once from a log entry and
   * never changed afterwards; the nonce alone identifies it for replay
   * protection. Members the log could not supply stay empty so the
   * completeness check can reject the event.
   */
  struct BridgeEvent {
    uint64_t source_chain_id = 0;
    base::Hash256 source_tx_hash;
    std::optional<eth::Address> from;
    std::optional<eth::Address> to;
    std::optional<base::uint256_t> amount;
    std::optional<base::uint256_t> nonce;
    uint64_t block_number = 0;

    static BridgeEvent fromLog(const chain::EventLog &log,
                               uint64_t source_chain_id);

    /// Nonce for log lines, "?" when missing
    std::string nonceText() const;
  };

}  // namespace chainrelay::primitives

#endif  // CHAINRELAY_PRIMITIVES_BRIDGE_EVENT_HPP
