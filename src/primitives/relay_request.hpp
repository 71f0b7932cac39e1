#ifndef CHAINRELAY_PRIMITIVES_RELAY_REQUEST_HPP
#define CHAINRELAY_PRIMITIVES_RELAY_REQUEST_HPP

#include "base/uint256.hpp"
#include "eth/address.hpp"

namespace chainrelay::primitives {

  /**
   * Arguments of the destination mint call, derived 1:1 from a validated
   * BridgeEvent
   */
  struct RelayRequest {
    eth::Address recipient;
    base::uint256_t amount;
    base::uint256_t source_nonce;

    bool operator==(const RelayRequest &other) const {
      return recipient == other.recipient && amount == other.amount
             && source_nonce == other.source_nonce;
    }
  };

}  // namespace chainrelay::primitives

#endif  // CHAINRELAY_PRIMITIVES_RELAY_REQUEST_HPP
