#include "chain/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::chain, ChainLinkError, e) {
  using chainrelay::chain::ChainLinkError;
  switch (e) {
    case ChainLinkError::CONNECTION_FAILED:
      return "cannot connect to the chain node";
    case ChainLinkError::NOT_CONNECTED:
      return "chain link is not connected";
    case ChainLinkError::CHAIN_ID_MISMATCH:
      return "node reports a different chain id";
    case ChainLinkError::MALFORMED_RESPONSE:
      return "node returned unexpected data";
    case ChainLinkError::CALL_FAILED:
      return "contract call failed";
    case ChainLinkError::FILTER_NOT_FOUND:
      return "log filter is unknown to the node";
    case ChainLinkError::NONCE_TOO_LOW:
      return "transaction nonce too low";
    case ChainLinkError::INSUFFICIENT_FUNDS:
      return "insufficient funds for gas * price + value";
    case ChainLinkError::TRANSACTION_REJECTED:
      return "transaction rejected by the node";
  }
  return "unknown chain link error";
}
