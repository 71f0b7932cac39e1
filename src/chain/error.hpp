#ifndef CHAINRELAY_CHAIN_ERROR_HPP
#define CHAINRELAY_CHAIN_ERROR_HPP

#include "outcome/outcome.hpp"

namespace chainrelay::chain {

  enum class ChainLinkError {
    CONNECTION_FAILED = 1,  // rpc session could not be established
    NOT_CONNECTED,          // operation needs a live session
    CHAIN_ID_MISMATCH,      // node serves a different chain than configured
    MALFORMED_RESPONSE,     // node answered with unexpected data
    CALL_FAILED,            // eth_call or another read failed
    FILTER_NOT_FOUND,       // node dropped the log filter
    NONCE_TOO_LOW,          // transaction nonce already used
    INSUFFICIENT_FUNDS,     // sender cannot pay gas * price + value
    TRANSACTION_REJECTED,   // any other submission failure
  };

}  // namespace chainrelay::chain

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::chain, ChainLinkError)

#endif  // CHAINRELAY_CHAIN_ERROR_HPP
