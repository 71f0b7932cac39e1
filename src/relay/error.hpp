#ifndef CHAINRELAY_RELAY_ERROR_HPP
#define CHAINRELAY_RELAY_ERROR_HPP

#include "outcome/outcome.hpp"

namespace chainrelay::relay {

  enum class RelayError {
    DESTINATION_UNAVAILABLE = 1,  // destination link is down, event kept
    REPLAY_CHECK_FAILED,          // processed-nonce call could not be made
    INCOMPLETE_EVENT,             // event lacks recipient, amount or nonce
    TRANSACTION_BUILD_FAILED,     // calldata, gas price or account nonce
    SIGNING_FAILED,
    SUBMISSION_NONCE_TOO_LOW,
    SUBMISSION_INSUFFICIENT_FUNDS,
    SUBMISSION_REJECTED,
  };

  /**
   * @return true for errors raised once the destination was reachable and a
   * transaction was being built or submitted
   */
  bool isSubmissionError(const std::error_code &error);

  /**
   * @return true for errors that mean the destination chain cannot be used
   * right now
   */
  bool isConnectivityError(const std::error_code &error);

}  // namespace chainrelay::relay

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::relay, RelayError)

#endif  // CHAINRELAY_RELAY_ERROR_HPP
