#include "relay/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::relay, RelayError, e) {
  using chainrelay::relay::RelayError;
  switch (e) {
    case RelayError::DESTINATION_UNAVAILABLE:
      return "destination chain is unavailable";
    case RelayError::REPLAY_CHECK_FAILED:
      return "cannot query the processed-nonce predicate";
    case RelayError::INCOMPLETE_EVENT:
      return "event lacks recipient, amount or nonce";
    case RelayError::TRANSACTION_BUILD_FAILED:
      return "cannot build the destination transaction";
    case RelayError::SIGNING_FAILED:
      return "cannot sign the destination transaction";
    case RelayError::SUBMISSION_NONCE_TOO_LOW:
      return "submission failed: nonce too low";
    case RelayError::SUBMISSION_INSUFFICIENT_FUNDS:
      return "submission failed: insufficient funds";
    case RelayError::SUBMISSION_REJECTED:
      return "submission rejected by the destination node";
  }
  return "unknown relay error";
}

namespace chainrelay::relay {

  bool isSubmissionError(const std::error_code &error) {
    return error == RelayError::TRANSACTION_BUILD_FAILED
           || error == RelayError::SIGNING_FAILED
           || error == RelayError::SUBMISSION_NONCE_TOO_LOW
           || error == RelayError::SUBMISSION_INSUFFICIENT_FUNDS
           || error == RelayError::SUBMISSION_REJECTED;
  }

  bool isConnectivityError(const std::error_code &error) {
    return error == RelayError::DESTINATION_UNAVAILABLE
           || error == RelayError::REPLAY_CHECK_FAILED;
  }

}  // namespace chainrelay::relay
