#include "application/impl/config_reader/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::application,
                            ConfigError,
                            e) {
  using E = chainrelay::application::ConfigError;
  switch (e) {
    case E::FILE_NOT_READABLE:
      return "The config file cannot be read";
    case E::PARSER_ERROR:
      return "The config file is not valid JSON";
    case E::INVALID_VALUE:
      return "A config entry has the wrong type or an unparsable value";
    case E::PLACEHOLDER_VALUE:
      return "A config entry still holds its template placeholder";
    case E::INVALID_ADDRESS:
      return "A configured address is not a 20-byte hex address";
    case E::INVALID_ABI:
      return "A configured ABI cannot be parsed";
    case E::MISSING_EVENT:
      return "The source ABI lacks the watched event or its from/to/amount/nonce arguments";
    case E::MISSING_FUNCTION:
      return "The destination ABI lacks the mint function or the processed-nonce predicate";
    case E::NON_POSITIVE_INTERVAL:
      return "Intervals and timeouts must be positive";
    case E::INVALID_PRIVATE_KEY:
      return "The validator private key is malformed";
    case E::VALIDATOR_MISMATCH:
      return "The validator private key does not belong to the validator address";
  }
  return "Unknown error";
}
