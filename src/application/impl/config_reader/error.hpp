#ifndef CHAINRELAY_APPLICATION_CONFIG_READER_ERROR_HPP
#define CHAINRELAY_APPLICATION_CONFIG_READER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace chainrelay::application {

  /**
   * Codes for errors that originate in configuration readers and validation
   */
  enum class ConfigError {
    FILE_NOT_READABLE = 1,
    PARSER_ERROR,
    INVALID_VALUE,
    PLACEHOLDER_VALUE,
    INVALID_ADDRESS,
    INVALID_ABI,
    MISSING_EVENT,
    MISSING_FUNCTION,
    NON_POSITIVE_INTERVAL,
    INVALID_PRIVATE_KEY,
    VALIDATOR_MISMATCH
  };

}

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::application, ConfigError);

#endif  // CHAINRELAY_APPLICATION_CONFIG_READER_ERROR_HPP
