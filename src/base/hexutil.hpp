#ifndef CHAINRELAY_HEXUTIL_HPP
#define CHAINRELAY_HEXUTIL_HPP

#include <string_view>
#include <vector>

#include <gsl/span>
#include "outcome/outcome.hpp"

namespace chainrelay::base {

  enum class UnhexError {
    ODD_LENGTH = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
  };

  /**
   * @brief Lowercase hex of bytes, no prefix
   */
  std::string hex_lower(gsl::span<const uint8_t> bytes) noexcept;

  /**
   * @brief Lowercase hex with a 0x prefix, the form JSON-RPC nodes expect
   * for DATA values
   */
  std::string hex_lower_0x(gsl::span<const uint8_t> bytes) noexcept;

  /**
   * @brief Decodes hex of even length, either case, without prefix
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Decodes a DATA value; the 0x prefix is required
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

  /**
   * @brief Decodes hex typed by a user, with or without 0x prefix
   */
  outcome::result<std::vector<uint8_t>> unhexOptional0x(std::string_view hex);

  /// true when the text starts with 0x or 0X
  bool hasHexPrefix(std::string_view text);

}  // namespace chainrelay::base

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::base, UnhexError);

#endif  // CHAINRELAY_HEXUTIL_HPP
