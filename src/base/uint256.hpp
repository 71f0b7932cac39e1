#ifndef CHAINRELAY_BASE_UINT256_HPP
#define CHAINRELAY_BASE_UINT256_HPP

#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>
#include <gsl/span>

#include "base/blob.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay::base {

  using uint256_t = boost::multiprecision::uint256_t;

  enum class QuantityError {
    EMPTY_INPUT = 1,
    MISSING_0X_PREFIX,
    NON_HEX_INPUT,
    NON_DECIMAL_INPUT,
    VALUE_OVERFLOW
  };

  /**
   * @brief Parses a JSON-RPC QUANTITY ("0x1a", "0x0") into an integer
   */
  outcome::result<uint256_t> parseQuantity(std::string_view quantity);

  /**
   * @brief Parses an unsigned decimal string, rejecting anything that does
   * not fit 256 bits
   */
  outcome::result<uint256_t> parseDecimal(std::string_view decimal);

  /**
   * @brief Renders an integer as a minimal JSON-RPC QUANTITY
   */
  std::string toQuantity(const uint256_t &value);

  std::string toDecimal(const uint256_t &value);

  /// 32-byte big-endian word, as used by ABI encoding
  Hash256 toBigEndianWord(const uint256_t &value);

  /// Big-endian bytes without leading zeroes, empty for zero (RLP integers)
  std::vector<uint8_t> toMinimalBigEndian(const uint256_t &value);

  /// Interprets up to 32 big-endian bytes as an unsigned integer
  outcome::result<uint256_t> fromBigEndian(gsl::span<const uint8_t> bytes);

}  // namespace chainrelay::base

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::base, QuantityError);

#endif  // CHAINRELAY_BASE_UINT256_HPP
